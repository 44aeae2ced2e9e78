#ifndef TABLE_SELECTOR_H
#define TABLE_SELECTOR_H

#include "scanner/scan_types.h"

class TableSelector {
public:
  // Highest priorityScore first; ties keep discovery order. The result has
  // at most strategy.targetTables entries.
  static std::vector<TableDescriptor>
  select(std::vector<TableDescriptor> tables, const ScanStrategy &strategy);
};

#endif
