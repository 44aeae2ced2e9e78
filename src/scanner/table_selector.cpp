#include "scanner/table_selector.h"
#include <algorithm>

std::vector<TableDescriptor>
TableSelector::select(std::vector<TableDescriptor> tables,
                      const ScanStrategy &strategy) {
  std::stable_sort(tables.begin(), tables.end(),
                   [](const TableDescriptor &a, const TableDescriptor &b) {
                     return a.priorityScore > b.priorityScore;
                   });

  size_t target = static_cast<size_t>(std::max(strategy.targetTables, 0));
  if (tables.size() > target)
    tables.resize(target);
  return tables;
}
