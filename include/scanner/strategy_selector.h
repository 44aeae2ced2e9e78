#ifndef STRATEGY_SELECTOR_H
#define STRATEGY_SELECTOR_H

#include "scanner/scan_types.h"
#include <optional>

class StrategySelector {
public:
  static constexpr int SMALL_SCHEMA_TABLES = 10;
  static constexpr int FAST_TABLE_CAP = 15;
  static constexpr int DEEP_DEFAULT_TABLES = 75;
  static constexpr int SAMPLING_DEFAULT_TABLES = 40;
  static constexpr int PRIORITY_DEFAULT_TABLES = 50;
  static constexpr int64_t LARGE_VOLUME_ROWS = 100000;
  static constexpr int LARGE_SCHEMA_TABLES = 100;
  static constexpr int MEDIUM_SCHEMA_TABLES = 50;

  // First matching rule wins:
  //   1. fast mode or <= 10 tables      -> comprehensive, 100 rows, 2 workers
  //   2. deep mode or high risk         -> priority-deep, 500 rows, 3 workers
  //   3. > 100k rows or > 100 tables    -> sampling, 200 rows, 3 workers
  //   4. > 50 tables                    -> priority, 300 rows, 3 workers
  //   5. otherwise                      -> comprehensive, 500 rows, 2 workers
  // maxTables <= 0 is treated as absent. Time limits come from ScanConfig.
  static ScanStrategy select(const SchemaAnalysis &analysis, ScanMode mode,
                             std::optional<int> maxTables);
};

#endif
