#include "scanner/strategy_selector.h"
#include "core/logger.h"
#include "core/scan_config.h"
#include <algorithm>

namespace {
ScanStrategy makeStrategy(StrategyKind kind, int targetTables, int sampleSize,
                          int workers) {
  ScanStrategy strategy;
  strategy.kind = kind;
  strategy.targetTables = std::max(targetTables, 0);
  strategy.sampleSize = sampleSize;
  strategy.workers = workers;
  strategy.maxScanTimeSeconds =
      static_cast<int>(ScanConfig::getMaxScanTime());
  strategy.tableTimeoutSeconds =
      static_cast<int>(ScanConfig::getTableTimeout());
  return strategy;
}
} // namespace

ScanStrategy StrategySelector::select(const SchemaAnalysis &analysis,
                                      ScanMode mode,
                                      std::optional<int> maxTables) {
  const int total = analysis.totalTables;
  const int64_t rows = analysis.estimatedRows;
  if (maxTables && *maxTables <= 0)
    maxTables.reset();

  auto capped = [&](int fallback) {
    return std::min(maxTables.value_or(fallback), total);
  };

  ScanStrategy strategy;
  std::string rule;
  if (mode == ScanMode::FAST || total <= SMALL_SCHEMA_TABLES) {
    strategy = makeStrategy(StrategyKind::COMPREHENSIVE,
                            std::min(total, FAST_TABLE_CAP), 100, 2);
    rule = mode == ScanMode::FAST ? "fast mode requested"
                                  : "small schema";
  } else if (mode == ScanMode::DEEP || analysis.riskLevel == RiskLevel::HIGH) {
    strategy = makeStrategy(StrategyKind::PRIORITY_DEEP,
                            capped(DEEP_DEFAULT_TABLES), 500, 3);
    rule = mode == ScanMode::DEEP ? "deep mode requested"
                                  : "high schema risk";
  } else if (rows > LARGE_VOLUME_ROWS || total > LARGE_SCHEMA_TABLES) {
    strategy = makeStrategy(StrategyKind::SAMPLING,
                            capped(SAMPLING_DEFAULT_TABLES), 200, 3);
    rule = "large data volume";
  } else if (total > MEDIUM_SCHEMA_TABLES) {
    strategy = makeStrategy(StrategyKind::PRIORITY,
                            capped(PRIORITY_DEFAULT_TABLES), 300, 3);
    rule = "medium-sized schema";
  } else {
    strategy = makeStrategy(StrategyKind::COMPREHENSIVE, total, 500, 2);
    rule = "smart default";
  }

  strategy.reasoning = "Selected " + strategyKindToString(strategy.kind) +
                       " (" + rule + ") for " + std::to_string(total) +
                       " tables with " + std::to_string(rows) +
                       " total rows";

  Logger::info(LogCategory::STRATEGY, "StrategySelector",
               strategy.reasoning + ": " +
                   std::to_string(strategy.targetTables) + " tables, " +
                   std::to_string(strategy.sampleSize) + " rows each, " +
                   std::to_string(strategy.workers) + " workers");
  return strategy;
}
