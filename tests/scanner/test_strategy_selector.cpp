#include "core/logger.h"
#include "core/scan_config.h"
#include "scanner/strategy_selector.h"
#include "test_runner.h"

namespace {
SchemaAnalysis analysisOf(int tables, int64_t rows, RiskLevel risk) {
  SchemaAnalysis analysis;
  analysis.totalTables = tables;
  analysis.estimatedRows = rows;
  analysis.riskLevel = risk;
  return analysis;
}

std::string kindOf(const ScanStrategy &strategy) {
  return strategyKindToString(strategy.kind);
}
} // namespace

int main() {
  Logger::setLogLevel(LogLevel::ERROR);
  ScanConfig::resetToDefaults();
  TestRunner runner;

  runner.runTest("Small low-risk schema in smart mode is comprehensive", [&]() {
    auto s = StrategySelector::select(analysisOf(9, 5000, RiskLevel::LOW),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals("comprehensive", kindOf(s), "kind");
    runner.assertEquals(9, s.targetTables, "target tables");
    runner.assertEquals(100, s.sampleSize, "sample size");
    runner.assertEquals(2, s.workers, "workers");
  });

  runner.runTest("Fast mode caps at 15 tables", [&]() {
    auto s = StrategySelector::select(analysisOf(40, 1000000, RiskLevel::HIGH),
                                      ScanMode::FAST, std::nullopt);
    runner.assertEquals("comprehensive", kindOf(s), "kind");
    runner.assertEquals(15, s.targetTables, "target tables");
    runner.assertEquals(100, s.sampleSize, "sample size");
  });

  runner.runTest("Small high-risk schema still takes the first rule", [&]() {
    auto s = StrategySelector::select(analysisOf(8, 100, RiskLevel::HIGH),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals("comprehensive", kindOf(s), "rule 1 wins");
    runner.assertEquals(8, s.targetTables, "target tables");
  });

  runner.runTest("Deep mode selects priority_deep", [&]() {
    auto s = StrategySelector::select(analysisOf(20, 100, RiskLevel::LOW),
                                      ScanMode::DEEP, std::nullopt);
    runner.assertEquals("priority_deep", kindOf(s), "kind");
    runner.assertEquals(20, s.targetTables, "min(75, 20)");
    runner.assertEquals(500, s.sampleSize, "sample size");
    runner.assertEquals(3, s.workers, "workers");
  });

  runner.runTest("High risk selects priority_deep and honours maxTables", [&]() {
    auto s = StrategySelector::select(analysisOf(200, 100, RiskLevel::HIGH),
                                      ScanMode::SMART, 5);
    runner.assertEquals("priority_deep", kindOf(s), "kind");
    runner.assertEquals(5, s.targetTables, "maxTables applied");

    auto d = StrategySelector::select(analysisOf(200, 100, RiskLevel::HIGH),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals(75, d.targetTables, "default 75");
  });

  runner.runTest("Large row volume selects sampling", [&]() {
    auto s = StrategySelector::select(analysisOf(30, 200000, RiskLevel::LOW),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals("sampling", kindOf(s), "kind");
    runner.assertEquals(30, s.targetTables, "min(40, 30)");
    runner.assertEquals(200, s.sampleSize, "sample size");
    runner.assertEquals(3, s.workers, "workers");
  });

  runner.runTest("Many tables select sampling with a default of 40", [&]() {
    auto s = StrategySelector::select(analysisOf(150, 1000, RiskLevel::MEDIUM),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals("sampling", kindOf(s), "kind");
    runner.assertEquals(40, s.targetTables, "default 40");

    auto m = StrategySelector::select(analysisOf(150, 1000, RiskLevel::MEDIUM),
                                      ScanMode::SMART, 60);
    runner.assertEquals(60, m.targetTables, "maxTables overrides default");
  });

  runner.runTest("Medium schema selects priority", [&]() {
    auto s = StrategySelector::select(analysisOf(60, 1000, RiskLevel::LOW),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals("priority", kindOf(s), "kind");
    runner.assertEquals(50, s.targetTables, "default 50");
    runner.assertEquals(300, s.sampleSize, "sample size");
    runner.assertEquals(3, s.workers, "workers");
  });

  runner.runTest("Non-positive maxTables counts as absent", [&]() {
    auto zero = StrategySelector::select(analysisOf(60, 1000, RiskLevel::LOW),
                                         ScanMode::SMART, 0);
    runner.assertEquals(50, zero.targetTables, "0 ignored");
    auto negative = StrategySelector::select(
        analysisOf(60, 1000, RiskLevel::LOW), ScanMode::SMART, -3);
    runner.assertEquals(50, negative.targetTables, "-3 ignored");
  });

  runner.runTest("Default rule scans every table", [&]() {
    auto s = StrategySelector::select(analysisOf(30, 5000, RiskLevel::MEDIUM),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals("comprehensive", kindOf(s), "kind");
    runner.assertEquals(30, s.targetTables, "all tables");
    runner.assertEquals(500, s.sampleSize, "sample size");
    runner.assertEquals(2, s.workers, "workers");
  });

  runner.runTest("Target never exceeds discovered tables", [&]() {
    auto s = StrategySelector::select(analysisOf(12, 1000, RiskLevel::HIGH),
                                      ScanMode::SMART, 500);
    runner.assertTrue(s.targetTables <= 12, "target capped at total");
  });

  runner.runTest("Time limits come from ScanConfig", [&]() {
    ScanConfig::setMaxScanTime(120);
    ScanConfig::setTableTimeout(20);
    auto s = StrategySelector::select(analysisOf(9, 100, RiskLevel::LOW),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals(120, s.maxScanTimeSeconds, "max scan time");
    runner.assertEquals(20, s.tableTimeoutSeconds, "table timeout");
    ScanConfig::resetToDefaults();
    auto d = StrategySelector::select(analysisOf(9, 100, RiskLevel::LOW),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals(300, d.maxScanTimeSeconds, "default max scan time");
    runner.assertEquals(60, d.tableTimeoutSeconds, "default table timeout");
  });

  runner.runTest("Selection is deterministic and explained", [&]() {
    auto a = StrategySelector::select(analysisOf(77, 50000, RiskLevel::MEDIUM),
                                      ScanMode::SMART, std::nullopt);
    auto b = StrategySelector::select(analysisOf(77, 50000, RiskLevel::MEDIUM),
                                      ScanMode::SMART, std::nullopt);
    runner.assertEquals(kindOf(a), kindOf(b), "same kind");
    runner.assertEquals(a.targetTables, b.targetTables, "same target");
    runner.assertEquals(a.reasoning, b.reasoning, "same reasoning");
    runner.assertTrue(a.reasoning.find("77 tables") != std::string::npos,
                      "reasoning mentions table count");
    runner.assertTrue(a.reasoning.find("50000 total rows") != std::string::npos,
                      "reasoning mentions row count");
  });

  runner.printSummary();
  return 0;
}
