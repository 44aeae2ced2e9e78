#include "core/logger.h"
#include "scanner/schema_analyzer.h"
#include "test_runner.h"

namespace {
std::vector<TableDescriptor> tablesWithScores(std::initializer_list<double> scores) {
  std::vector<TableDescriptor> tables;
  int i = 0;
  for (double score : scores) {
    TableDescriptor table;
    table.name = "t" + std::to_string(i++);
    table.estimatedRows = 100;
    table.priorityScore = score;
    tables.push_back(table);
  }
  return tables;
}
} // namespace

int main() {
  Logger::setLogLevel(LogLevel::ERROR);
  TestRunner runner;

  runner.runTest("Distribution uses the 2.5 and 1.5 thresholds", [&]() {
    auto analysis = SchemaAnalyzer::analyze(
        tablesWithScores({3.0, 2.5, 2.49, 1.5, 1.49, 1.0}));
    runner.assertEquals(2, analysis.distribution.high, "high count");
    runner.assertEquals(2, analysis.distribution.medium, "medium count");
    runner.assertEquals(2, analysis.distribution.low, "low count");
    runner.assertEquals(6, analysis.totalTables, "total tables");
    runner.assertEquals(600, analysis.estimatedRows, "estimated rows");
  });

  runner.runTest("Risk score weighs high 3 and medium 1.5", [&]() {
    auto analysis =
        SchemaAnalyzer::analyze(tablesWithScores({3.0, 2.6, 2.0, 1.6}));
    runner.assertNear(9.0, analysis.riskScore, "2*3 + 2*1.5");
    runner.assertEquals(riskLevelToString(RiskLevel::MEDIUM),
                        riskLevelToString(analysis.riskLevel),
                        "9 is medium risk");
  });

  runner.runTest("Four high-priority tables are high risk", [&]() {
    auto analysis =
        SchemaAnalyzer::analyze(tablesWithScores({3.0, 3.0, 3.0, 3.0}));
    runner.assertNear(12.0, analysis.riskScore, "4*3");
    runner.assertEquals(riskLevelToString(RiskLevel::HIGH),
                        riskLevelToString(analysis.riskLevel), "12 is high");
  });

  runner.runTest("Risk level boundaries are exclusive", [&]() {
    runner.assertTrue(SchemaAnalyzer::riskLevelFor(10.0) == RiskLevel::MEDIUM,
                      "10 is not high");
    runner.assertTrue(SchemaAnalyzer::riskLevelFor(10.5) == RiskLevel::HIGH,
                      "10.5 is high");
    runner.assertTrue(SchemaAnalyzer::riskLevelFor(5.0) == RiskLevel::LOW,
                      "5 is not medium");
    runner.assertTrue(SchemaAnalyzer::riskLevelFor(6.0) == RiskLevel::MEDIUM,
                      "6 is medium");
  });

  runner.runTest("Empty schema is low risk", [&]() {
    auto analysis = SchemaAnalyzer::analyze({});
    runner.assertEquals(0, analysis.totalTables, "no tables");
    runner.assertNear(0.0, analysis.riskScore, "zero score");
    runner.assertTrue(analysis.riskLevel == RiskLevel::LOW, "low risk");
  });

  runner.printSummary();
  return 0;
}
