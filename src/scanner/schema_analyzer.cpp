#include "scanner/schema_analyzer.h"
#include "core/logger.h"
#include <algorithm>

RiskLevel SchemaAnalyzer::riskLevelFor(double riskScore) {
  if (riskScore > HIGH_RISK_SCORE)
    return RiskLevel::HIGH;
  if (riskScore > MEDIUM_RISK_SCORE)
    return RiskLevel::MEDIUM;
  return RiskLevel::LOW;
}

// riskScore = 3 per high-priority table + 1.5 per medium one. Low-priority
// tables do not contribute.
SchemaAnalysis SchemaAnalyzer::analyze(std::vector<TableDescriptor> tables) {
  SchemaAnalysis analysis;
  analysis.totalTables = static_cast<int>(tables.size());

  for (const auto &table : tables) {
    analysis.estimatedRows += std::max<int64_t>(table.estimatedRows, 0);
    if (table.priorityScore >= HIGH_PRIORITY_THRESHOLD)
      analysis.distribution.high++;
    else if (table.priorityScore >= MEDIUM_PRIORITY_THRESHOLD)
      analysis.distribution.medium++;
    else
      analysis.distribution.low++;
  }

  analysis.riskScore =
      analysis.distribution.high * 3.0 + analysis.distribution.medium * 1.5;
  analysis.riskLevel = riskLevelFor(analysis.riskScore);
  analysis.tables = std::move(tables);

  Logger::info(LogCategory::SCHEMA, "SchemaAnalyzer",
               std::to_string(analysis.totalTables) + " tables, ~" +
                   std::to_string(analysis.estimatedRows) + " rows, " +
                   std::to_string(analysis.distribution.high) + " high / " +
                   std::to_string(analysis.distribution.medium) + " medium / " +
                   std::to_string(analysis.distribution.low) +
                   " low priority, risk " +
                   riskLevelToString(analysis.riskLevel));
  return analysis;
}
