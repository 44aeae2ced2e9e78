#ifndef SCHEMA_ANALYZER_H
#define SCHEMA_ANALYZER_H

#include "scanner/scan_types.h"

class SchemaAnalyzer {
public:
  static constexpr double HIGH_PRIORITY_THRESHOLD = 2.5;
  static constexpr double MEDIUM_PRIORITY_THRESHOLD = 1.5;
  static constexpr double HIGH_RISK_SCORE = 10.0;
  static constexpr double MEDIUM_RISK_SCORE = 5.0;

  // Tables must already carry their priorityScore.
  static SchemaAnalysis analyze(std::vector<TableDescriptor> tables);

  static RiskLevel riskLevelFor(double riskScore);
};

#endif
