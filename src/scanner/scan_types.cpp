#include "scanner/scan_types.h"
#include "utils/string_utils.h"

std::string riskLevelToString(RiskLevel level) {
  switch (level) {
  case RiskLevel::LOW:
    return "low";
  case RiskLevel::MEDIUM:
    return "medium";
  case RiskLevel::HIGH:
    return "high";
  }
  return "unknown";
}

std::string scanModeToString(ScanMode mode) {
  switch (mode) {
  case ScanMode::FAST:
    return "fast";
  case ScanMode::SMART:
    return "smart";
  case ScanMode::DEEP:
    return "deep";
  }
  return "unknown";
}

std::optional<ScanMode> parseScanMode(const std::string &name) {
  std::string lower = StringUtils::toLower(StringUtils::trim(name));
  if (lower == "fast")
    return ScanMode::FAST;
  if (lower == "smart")
    return ScanMode::SMART;
  if (lower == "deep")
    return ScanMode::DEEP;
  return std::nullopt;
}

std::string strategyKindToString(StrategyKind kind) {
  switch (kind) {
  case StrategyKind::COMPREHENSIVE:
    return "comprehensive";
  case StrategyKind::PRIORITY:
    return "priority";
  case StrategyKind::PRIORITY_DEEP:
    return "priority_deep";
  case StrategyKind::SAMPLING:
    return "sampling";
  }
  return "unknown";
}

std::string severityToString(Severity severity) {
  switch (severity) {
  case Severity::LOW:
    return "Low";
  case Severity::MEDIUM:
    return "Medium";
  case Severity::HIGH:
    return "High";
  case Severity::CRITICAL:
    return "Critical";
  }
  return "Unknown";
}

void to_json(json &j, const ScanStrategy &strategy) {
  j = json{{"type", strategyKindToString(strategy.kind)},
           {"targetTables", strategy.targetTables},
           {"sampleSize", strategy.sampleSize},
           {"parallelWorkers", strategy.workers},
           {"maxScanTime", strategy.maxScanTimeSeconds},
           {"tableTimeout", strategy.tableTimeoutSeconds},
           {"reasoning", strategy.reasoning}};
}

void to_json(json &j, const Finding &finding) {
  j = json{{"type", finding.detectorType},
           {"table", finding.table},
           {"column", finding.column},
           {"value", finding.maskedValue},
           {"confidence", finding.confidence},
           {"severity", severityToString(finding.severity)},
           {"occurrences", finding.occurrences}};
  if (!finding.regulatoryReference.empty())
    j["regulatoryReference"] = finding.regulatoryReference;
}

void to_json(json &j, const ScanResult &result) {
  j = json{{"scanId", result.scanId},
           {"timestamp", result.timestamp},
           {"databaseType", result.databaseType},
           {"scanMode", scanModeToString(result.scanMode)},
           {"status", result.status},
           {"findings", result.findings},
           {"tablesDiscovered", result.tablesDiscovered},
           {"tablesScanned", result.tablesScanned},
           {"tablesSkipped", result.tablesSkipped},
           {"rowsAnalyzed", result.rowsAnalyzed},
           {"elapsedSeconds", result.elapsedSeconds},
           {"coveragePercent", result.coveragePercent},
           {"riskLevel", riskLevelToString(result.riskLevel)},
           {"tablesScannedList", result.scannedTables}};

  if (!result.error.empty())
    j["error"] = result.error;
  if (result.strategy)
    j["strategy"] = *result.strategy;

  json issues = json::array();
  for (const auto &issue : result.introspectionIssues) {
    issues.push_back({{"table", issue.table}, {"message", issue.message}});
  }
  j["introspectionIssues"] = issues;
}

std::string toJsonText(const ScanResult &result, int indent) {
  return json(result).dump(indent, ' ', false, json::error_handler_t::replace);
}
