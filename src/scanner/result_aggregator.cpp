#include "scanner/result_aggregator.h"
#include "core/logger.h"
#include "utils/time_utils.h"
#include <algorithm>

double ResultAggregator::coveragePercent(int tablesScanned,
                                         int tablesDiscovered) {
  if (tablesDiscovered <= 0)
    return 0.0;
  return static_cast<double>(tablesScanned) / tablesDiscovered * 100.0;
}

// Findings are ordered by severity (most severe first), then by table and
// column, so that two runs over the same data print the same result
// regardless of which worker finished first.
ScanResult ResultAggregator::completed(const std::string &scanId,
                                       const ConnectionParameters &params,
                                       ScanMode mode,
                                       const SchemaAnalysis &analysis,
                                       const ScanStrategy &strategy,
                                       TableScanBatch batch,
                                       std::vector<IntrospectionIssue> issues) {
  ScanResult result;
  result.scanId = scanId;
  result.timestamp = TimeUtils::getIsoTimestamp();
  result.databaseType = engineKindToString(params.engine);
  result.scanMode = mode;
  result.status = "completed";
  result.strategy = strategy;
  result.tablesDiscovered = analysis.totalTables;
  result.tablesScanned = batch.stats.tablesScanned;
  result.tablesSkipped = batch.stats.tablesSkipped;
  result.rowsAnalyzed = batch.stats.rowsAnalyzed;
  result.elapsedSeconds = batch.stats.elapsedSeconds;
  result.coveragePercent =
      coveragePercent(result.tablesScanned, result.tablesDiscovered);
  result.riskLevel = analysis.riskLevel;
  result.introspectionIssues = std::move(issues);
  result.scannedTables = std::move(batch.stats.scannedTables);
  std::sort(result.scannedTables.begin(), result.scannedTables.end());

  result.findings = std::move(batch.findings);
  std::sort(result.findings.begin(), result.findings.end(),
            [](const Finding &a, const Finding &b) {
              if (a.severity != b.severity)
                return a.severity > b.severity;
              if (a.table != b.table)
                return a.table < b.table;
              if (a.column != b.column)
                return a.column < b.column;
              return a.detectorType < b.detectorType;
            });

  Logger::info(LogCategory::SCAN, "ResultAggregator",
               "Scan " + scanId + ": " + std::to_string(result.tablesScanned) +
                   "/" + std::to_string(result.tablesDiscovered) +
                   " tables, " + std::to_string(result.findings.size()) +
                   " findings, coverage " +
                   std::to_string(result.coveragePercent) + "%");
  return result;
}

ScanResult ResultAggregator::failed(const std::string &scanId,
                                    const ConnectionParameters &params,
                                    ScanMode mode, const std::string &error,
                                    std::vector<IntrospectionIssue> issues,
                                    double elapsedSeconds) {
  ScanResult result;
  result.scanId = scanId;
  result.timestamp = TimeUtils::getIsoTimestamp();
  result.databaseType = engineKindToString(params.engine);
  result.scanMode = mode;
  result.status = "failed";
  result.error = error;
  result.elapsedSeconds = elapsedSeconds;
  result.introspectionIssues = std::move(issues);

  Logger::error(LogCategory::SCAN, "ResultAggregator",
                "Scan " + scanId + " failed: " + error);
  return result;
}
