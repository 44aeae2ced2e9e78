#include "scanner/activity_tracker.h"
#include "core/logger.h"

void LoggingActivityTracker::scanStarted(const std::string &scanId,
                                         const ConnectionParameters &params,
                                         ScanMode mode) {
  Logger::info(LogCategory::SCAN, "scanStarted",
               "Scan " + scanId + " started (" + scanModeToString(mode) +
                   ") on " + params.toSafeString());
}

void LoggingActivityTracker::scanCompleted(const ScanResult &result) {
  Logger::info(LogCategory::SCAN, "scanCompleted",
               "Scan " + result.scanId + " " + result.status + ": " +
                   std::to_string(result.tablesScanned) + " tables scanned, " +
                   std::to_string(result.tablesSkipped) + " skipped, " +
                   std::to_string(result.findings.size()) + " findings, " +
                   std::to_string(result.elapsedSeconds) + "s");
}

void LoggingActivityTracker::scanFailed(const std::string &scanId,
                                        const std::string &error) {
  Logger::error(LogCategory::SCAN, "scanFailed",
                "Scan " + scanId + " failed: " + error);
}
