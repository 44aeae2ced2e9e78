#ifndef SCAN_TYPES_H
#define SCAN_TYPES_H

#include "engines/database_engine.h"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

enum class RiskLevel { LOW, MEDIUM, HIGH };

enum class ScanMode { FAST, SMART, DEEP };

enum class StrategyKind { COMPREHENSIVE, PRIORITY, PRIORITY_DEEP, SAMPLING };

enum class Severity { LOW, MEDIUM, HIGH, CRITICAL };

std::string riskLevelToString(RiskLevel level);
std::string scanModeToString(ScanMode mode);
std::optional<ScanMode> parseScanMode(const std::string &name);
std::string strategyKindToString(StrategyKind kind);
std::string severityToString(Severity severity);

struct PriorityDistribution {
  int high = 0;
  int medium = 0;
  int low = 0;
};

struct SchemaAnalysis {
  std::vector<TableDescriptor> tables;
  int totalTables = 0;
  int64_t estimatedRows = 0;
  PriorityDistribution distribution;
  double riskScore = 0.0;
  RiskLevel riskLevel = RiskLevel::LOW;
};

struct ScanStrategy {
  StrategyKind kind = StrategyKind::COMPREHENSIVE;
  int targetTables = 0;
  int sampleSize = 0;
  int workers = 1;
  int maxScanTimeSeconds = 300;
  int tableTimeoutSeconds = 60;
  std::string reasoning;
};

struct Finding {
  std::string detectorType;
  std::string table;
  std::string column;
  std::string maskedValue;
  double confidence = 0.0;
  Severity severity = Severity::LOW;
  std::string regulatoryReference;
  int occurrences = 1;
};

struct ScanResult {
  std::string scanId;
  std::string timestamp;
  std::string databaseType;
  ScanMode scanMode = ScanMode::SMART;
  std::string status = "completed";
  std::string error;
  std::optional<ScanStrategy> strategy;
  std::vector<Finding> findings;
  int tablesDiscovered = 0;
  int tablesScanned = 0;
  int tablesSkipped = 0;
  int64_t rowsAnalyzed = 0;
  double elapsedSeconds = 0.0;
  double coveragePercent = 0.0;
  RiskLevel riskLevel = RiskLevel::LOW;
  std::vector<IntrospectionIssue> introspectionIssues;
  std::vector<std::string> scannedTables;
};

// Called with (completed, total, message). completed never decreases within
// one scan.
using ProgressCallback =
    std::function<void(int completed, int total, const std::string &message)>;

void to_json(json &j, const ScanStrategy &strategy);
void to_json(json &j, const Finding &finding);
void to_json(json &j, const ScanResult &result);

// Serializes a result for output. Names and driver messages come straight
// from the database, so invalid UTF-8 is replaced with U+FFFD rather than
// failing the dump.
std::string toJsonText(const ScanResult &result, int indent = 2);

#endif
