#ifndef SCANNER_CONFIG_H
#define SCANNER_CONFIG_H

#include "engines/connection_params.h"
#include "scanner/scan_types.h"
#include <optional>
#include <string>
#include <vector>

// Settings for one intelliscan run: logging, scan limits and the connection
// to scan. Scan limits are applied to ScanConfig while loading.
class ScannerConfig {
public:
  // Reads a JSON file with optional "logging", "scan" and "connection"
  // objects. Falls back to loadFromEnv() when the file cannot be opened or
  // parsed.
  static ScannerConfig loadFromFile(const std::string &configPath);
  static ScannerConfig loadFromEnv();

  const std::optional<ConnectionParameters> &connection() const {
    return connection_;
  }
  const std::string &logLevel() const { return logLevel_; }
  const std::string &logFile() const { return logFile_; }
  ScanMode scanMode() const { return scanMode_; }
  std::optional<int> maxTables() const { return maxTables_; }

  // Problems that leave the configuration unusable (no valid connection).
  // Recoverable problems are only logged.
  const std::vector<std::string> &errors() const { return errors_; }
  bool isValid() const { return errors_.empty() && connection_.has_value(); }

  void setScanMode(ScanMode mode) { scanMode_ = mode; }
  void setMaxTables(std::optional<int> maxTables) { maxTables_ = maxTables; }

private:
  std::optional<ConnectionParameters> connection_;
  std::string logLevel_ = "INFO";
  std::string logFile_;
  ScanMode scanMode_ = ScanMode::SMART;
  std::optional<int> maxTables_;
  std::vector<std::string> errors_;

  void applyLogging(const json &logging);
  void applyScan(const json &scan);
  void applyConnection(const json &connection);
  void finishConnection(ConnectionParameters params);
};

#endif
