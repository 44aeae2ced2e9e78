#include "core/logger.h"
#include "core/scan_config.h"
#include "core/scanner_config.h"
#include "test_runner.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {

class TempConfigFile {
  std::string path_;

public:
  TempConfigFile(const std::string &name, const std::string &content)
      : path_((std::filesystem::temp_directory_path() / name).string()) {
    std::ofstream out(path_);
    out << content;
  }
  ~TempConfigFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  const std::string &path() const { return path_; }
};

void clearEnvironment() {
  for (const char *name :
       {"INTELLISCAN_ENGINE", "INTELLISCAN_HOST", "INTELLISCAN_PORT",
        "INTELLISCAN_DATABASE", "INTELLISCAN_USER", "INTELLISCAN_PASSWORD",
        "INTELLISCAN_TLS", "INTELLISCAN_LOG_LEVEL"}) {
    unsetenv(name);
  }
}

} // namespace

int main() {
  Logger::setLogLevel(LogLevel::CRITICAL);
  TestRunner runner;

  runner.runTest("Loads logging, scan and connection sections", [&]() {
    ScanConfig::resetToDefaults();
    TempConfigFile file("intelliscan_config_full.json", R"({
      "logging": {"level": "DEBUG", "file": "/tmp/intelliscan.log"},
      "scan": {"mode": "deep", "maxTables": 12, "maxScanTimeSeconds": 120,
               "tableTimeoutSeconds": 30, "schemaSampleDocuments": 3},
      "connection": {"engine": "mysql", "host": "db.internal", "port": "3307",
                     "database": "crm", "user": "scanner", "password": "s3cret",
                     "tls": {"enabled": true, "verifyPeer": false,
                             "caFile": "/etc/ssl/ca.pem"}}
    })");

    ScannerConfig config = ScannerConfig::loadFromFile(file.path());
    runner.assertTrue(config.isValid(), "valid configuration");
    runner.assertEquals("DEBUG", config.logLevel(), "log level");
    runner.assertEquals("/tmp/intelliscan.log", config.logFile(), "log file");
    runner.assertTrue(config.scanMode() == ScanMode::DEEP, "scan mode");
    runner.assertTrue(config.maxTables() == 12, "max tables");
    runner.assertEquals(120, static_cast<int64_t>(ScanConfig::getMaxScanTime()),
                        "max scan time applied");
    runner.assertEquals(30, static_cast<int64_t>(ScanConfig::getTableTimeout()),
                        "table timeout applied");
    runner.assertEquals(
        3, static_cast<int64_t>(ScanConfig::getSchemaSampleDocuments()),
        "sample documents applied");

    if (!config.connection())
      return;
    const auto &params = *config.connection();
    runner.assertTrue(params.engine == EngineKind::MARIADB, "engine alias");
    runner.assertEquals("db.internal", params.host, "host");
    runner.assertEquals(3307, params.port, "port from string");
    runner.assertEquals("s3cret", params.password, "password");
    runner.assertTrue(params.tlsEnabled(), "tls enabled");
    runner.assertFalse(params.tls->verifyPeer, "verify peer off");
    runner.assertEquals("/etc/ssl/ca.pem", params.tls->caFile, "ca file");
    runner.assertTrue(params.toSafeString().find("s3cret") == std::string::npos,
                      "password masked");
  });

  runner.runTest("Out-of-range scan limits keep the current value", [&]() {
    ScanConfig::resetToDefaults();
    TempConfigFile file("intelliscan_config_range.json", R"({
      "scan": {"maxScanTimeSeconds": 5, "tableTimeoutSeconds": -1},
      "connection": {"engine": "sqlite", "database": "/tmp/x.db"}
    })");
    ScannerConfig config = ScannerConfig::loadFromFile(file.path());
    runner.assertTrue(config.isValid(), "still valid");
    runner.assertEquals(300, static_cast<int64_t>(ScanConfig::getMaxScanTime()),
                        "default kept");
    runner.assertEquals(60, static_cast<int64_t>(ScanConfig::getTableTimeout()),
                        "default kept");
  });

  runner.runTest("Invalid port falls back to the engine default", [&]() {
    TempConfigFile file("intelliscan_config_port.json", R"({
      "connection": {"engine": "postgresql", "host": "pg", "port": 70000,
                     "database": "app"}
    })");
    ScannerConfig config = ScannerConfig::loadFromFile(file.path());
    runner.assertTrue(config.isValid(), "valid");
    if (config.connection())
      runner.assertEquals(5432, config.connection()->port, "default port");
  });

  runner.runTest("Connection string form is accepted", [&]() {
    TempConfigFile file("intelliscan_config_connstr.json", R"({
      "connection": {"connectionString":
        "engine=redis;host=cache;port=6380;db=2;password=x"}
    })");
    ScannerConfig config = ScannerConfig::loadFromFile(file.path());
    runner.assertTrue(config.isValid(), "valid");
    if (config.connection()) {
      runner.assertTrue(config.connection()->engine == EngineKind::REDIS,
                        "redis");
      runner.assertEquals(6380, config.connection()->port, "port");
      runner.assertEquals("2", config.connection()->database, "db index");
    }
  });

  runner.runTest("Missing required fields are reported", [&]() {
    TempConfigFile file("intelliscan_config_missing.json", R"({
      "connection": {"engine": "mssql", "database": "erp"}
    })");
    ScannerConfig config = ScannerConfig::loadFromFile(file.path());
    runner.assertFalse(config.isValid(), "host is required");
    runner.assertFalse(config.errors().empty(), "error recorded");

    TempConfigFile unknown("intelliscan_config_unknown.json", R"({
      "connection": {"engine": "oracle", "host": "ora", "database": "x"}
    })");
    runner.assertFalse(ScannerConfig::loadFromFile(unknown.path()).isValid(),
                       "unsupported engine");
  });

  runner.runTest("Missing file falls back to environment variables", [&]() {
    clearEnvironment();
    setenv("INTELLISCAN_ENGINE", "redis", 1);
    setenv("INTELLISCAN_HOST", "cache.local", 1);
    setenv("INTELLISCAN_PORT", "not-a-port", 1);
    setenv("INTELLISCAN_LOG_LEVEL", "WARN", 1);
    setenv("INTELLISCAN_TLS", "true", 1);

    ScannerConfig config =
        ScannerConfig::loadFromFile("/nonexistent/intelliscan.json");
    runner.assertTrue(config.isValid(), "valid from environment");
    runner.assertEquals("WARN", config.logLevel(), "log level");
    if (config.connection()) {
      runner.assertEquals("cache.local", config.connection()->host, "host");
      runner.assertEquals(6379, config.connection()->port, "default port");
      runner.assertTrue(config.connection()->tlsEnabled(), "tls");
    }
    clearEnvironment();
  });

  runner.runTest("Malformed file falls back to environment variables", [&]() {
    clearEnvironment();
    TempConfigFile file("intelliscan_config_bad.json", "{ not json");
    ScannerConfig config = ScannerConfig::loadFromFile(file.path());
    runner.assertFalse(config.isValid(), "no engine anywhere");
    runner.assertFalse(config.errors().empty(), "error recorded");
  });

  ScanConfig::resetToDefaults();
  runner.printSummary();
  return 0;
}
