#include "core/scanner_config.h"
#include "core/logger.h"
#include "core/scan_config.h"
#include "utils/connection_utils.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace {

// Accepts the port as a JSON number or a digit string.
std::optional<int> parsePort(const json &value) {
  if (value.is_number_integer()) {
    int64_t port = value.get<int64_t>();
    if (port > 0 && port <= 65535)
      return static_cast<int>(port);
    return std::nullopt;
  }
  if (value.is_string()) {
    std::string portStr = value.get<std::string>();
    if (portStr.empty() || portStr.length() > 5 ||
        !StringUtils::isAllDigits(portStr))
      return std::nullopt;
    int port = std::stoi(portStr);
    if (port > 0 && port <= 65535)
      return port;
  }
  return std::nullopt;
}

bool parseFlag(const std::string &value) {
  std::string lower = StringUtils::toLower(StringUtils::trim(value));
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

const char *getEnv(const char *name) {
  const char *value = std::getenv(name);
  return (value && std::strlen(value) > 0) ? value : nullptr;
}

// Calls setter with the non-negative integer under key. Out-of-range values
// are logged and the current ScanConfig value is kept.
void applyLimit(const json &scan, const char *key,
                void (*setter)(size_t)) {
  if (!scan.contains(key))
    return;
  const json &value = scan[key];
  if (!value.is_number_integer() || value.get<int64_t>() < 0) {
    Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                    std::string("scan.") + key +
                        " must be a non-negative integer, ignoring");
    return;
  }
  try {
    setter(value.get<size_t>());
  } catch (const std::invalid_argument &e) {
    Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                    std::string(e.what()) + ", keeping current value");
  }
}

} // namespace

// Loads the run configuration from a JSON file shaped like
// config.example.json. Every section is optional. An unreadable or
// malformed file is not fatal: the configuration is then taken from the
// INTELLISCAN_* environment variables instead. A file without a usable
// "connection" block also falls back to the environment for the connection
// only.
ScannerConfig ScannerConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                    "Could not open config file '" + configPath +
                        "', using environment variables");
    return loadFromEnv();
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::parse_error &e) {
    Logger::error(LogCategory::CONFIG, "ScannerConfig",
                  "Error parsing config file '" + configPath +
                      "': " + std::string(e.what()) +
                      ", falling back to environment variables");
    return loadFromEnv();
  }

  ScannerConfig result;
  try {
    if (config.contains("logging") && config["logging"].is_object())
      result.applyLogging(config["logging"]);
    if (config.contains("scan") && config["scan"].is_object())
      result.applyScan(config["scan"]);
    if (config.contains("connection") && config["connection"].is_object()) {
      result.applyConnection(config["connection"]);
    } else {
      Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                      "No connection block in '" + configPath +
                          "', using environment variables");
      ScannerConfig fromEnv = loadFromEnv();
      result.connection_ = fromEnv.connection_;
      result.errors_ = fromEnv.errors_;
    }
  } catch (const json::type_error &e) {
    result.errors_.push_back("Invalid value in '" + configPath +
                             "': " + std::string(e.what()));
  }

  for (const auto &error : result.errors_) {
    Logger::error(LogCategory::CONFIG, "ScannerConfig", error);
  }
  return result;
}

// Reads INTELLISCAN_ENGINE, INTELLISCAN_HOST, INTELLISCAN_PORT,
// INTELLISCAN_DATABASE, INTELLISCAN_USER, INTELLISCAN_PASSWORD,
// INTELLISCAN_TLS and INTELLISCAN_LOG_LEVEL. The engine is required; the
// port defaults per engine.
ScannerConfig ScannerConfig::loadFromEnv() {
  ScannerConfig result;

  if (const char *level = getEnv("INTELLISCAN_LOG_LEVEL"))
    result.logLevel_ = level;

  const char *engine = getEnv("INTELLISCAN_ENGINE");
  if (!engine) {
    result.errors_.push_back("INTELLISCAN_ENGINE is not set");
    return result;
  }
  auto kind = parseEngineKind(engine);
  if (!kind) {
    result.errors_.push_back("Unsupported engine: " + std::string(engine));
    return result;
  }

  ConnectionParameters params;
  params.engine = *kind;
  if (const char *host = getEnv("INTELLISCAN_HOST"))
    params.host = host;
  if (const char *port = getEnv("INTELLISCAN_PORT")) {
    auto parsed = parsePort(json(std::string(port)));
    if (parsed) {
      params.port = *parsed;
    } else {
      Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                      "Invalid port number: " + std::string(port) +
                          ", using default: " +
                          std::to_string(defaultPortFor(params.engine)));
    }
  }
  if (const char *database = getEnv("INTELLISCAN_DATABASE"))
    params.database = database;
  if (const char *user = getEnv("INTELLISCAN_USER"))
    params.user = user;
  if (const char *password = std::getenv("INTELLISCAN_PASSWORD"))
    params.password = password;
  if (const char *tls = getEnv("INTELLISCAN_TLS")) {
    TlsSettings settings;
    settings.enabled = parseFlag(tls);
    params.tls = settings;
  }
  params.connectTimeoutSeconds =
      static_cast<int>(ScanConfig::getConnectTimeout());
  params.queryTimeoutSeconds = static_cast<int>(ScanConfig::getQueryTimeout());

  result.finishConnection(std::move(params));
  return result;
}

void ScannerConfig::applyLogging(const json &logging) {
  if (logging.contains("level"))
    logLevel_ = logging["level"].get<std::string>();
  if (logging.contains("file"))
    logFile_ = logging["file"].get<std::string>();
}

void ScannerConfig::applyScan(const json &scan) {
  applyLimit(scan, "maxScanTimeSeconds", &ScanConfig::setMaxScanTime);
  applyLimit(scan, "tableTimeoutSeconds", &ScanConfig::setTableTimeout);
  applyLimit(scan, "connectTimeoutSeconds", &ScanConfig::setConnectTimeout);
  applyLimit(scan, "queryTimeoutSeconds", &ScanConfig::setQueryTimeout);
  applyLimit(scan, "redisKeyScanLimit", &ScanConfig::setRedisKeyScanLimit);
  applyLimit(scan, "schemaSampleDocuments",
             &ScanConfig::setSchemaSampleDocuments);

  if (scan.contains("mode")) {
    std::string name = scan["mode"].get<std::string>();
    auto mode = parseScanMode(name);
    if (mode) {
      scanMode_ = *mode;
    } else {
      Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                      "Unknown scan mode '" + name + "', using " +
                          scanModeToString(scanMode_));
    }
  }
  if (scan.contains("maxTables") && !scan["maxTables"].is_null()) {
    int maxTables = scan["maxTables"].get<int>();
    if (maxTables > 0)
      maxTables_ = maxTables;
  }
}

// Either "connectionString" (parsed by ConnectionStringParser) or the
// individual keys engine, host, port, database, user, password,
// connectTimeoutSeconds, queryTimeoutSeconds and a "tls" object.
void ScannerConfig::applyConnection(const json &connection) {
  if (connection.contains("connectionString")) {
    auto parsed = ConnectionStringParser::parse(
        connection["connectionString"].get<std::string>());
    if (!parsed) {
      errors_.push_back("connection.connectionString is missing a required "
                        "key or has an invalid value");
      return;
    }
    finishConnection(std::move(*parsed));
    return;
  }

  if (!connection.contains("engine")) {
    errors_.push_back("connection.engine is required");
    return;
  }
  std::string engineName = connection["engine"].get<std::string>();
  auto kind = parseEngineKind(engineName);
  if (!kind) {
    errors_.push_back("Unsupported engine: " + engineName);
    return;
  }

  ConnectionParameters params;
  params.engine = *kind;
  params.host = connection.value("host", "");
  params.database = connection.value("database", "");
  params.user = connection.value("user", "");
  params.password = connection.value("password", "");

  if (connection.contains("port")) {
    auto port = parsePort(connection["port"]);
    if (port) {
      params.port = *port;
    } else {
      Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                      "Invalid port number: " + connection["port"].dump() +
                          ", using default: " +
                          std::to_string(defaultPortFor(params.engine)));
    }
  }

  params.connectTimeoutSeconds =
      static_cast<int>(ScanConfig::getConnectTimeout());
  params.queryTimeoutSeconds = static_cast<int>(ScanConfig::getQueryTimeout());
  if (connection.contains("connectTimeoutSeconds")) {
    int value = connection["connectTimeoutSeconds"].get<int>();
    if (value >= static_cast<int>(ScanConfig::MIN_CONNECT_TIMEOUT) &&
        value <= static_cast<int>(ScanConfig::MAX_CONNECT_TIMEOUT))
      params.connectTimeoutSeconds = value;
    else
      Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                      "connection.connectTimeoutSeconds out of range, using " +
                          std::to_string(params.connectTimeoutSeconds));
  }
  if (connection.contains("queryTimeoutSeconds")) {
    int value = connection["queryTimeoutSeconds"].get<int>();
    if (value >= static_cast<int>(ScanConfig::MIN_QUERY_TIMEOUT) &&
        value <= static_cast<int>(ScanConfig::MAX_QUERY_TIMEOUT))
      params.queryTimeoutSeconds = value;
    else
      Logger::warning(LogCategory::CONFIG, "ScannerConfig",
                      "connection.queryTimeoutSeconds out of range, using " +
                          std::to_string(params.queryTimeoutSeconds));
  }

  if (connection.contains("tls") && connection["tls"].is_object()) {
    const json &tlsConfig = connection["tls"];
    TlsSettings tls;
    tls.enabled = tlsConfig.value("enabled", false);
    tls.verifyPeer = tlsConfig.value("verifyPeer", true);
    tls.caFile = tlsConfig.value("caFile", "");
    tls.certFile = tlsConfig.value("certFile", "");
    tls.keyFile = tlsConfig.value("keyFile", "");
    params.tls = tls;
  }

  finishConnection(std::move(params));
}

void ScannerConfig::finishConnection(ConnectionParameters params) {
  if (!ConnectionStringParser::hasRequiredFields(params)) {
    errors_.push_back(
        params.engine == EngineKind::SQLITE
            ? "SQLite connection needs a database file"
            : engineKindToString(params.engine) +
                  " connection needs a host" +
                  (params.engine == EngineKind::REDIS ? ""
                                                      : " and a database"));
    return;
  }
  if (params.port == 0)
    params.port = defaultPortFor(params.engine);

  Logger::info(LogCategory::CONFIG, "ScannerConfig",
               "Connection: " + params.toSafeString());
  connection_ = std::move(params);
}
