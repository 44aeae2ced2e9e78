#include "utils/connection_utils.h"
#include "core/logger.h"
#include "utils/string_utils.h"

namespace {
bool parseFlag(const std::string &value) {
  std::string lower = StringUtils::toLower(value);
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on" ||
         lower == "require";
}

bool parseBoundedInt(const std::string &value, int min, int max, int &out) {
  if (!StringUtils::isAllDigits(value) || value.size() > 6)
    return false;
  int parsed = std::stoi(value);
  if (parsed < min || parsed > max)
    return false;
  out = parsed;
  return true;
}
} // namespace

// Parses a semicolon-separated connection string such as
// "engine=postgresql;host=db;port=5432;db=crm;user=scan;password=x;tls=true".
// Keys are case-insensitive and accept the usual aliases (server, database,
// uid, pwd, file). The engine key is mandatory. Relational and document
// engines need a host and a database; SQLite needs only the file. Returns
// std::nullopt when a required key is missing or a numeric value is out of
// range.
std::optional<ConnectionParameters>
ConnectionStringParser::parse(std::string_view connStr) {
  if (connStr.empty()) {
    return std::nullopt;
  }

  ConnectionParameters params;
  TlsSettings tls;
  bool sawEngine = false;
  bool sawTls = false;
  std::string connString{connStr};
  size_t pos = 0;

  while (pos < connString.length()) {
    size_t semicolonPos = connString.find(';', pos);
    std::string token;
    if (semicolonPos == std::string::npos) {
      token = connString.substr(pos);
      pos = connString.length();
    } else {
      token = connString.substr(pos, semicolonPos - pos);
      pos = semicolonPos + 1;
    }

    size_t equalsPos = token.find('=');
    if (token.empty() || equalsPos == std::string::npos)
      continue;

    std::string key = StringUtils::toLower(
        StringUtils::trim(std::string_view(token).substr(0, equalsPos)));
    std::string value =
        StringUtils::trim(std::string_view(token).substr(equalsPos + 1));

    if (key.empty())
      continue;

    if (key == "engine" || key == "type") {
      auto kind = parseEngineKind(value);
      if (!kind) {
        Logger::warning(LogCategory::CONFIG, "ConnectionStringParser",
                        "Unsupported engine: " + value);
        return std::nullopt;
      }
      params.engine = *kind;
      sawEngine = true;
    } else if (key == "host" || key == "server") {
      params.host = value;
    } else if (key == "user" || key == "uid" || key == "username") {
      params.user = value;
    } else if (key == "password" || key == "pwd") {
      params.password = value;
    } else if (key == "db" || key == "database" || key == "file") {
      params.database = value;
    } else if (key == "port") {
      if (!parseBoundedInt(value, 1, 65535, params.port))
        return std::nullopt;
    } else if (key == "connect_timeout") {
      if (!parseBoundedInt(value, 1, 120, params.connectTimeoutSeconds))
        return std::nullopt;
    } else if (key == "query_timeout") {
      if (!parseBoundedInt(value, 1, 600, params.queryTimeoutSeconds))
        return std::nullopt;
    } else if (key == "tls" || key == "ssl") {
      tls.enabled = parseFlag(value);
      sawTls = true;
    } else if (key == "tls_verify") {
      tls.verifyPeer = parseFlag(value);
    } else if (key == "sslca" || key == "tls_ca") {
      tls.caFile = value;
    } else if (key == "sslcert" || key == "tls_cert") {
      tls.certFile = value;
    } else if (key == "sslkey" || key == "tls_key") {
      tls.keyFile = value;
    }
  }

  if (!sawEngine || !hasRequiredFields(params))
    return std::nullopt;

  if (sawTls || !tls.caFile.empty())
    params.tls = tls;

  return params;
}

bool ConnectionStringParser::hasRequiredFields(
    const ConnectionParameters &params) {
  if (params.engine == EngineKind::SQLITE)
    return !params.database.empty();
  if (params.host.empty())
    return false;
  return params.engine == EngineKind::REDIS || !params.database.empty();
}
