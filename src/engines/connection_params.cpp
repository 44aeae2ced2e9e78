#include "engines/connection_params.h"
#include "core/database_defaults.h"
#include "utils/string_utils.h"

std::string engineKindToString(EngineKind kind) {
  switch (kind) {
  case EngineKind::POSTGRESQL:
    return "PostgreSQL";
  case EngineKind::MARIADB:
    return "MariaDB";
  case EngineKind::MONGODB:
    return "MongoDB";
  case EngineKind::REDIS:
    return "Redis";
  case EngineKind::SQLITE:
    return "SQLite";
  case EngineKind::MSSQL:
    return "MSSQL";
  }
  return "Unknown";
}

std::optional<EngineKind> parseEngineKind(const std::string &name) {
  std::string lower = StringUtils::toLower(StringUtils::trim(name));
  if (lower == "postgresql" || lower == "postgres" || lower == "pg")
    return EngineKind::POSTGRESQL;
  if (lower == "mariadb" || lower == "mysql")
    return EngineKind::MARIADB;
  if (lower == "mongodb" || lower == "mongo")
    return EngineKind::MONGODB;
  if (lower == "redis")
    return EngineKind::REDIS;
  if (lower == "sqlite" || lower == "sqlite3")
    return EngineKind::SQLITE;
  if (lower == "mssql" || lower == "sqlserver" || lower == "sql server")
    return EngineKind::MSSQL;
  return std::nullopt;
}

int defaultPortFor(EngineKind kind) {
  switch (kind) {
  case EngineKind::POSTGRESQL:
    return DatabaseDefaults::DEFAULT_POSTGRES_PORT;
  case EngineKind::MARIADB:
    return DatabaseDefaults::DEFAULT_MYSQL_PORT;
  case EngineKind::MONGODB:
    return DatabaseDefaults::DEFAULT_MONGODB_PORT;
  case EngineKind::REDIS:
    return DatabaseDefaults::DEFAULT_REDIS_PORT;
  case EngineKind::MSSQL:
    return DatabaseDefaults::DEFAULT_MSSQL_PORT;
  case EngineKind::SQLITE:
    return 0;
  }
  return 0;
}

std::string ConnectionParameters::toSafeString() const {
  std::string out = "engine=" + engineKindToString(engine);
  if (engine == EngineKind::SQLITE) {
    return out + ";file=" + database;
  }
  out += ";host=" + host + ";port=" + std::to_string(effectivePort()) +
         ";db=" + database + ";user=" + user + ";password=***";
  if (tlsEnabled())
    out += ";tls=on";
  return out;
}
