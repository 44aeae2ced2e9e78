#ifndef CONNECTION_PARAMS_H
#define CONNECTION_PARAMS_H

#include <optional>
#include <string>

enum class EngineKind { POSTGRESQL, MARIADB, MONGODB, REDIS, SQLITE, MSSQL };

std::string engineKindToString(EngineKind kind);

// Accepts the canonical names plus common aliases ("postgres", "mysql",
// "mongo", "sqlserver", ...), case-insensitively.
std::optional<EngineKind> parseEngineKind(const std::string &name);

int defaultPortFor(EngineKind kind);

struct TlsSettings {
  bool enabled = false;
  bool verifyPeer = true;
  std::string caFile;
  std::string certFile;
  std::string keyFile;
};

struct ConnectionParameters {
  EngineKind engine = EngineKind::POSTGRESQL;
  std::string host;
  int port = 0;
  // Database name, or the file path for SQLite, or the numeric index for Redis.
  std::string database;
  std::string user;
  std::string password;
  std::optional<TlsSettings> tls;
  int connectTimeoutSeconds = 15;
  int queryTimeoutSeconds = 30;

  int effectivePort() const { return port > 0 ? port : defaultPortFor(engine); }

  bool tlsEnabled() const { return tls.has_value() && tls->enabled; }

  std::string toSafeString() const;
};

#endif
