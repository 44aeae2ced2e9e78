#include "utils/engine_factory.h"
#include "core/logger.h"
#include "engines/mariadb_engine.h"
#include "engines/mongodb_engine.h"
#include "engines/mssql_engine.h"
#include "engines/postgres_engine.h"
#include "engines/redis_engine.h"
#include "engines/sqlite_engine.h"

namespace EngineFactory {
namespace {
std::unique_ptr<IDatabaseConnection>
createConnection(const ConnectionParameters &params) {
  switch (params.engine) {
  case EngineKind::POSTGRESQL:
    return std::make_unique<PostgreSQLConnection>(params);
  case EngineKind::MARIADB:
    return std::make_unique<MariaDBConnection>(params);
  case EngineKind::MONGODB:
    return std::make_unique<MongoDBConnection>(params);
  case EngineKind::REDIS:
    return std::make_unique<RedisConnection>(params);
  case EngineKind::SQLITE:
    return std::make_unique<SQLiteConnection>(params);
  case EngineKind::MSSQL:
    return std::make_unique<MSSQLConnection>(params);
  }
  throw ConnectionError(params.engine, "unsupported engine");
}
} // namespace

std::unique_ptr<IDatabaseConnection> open(const ConnectionParameters &params) {
  Logger::debug(LogCategory::DATABASE, "EngineFactory",
                "Opening " + params.toSafeString());
  try {
    return createConnection(params);
  } catch (const ConnectionError &e) {
    Logger::error(LogCategory::DATABASE, "EngineFactory", e.what());
    throw;
  } catch (const std::exception &e) {
    // Anything else a client library throws while connecting.
    Logger::error(LogCategory::DATABASE, "EngineFactory",
                  engineKindToString(params.engine) +
                      " connection failed: " + e.what());
    throw ConnectionError(params.engine, e.what());
  }
}
} // namespace EngineFactory
