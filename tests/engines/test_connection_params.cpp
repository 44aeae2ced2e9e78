#include "core/logger.h"
#include "engines/connection_params.h"
#include "engines/redis_engine.h"
#include "test_runner.h"
#include "utils/connection_utils.h"

int main() {
  Logger::setLogLevel(LogLevel::CRITICAL);
  TestRunner runner;

  runner.runTest("Engine names and aliases", [&]() {
    runner.assertTrue(parseEngineKind("PostgreSQL") == EngineKind::POSTGRESQL,
                      "postgresql");
    runner.assertTrue(parseEngineKind("pg") == EngineKind::POSTGRESQL, "pg");
    runner.assertTrue(parseEngineKind("MySQL") == EngineKind::MARIADB, "mysql");
    runner.assertTrue(parseEngineKind("mongo") == EngineKind::MONGODB, "mongo");
    runner.assertTrue(parseEngineKind("sqlite3") == EngineKind::SQLITE,
                      "sqlite3");
    runner.assertTrue(parseEngineKind("sqlserver") == EngineKind::MSSQL,
                      "sqlserver");
    runner.assertFalse(parseEngineKind("oracle").has_value(), "unsupported");
    runner.assertEquals("MariaDB", engineKindToString(EngineKind::MARIADB),
                        "display name");
  });

  runner.runTest("Default ports per engine", [&]() {
    runner.assertEquals(5432, defaultPortFor(EngineKind::POSTGRESQL), "pg");
    runner.assertEquals(3306, defaultPortFor(EngineKind::MARIADB), "mariadb");
    runner.assertEquals(27017, defaultPortFor(EngineKind::MONGODB), "mongodb");
    runner.assertEquals(6379, defaultPortFor(EngineKind::REDIS), "redis");
    runner.assertEquals(1433, defaultPortFor(EngineKind::MSSQL), "mssql");

    ConnectionParameters params;
    params.engine = EngineKind::MONGODB;
    runner.assertEquals(27017, params.effectivePort(), "effective default");
    params.port = 27018;
    runner.assertEquals(27018, params.effectivePort(), "explicit port");
  });

  runner.runTest("Parses a full connection string", [&]() {
    auto params = ConnectionStringParser::parse(
        "engine=postgres;Server=db.example.com;port=6432;database=crm;"
        "uid=scanner;pwd=p@ss;connect_timeout=5;query_timeout=90;"
        "tls=require;tls_verify=false;sslca=/ca.pem");
    runner.assertTrue(params.has_value(), "parsed");
    if (!params)
      return;
    runner.assertTrue(params->engine == EngineKind::POSTGRESQL, "engine");
    runner.assertEquals("db.example.com", params->host, "host");
    runner.assertEquals(6432, params->port, "port");
    runner.assertEquals("crm", params->database, "database");
    runner.assertEquals("scanner", params->user, "user");
    runner.assertEquals("p@ss", params->password, "password");
    runner.assertEquals(5, params->connectTimeoutSeconds, "connect timeout");
    runner.assertEquals(90, params->queryTimeoutSeconds, "query timeout");
    runner.assertTrue(params->tlsEnabled(), "tls");
    runner.assertFalse(params->tls->verifyPeer, "verify off");
    runner.assertEquals("/ca.pem", params->tls->caFile, "ca file");
  });

  runner.runTest("Rejects missing or invalid fields", [&]() {
    runner.assertFalse(ConnectionStringParser::parse("").has_value(), "empty");
    runner.assertFalse(
        ConnectionStringParser::parse("host=db;db=crm").has_value(),
        "no engine");
    runner.assertFalse(
        ConnectionStringParser::parse("engine=mariadb;db=crm").has_value(),
        "no host");
    runner.assertFalse(
        ConnectionStringParser::parse("engine=mariadb;host=db").has_value(),
        "no database");
    runner.assertFalse(ConnectionStringParser::parse(
                           "engine=mariadb;host=db;db=x;port=70000")
                           .has_value(),
                       "port out of range");
    runner.assertFalse(ConnectionStringParser::parse(
                           "engine=mariadb;host=db;db=x;connect_timeout=500")
                           .has_value(),
                       "connect timeout out of range");
    runner.assertFalse(
        ConnectionStringParser::parse("engine=cassandra;host=db").has_value(),
        "unsupported engine");
  });

  runner.runTest("Engine-specific required fields", [&]() {
    runner.assertTrue(
        ConnectionStringParser::parse("engine=sqlite;file=/tmp/a.db")
            .has_value(),
        "sqlite needs only a file");
    runner.assertFalse(
        ConnectionStringParser::parse("engine=sqlite;host=x").has_value(),
        "sqlite without file");
    runner.assertTrue(
        ConnectionStringParser::parse("engine=redis;host=cache").has_value(),
        "redis without database");
  });

  runner.runTest("Safe string masks the password", [&]() {
    ConnectionParameters params;
    params.engine = EngineKind::MSSQL;
    params.host = "sql01";
    params.database = "erp";
    params.user = "sa";
    params.password = "TopSecret!";
    std::string safe = params.toSafeString();
    runner.assertTrue(safe.find("TopSecret") == std::string::npos,
                      "password hidden");
    runner.assertTrue(safe.find("host=sql01") != std::string::npos, "host");
    runner.assertTrue(safe.find("port=1433") != std::string::npos,
                      "default port shown");

    ConnectionParameters file;
    file.engine = EngineKind::SQLITE;
    file.database = "/data/app.db";
    runner.assertEquals("engine=SQLite;file=/data/app.db", file.toSafeString(),
                        "sqlite form");
  });

  runner.runTest("Redis database index and key-spaces", [&]() {
    runner.assertEquals(0, RedisConnection::parseDatabaseIndex(""),
                        "empty means db 0");
    runner.assertEquals(3, RedisConnection::parseDatabaseIndex("3"), "index");

    auto rejected = [](const std::string &value) {
      try {
        RedisConnection::parseDatabaseIndex(value);
      } catch (const ConnectionError &e) {
        return e.engine() == EngineKind::REDIS;
      }
      return false;
    };
    runner.assertTrue(rejected("cache"), "non-numeric");
    runner.assertTrue(rejected("99999999999999999999"),
                      "overlong index is a connection error");

    runner.assertEquals("user", RedisConnection::keyspaceOf("user:42"),
                        "prefix before the first colon");
    runner.assertEquals(RedisConnection::ROOT_KEYSPACE,
                        RedisConnection::keyspaceOf("counter"),
                        "no colon goes to the root key-space");
  });

  runner.printSummary();
  return 0;
}
