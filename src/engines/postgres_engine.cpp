#include "engines/postgres_engine.h"
#include "core/logger.h"

namespace {
// Quotes a libpq conninfo value: 'value' with backslash and quote escaped.
std::string conninfoValue(const std::string &value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\\' || c == '\'')
      out += '\\';
    out += c;
  }
  out += "'";
  return out;
}
} // namespace

std::string
PostgreSQLConnection::buildConnectionString(const ConnectionParameters &params) {
  std::string connStr = "host=" + conninfoValue(params.host) +
                        " port=" + std::to_string(params.effectivePort()) +
                        " dbname=" + conninfoValue(params.database) +
                        " user=" + conninfoValue(params.user) +
                        " password=" + conninfoValue(params.password) +
                        " connect_timeout=" +
                        std::to_string(params.connectTimeoutSeconds) +
                        " application_name='intelliscan'";

  if (params.tlsEnabled()) {
    const TlsSettings &tls = *params.tls;
    if (!tls.verifyPeer)
      connStr += " sslmode=require";
    else
      connStr += tls.caFile.empty() ? " sslmode=verify-full"
                                    : " sslmode=verify-full sslrootcert=" +
                                          conninfoValue(tls.caFile);
    if (!tls.certFile.empty())
      connStr += " sslcert=" + conninfoValue(tls.certFile);
    if (!tls.keyFile.empty())
      connStr += " sslkey=" + conninfoValue(tls.keyFile);
  } else {
    connStr += " sslmode=prefer";
  }
  return connStr;
}

PostgreSQLConnection::PostgreSQLConnection(const ConnectionParameters &params)
    : queryTimeoutSeconds_(params.queryTimeoutSeconds) {
  try {
    conn_ = std::make_unique<pqxx::connection>(buildConnectionString(params));
  } catch (const std::exception &e) {
    throw ConnectionError(EngineKind::POSTGRESQL, e.what());
  }
  if (!conn_->is_open()) {
    throw ConnectionError(EngineKind::POSTGRESQL, "connection is not open");
  }

  try {
    pqxx::nontransaction txn(*conn_);
    txn.exec("SET statement_timeout = " +
             std::to_string(queryTimeoutSeconds_ * 1000));
    txn.exec("SET default_transaction_read_only = on");
  } catch (const std::exception &e) {
    throw ConnectionError(EngineKind::POSTGRESQL,
                          "session setup failed: " + std::string(e.what()));
  }
}

// Lists base tables outside the system schemas with the live-tuple estimate
// kept by the statistics collector, then reads the column list of each one.
// A failure to read one table's columns is recorded in issues and that table
// is left out.
std::vector<TableDescriptor>
PostgreSQLConnection::introspect(std::vector<IntrospectionIssue> &issues) {
  std::vector<TableDescriptor> tables;
  try {
    pqxx::nontransaction txn(*conn_);
    auto results = txn.exec(
        "SELECT t.table_schema, t.table_name, COALESCE(s.n_live_tup, 0) "
        "FROM information_schema.tables t "
        "LEFT JOIN pg_stat_user_tables s "
        "ON s.schemaname = t.table_schema AND s.relname = t.table_name "
        "WHERE t.table_type = 'BASE TABLE' "
        "AND t.table_schema NOT IN ('pg_catalog', 'information_schema') "
        "AND t.table_schema NOT LIKE 'pg_toast%' "
        "AND t.table_schema NOT LIKE 'pg_temp%' "
        "ORDER BY t.table_schema, t.table_name");

    for (const auto &row : results) {
      TableDescriptor table;
      table.schema = row[0].as<std::string>();
      table.name = row[1].as<std::string>();
      table.estimatedRows = row[2].as<int64_t>();
      tables.push_back(std::move(table));
    }
  } catch (const std::exception &e) {
    throw IntrospectionError("PostgreSQL catalog query failed: " +
                             std::string(e.what()));
  }

  std::vector<TableDescriptor> described;
  described.reserve(tables.size());
  for (auto &table : tables) {
    try {
      pqxx::nontransaction txn(*conn_);
      auto columns = txn.exec_params(
          "SELECT column_name, data_type FROM information_schema.columns "
          "WHERE table_schema = $1 AND table_name = $2 "
          "ORDER BY ordinal_position",
          table.schema, table.name);
      for (const auto &col : columns) {
        table.columns.push_back(
            {col[0].as<std::string>(), col[1].as<std::string>()});
      }
      described.push_back(std::move(table));
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::SCHEMA, "PostgreSQLConnection",
                      "Skipping " + table.qualifiedName() + ": " + e.what());
      issues.push_back({table.qualifiedName(), e.what()});
    }
  }
  return described;
}

std::vector<SampledRow>
PostgreSQLConnection::sampleRows(const TableDescriptor &table, size_t limit,
                                 const std::atomic<bool> &cancel) {
  std::vector<SampledRow> rows;
  try {
    pqxx::nontransaction txn(*conn_);
    std::string query = "SELECT * FROM " + txn.quote_name(table.schema) + "." +
                        txn.quote_name(table.name) + " LIMIT " +
                        std::to_string(limit);
    auto results = txn.exec(query);

    rows.reserve(results.size());
    for (const auto &row : results) {
      if (cancel.load())
        break;
      SampledRow sampled;
      for (const auto &field : row) {
        if (field.is_null())
          continue;
        sampled.push_back({field.name(), field.c_str()});
      }
      rows.push_back(std::move(sampled));
    }
  } catch (const std::exception &e) {
    throw SamplingError("PostgreSQL sampling of " + table.qualifiedName() +
                        " failed: " + e.what());
  }
  return rows;
}
