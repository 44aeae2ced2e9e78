#include "engines/mariadb_engine.h"
#include "core/logger.h"
#include "utils/string_utils.h"

MySQLConnection::MySQLConnection(const ConnectionParameters &params) {
  conn_ = mysql_init(nullptr);
  if (!conn_) {
    throw ConnectionError(EngineKind::MARIADB, "mysql_init() failed");
  }

  unsigned int connectTimeout =
      static_cast<unsigned int>(params.connectTimeoutSeconds);
  unsigned int readTimeout =
      static_cast<unsigned int>(params.queryTimeoutSeconds);
  mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout);
  mysql_options(conn_, MYSQL_OPT_READ_TIMEOUT, &readTimeout);
  mysql_options(conn_, MYSQL_OPT_WRITE_TIMEOUT, &readTimeout);
  mysql_options(conn_, MYSQL_SET_CHARSET_NAME, "utf8mb4");

  if (params.tlsEnabled()) {
    const TlsSettings &tls = *params.tls;
    auto orNull = [](const std::string &s) {
      return s.empty() ? nullptr : s.c_str();
    };
    mysql_ssl_set(conn_, orNull(tls.keyFile), orNull(tls.certFile),
                  orNull(tls.caFile), nullptr, nullptr);
    bool verify = tls.verifyPeer;
    mysql_options(conn_, MYSQL_OPT_SSL_VERIFY_SERVER_CERT, &verify);
  }

  if (mysql_real_connect(conn_, params.host.c_str(), params.user.c_str(),
                         params.password.c_str(), params.database.c_str(),
                         static_cast<unsigned int>(params.effectivePort()),
                         nullptr, 0) == nullptr) {
    std::string cause = mysql_error(conn_);
    mysql_close(conn_);
    conn_ = nullptr;
    throw ConnectionError(EngineKind::MARIADB, cause);
  }
}

MySQLConnection::~MySQLConnection() {
  if (conn_)
    mysql_close(conn_);
}

MySQLConnection::MySQLConnection(MySQLConnection &&other) noexcept
    : conn_(other.conn_) {
  other.conn_ = nullptr;
}

MySQLConnection &MySQLConnection::operator=(MySQLConnection &&other) noexcept {
  if (this != &other) {
    if (conn_)
      mysql_close(conn_);
    conn_ = other.conn_;
    other.conn_ = nullptr;
  }
  return *this;
}

MariaDBConnection::MariaDBConnection(const ConnectionParameters &params)
    : conn_(params), database_(params.database) {
  std::string query = "SET SESSION TRANSACTION READ ONLY";
  if (mysql_query(conn_.get(), query.c_str())) {
    Logger::warning(LogCategory::DATABASE, "MariaDBConnection",
                    "Could not make session read-only: " +
                        std::string(mysql_error(conn_.get())));
  }
}

std::string MariaDBConnection::escapeLiteral(const std::string &value) {
  std::string buffer(value.size() * 2 + 1, '\0');
  unsigned long len = mysql_real_escape_string(conn_.get(), &buffer[0],
                                               value.c_str(), value.size());
  buffer.resize(len);
  return buffer;
}

// Runs query and returns every row as strings, NULL mapped to "". Throws
// std::runtime_error with the server message on failure.
std::vector<std::vector<std::string>>
MariaDBConnection::executeQuery(const std::string &query) {
  std::vector<std::vector<std::string>> results;
  MYSQL *conn = conn_.get();

  if (mysql_query(conn, query.c_str())) {
    throw std::runtime_error(mysql_error(conn));
  }

  MySQLResultPtr res(mysql_store_result(conn));
  if (!res) {
    if (mysql_field_count(conn) > 0) {
      throw std::runtime_error("result fetch failed: " +
                               std::string(mysql_error(conn)));
    }
    return results;
  }

  unsigned int numFields = mysql_num_fields(res.get());
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get()))) {
    std::vector<std::string> rowData;
    rowData.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
      rowData.push_back(row[i] ? row[i] : "");
    }
    results.push_back(std::move(rowData));
  }
  return results;
}

// information_schema.tables.table_rows is an estimate for InnoDB, which is
// all the strategy selector needs.
std::vector<TableDescriptor>
MariaDBConnection::introspect(std::vector<IntrospectionIssue> &issues) {
  std::vector<TableDescriptor> tables;
  std::string db = escapeLiteral(database_);
  try {
    auto rows = executeQuery(
        "SELECT table_schema, table_name, COALESCE(table_rows, 0) "
        "FROM information_schema.tables "
        "WHERE table_schema = '" +
        db +
        "' AND table_type = 'BASE TABLE' "
        "ORDER BY table_name");
    for (const auto &row : rows) {
      TableDescriptor table;
      table.schema = row[0];
      table.name = row[1];
      try {
        table.estimatedRows = std::stoll(row[2]);
      } catch (const std::exception &) {
        table.estimatedRows = 0;
      }
      tables.push_back(std::move(table));
    }
  } catch (const std::exception &e) {
    throw IntrospectionError("MariaDB catalog query failed: " +
                             std::string(e.what()));
  }

  std::vector<TableDescriptor> described;
  described.reserve(tables.size());
  for (auto &table : tables) {
    try {
      auto columns = executeQuery(
          "SELECT column_name, data_type FROM information_schema.columns "
          "WHERE table_schema = '" +
          escapeLiteral(table.schema) + "' AND table_name = '" +
          escapeLiteral(table.name) + "' ORDER BY ordinal_position");
      for (const auto &col : columns) {
        table.columns.push_back({col[0], col[1]});
      }
      described.push_back(std::move(table));
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::SCHEMA, "MariaDBConnection",
                      "Skipping " + table.qualifiedName() + ": " + e.what());
      issues.push_back({table.qualifiedName(), e.what()});
    }
  }
  return described;
}

// Streams rows with mysql_use_result so that cancel can stop reading early.
// Freeing the result drains whatever the server still has queued.
std::vector<SampledRow>
MariaDBConnection::sampleRows(const TableDescriptor &table, size_t limit,
                              const std::atomic<bool> &cancel) {
  MYSQL *conn = conn_.get();
  std::string query = "SELECT * FROM " +
                      StringUtils::escapeMySQLIdentifier(table.schema) + "." +
                      StringUtils::escapeMySQLIdentifier(table.name) +
                      " LIMIT " + std::to_string(limit);

  if (mysql_query(conn, query.c_str())) {
    throw SamplingError("MariaDB sampling of " + table.qualifiedName() +
                        " failed: " + mysql_error(conn));
  }

  MySQLResultPtr res(mysql_use_result(conn));
  if (!res) {
    throw SamplingError("MariaDB sampling of " + table.qualifiedName() +
                        " returned no result: " + mysql_error(conn));
  }

  unsigned int numFields = mysql_num_fields(res.get());
  MYSQL_FIELD *fields = mysql_fetch_fields(res.get());

  std::vector<SampledRow> rows;
  MYSQL_ROW row;
  while (!cancel.load() && (row = mysql_fetch_row(res.get()))) {
    unsigned long *lengths = mysql_fetch_lengths(res.get());
    SampledRow sampled;
    for (unsigned int i = 0; i < numFields; ++i) {
      if (!row[i])
        continue;
      sampled.push_back({fields[i].name, std::string(row[i], lengths[i])});
    }
    rows.push_back(std::move(sampled));
  }
  return rows;
}
