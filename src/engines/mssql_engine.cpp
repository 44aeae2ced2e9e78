#include "engines/mssql_engine.h"
#include "core/database_defaults.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <cstdint>

namespace {
std::string diagnostic(SQLSMALLINT handleType, SQLHANDLE handle) {
  SQLCHAR sqlState[6], msg[SQL_MAX_MESSAGE_LENGTH];
  SQLINTEGER nativeError = 0;
  SQLSMALLINT msgLen = 0;
  if (SQL_SUCCEEDED(SQLGetDiagRec(handleType, handle, 1, sqlState,
                                  &nativeError, msg, sizeof(msg), &msgLen))) {
    return std::string(reinterpret_cast<char *>(sqlState)) + ": " +
           std::string(reinterpret_cast<char *>(msg));
  }
  return "unknown ODBC error";
}

// ODBC attribute values in braces with '}' doubled.
std::string odbcValue(const std::string &value) {
  std::string out = "{";
  for (char c : value) {
    out += c;
    if (c == '}')
      out += '}';
  }
  out += "}";
  return out;
}

std::string sqlLiteral(const std::string &value) {
  std::string out = "N'";
  for (char c : value) {
    out += c;
    if (c == '\'')
      out += '\'';
  }
  out += "'";
  return out;
}

class ODBCStatement {
  SQLHSTMT stmt_{SQL_NULL_HANDLE};

public:
  explicit ODBCStatement(SQLHDBC dbc) {
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt_))) {
      stmt_ = SQL_NULL_HANDLE;
      throw std::runtime_error("failed to allocate statement handle: " +
                               diagnostic(SQL_HANDLE_DBC, dbc));
    }
  }
  ~ODBCStatement() {
    if (stmt_ != SQL_NULL_HANDLE) {
      SQLFreeStmt(stmt_, SQL_CLOSE);
      SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
    }
  }
  ODBCStatement(const ODBCStatement &) = delete;
  ODBCStatement &operator=(const ODBCStatement &) = delete;

  SQLHSTMT get() const { return stmt_; }
};
} // namespace

ODBCConnection::ODBCConnection(const std::string &connectionString,
                               int loginTimeoutSeconds) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
  if (!SQL_SUCCEEDED(ret)) {
    env_ = SQL_NULL_HANDLE;
    throw ConnectionError(EngineKind::MSSQL,
                          "failed to allocate environment handle");
  }

  ret = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION,
                      reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);
  if (!SQL_SUCCEEDED(ret)) {
    release();
    throw ConnectionError(EngineKind::MSSQL, "failed to set ODBC version");
  }

  ret = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
  if (!SQL_SUCCEEDED(ret)) {
    dbc_ = SQL_NULL_HANDLE;
    release();
    throw ConnectionError(EngineKind::MSSQL,
                          "failed to allocate connection handle");
  }

  SQLSetConnectAttr(dbc_, SQL_ATTR_LOGIN_TIMEOUT,
                    reinterpret_cast<SQLPOINTER>(
                        static_cast<intptr_t>(loginTimeoutSeconds)),
                    0);
  SQLSetConnectAttr(dbc_, SQL_ATTR_ACCESS_MODE,
                    reinterpret_cast<SQLPOINTER>(SQL_MODE_READ_ONLY), 0);

  SQLCHAR outConnStr[DatabaseDefaults::BUFFER_SIZE];
  SQLSMALLINT outConnStrLen;
  ret = SQLDriverConnect(
      dbc_, nullptr,
      reinterpret_cast<SQLCHAR *>(const_cast<char *>(connectionString.c_str())),
      SQL_NTS, outConnStr, sizeof(outConnStr), &outConnStrLen,
      SQL_DRIVER_NOPROMPT);
  if (!SQL_SUCCEEDED(ret)) {
    std::string cause = diagnostic(SQL_HANDLE_DBC, dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
    release();
    throw ConnectionError(EngineKind::MSSQL, cause);
  }
}

void ODBCConnection::release() {
  if (dbc_ != SQL_NULL_HANDLE) {
    SQLDisconnect(dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
  }
  if (env_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    env_ = SQL_NULL_HANDLE;
  }
}

ODBCConnection::~ODBCConnection() { release(); }

ODBCConnection::ODBCConnection(ODBCConnection &&other) noexcept
    : env_(other.env_), dbc_(other.dbc_) {
  other.env_ = SQL_NULL_HANDLE;
  other.dbc_ = SQL_NULL_HANDLE;
}

ODBCConnection &ODBCConnection::operator=(ODBCConnection &&other) noexcept {
  if (this != &other) {
    release();
    env_ = other.env_;
    dbc_ = other.dbc_;
    other.env_ = SQL_NULL_HANDLE;
    other.dbc_ = SQL_NULL_HANDLE;
  }
  return *this;
}

std::string
MSSQLConnection::buildConnectionString(const ConnectionParameters &params) {
  std::string connStr =
      std::string("DRIVER={") + DatabaseDefaults::MSSQL_ODBC_DRIVER + "};" +
      "SERVER=" + params.host + "," + std::to_string(params.effectivePort()) +
      ";DATABASE=" + odbcValue(params.database) +
      ";UID=" + odbcValue(params.user) + ";PWD=" + odbcValue(params.password) +
      ";APP=intelliscan";

  if (params.tlsEnabled()) {
    connStr += ";Encrypt=yes;TrustServerCertificate=";
    connStr += params.tls->verifyPeer ? "no" : "yes";
  } else {
    // Driver 18 encrypts by default and rejects self-signed certificates.
    connStr += ";Encrypt=no";
  }
  return connStr;
}

MSSQLConnection::MSSQLConnection(const ConnectionParameters &params)
    : conn_(buildConnectionString(params), params.connectTimeoutSeconds),
      queryTimeoutSeconds_(params.queryTimeoutSeconds) {}

// Executes query and collects every row, reading each cell in
// BUFFER_SIZE chunks so long text columns are not truncated. NULL cells are
// returned as std::nullopt. Polls cancel between rows.
ODBCResult MSSQLConnection::executeQuery(const std::string &query,
                                         const std::atomic<bool> *cancel) {
  ODBCResult result;
  ODBCStatement stmt(conn_.getDbc());

  SQLSetStmtAttr(stmt.get(), SQL_ATTR_QUERY_TIMEOUT,
                 reinterpret_cast<SQLPOINTER>(
                     static_cast<intptr_t>(queryTimeoutSeconds_)),
                 0);

  SQLRETURN ret = SQLExecDirect(
      stmt.get(), reinterpret_cast<SQLCHAR *>(const_cast<char *>(query.c_str())),
      SQL_NTS);
  if (!SQL_SUCCEEDED(ret)) {
    throw std::runtime_error(diagnostic(SQL_HANDLE_STMT, stmt.get()));
  }

  SQLSMALLINT numCols = 0;
  ret = SQLNumResultCols(stmt.get(), &numCols);
  if (!SQL_SUCCEEDED(ret) || numCols <= 0) {
    return result;
  }

  for (SQLSMALLINT i = 1; i <= numCols; ++i) {
    SQLCHAR name[256];
    SQLSMALLINT nameLen = 0, dataType = 0, decimals = 0, nullable = 0;
    SQLULEN colSize = 0;
    SQLDescribeCol(stmt.get(), i, name, sizeof(name), &nameLen, &dataType,
                   &colSize, &decimals, &nullable);
    result.columns.emplace_back(reinterpret_cast<char *>(name));
  }

  SQLRETURN fetchRet;
  while ((fetchRet = SQLFetch(stmt.get())) == SQL_SUCCESS ||
         fetchRet == SQL_SUCCESS_WITH_INFO) {
    if (cancel && cancel->load()) {
      SQLCancel(stmt.get());
      break;
    }
    std::vector<std::optional<std::string>> row;
    row.reserve(numCols);
    for (SQLSMALLINT i = 1; i <= numCols; i++) {
      std::string cellValue;
      bool isNull = false;
      SQLLEN len = 0;
      char buffer[DatabaseDefaults::BUFFER_SIZE];

      while (true) {
        ret = SQLGetData(stmt.get(), i, SQL_C_CHAR, buffer, sizeof(buffer),
                         &len);
        if (ret == SQL_NO_DATA || !SQL_SUCCEEDED(ret))
          break;
        if (len == SQL_NULL_DATA) {
          isNull = true;
          break;
        }
        if (ret == SQL_SUCCESS_WITH_INFO &&
            (len == SQL_NO_TOTAL ||
             len >= static_cast<SQLLEN>(sizeof(buffer)))) {
          cellValue.append(buffer, sizeof(buffer) - 1);
          continue;
        }
        cellValue.append(buffer, static_cast<size_t>(len));
        break;
      }

      if (isNull)
        row.push_back(std::nullopt);
      else
        row.push_back(std::move(cellValue));
    }
    result.rows.push_back(std::move(row));
  }
  return result;
}

std::vector<TableDescriptor>
MSSQLConnection::introspect(std::vector<IntrospectionIssue> &issues) {
  std::vector<TableDescriptor> tables;
  try {
    ODBCResult result = executeQuery(
        "SELECT s.name, t.name, COALESCE(SUM(p.rows), 0) "
        "FROM sys.tables t "
        "INNER JOIN sys.schemas s ON s.schema_id = t.schema_id "
        "LEFT JOIN sys.partitions p ON p.object_id = t.object_id "
        "AND p.index_id IN (0, 1) "
        "WHERE t.is_ms_shipped = 0 "
        "GROUP BY s.name, t.name ORDER BY s.name, t.name");
    for (const auto &row : result.rows) {
      if (row.size() < 3 || !row[0] || !row[1])
        continue;
      TableDescriptor table;
      table.schema = *row[0];
      table.name = *row[1];
      try {
        table.estimatedRows = row[2] ? std::stoll(*row[2]) : 0;
      } catch (const std::exception &) {
        table.estimatedRows = 0;
      }
      tables.push_back(std::move(table));
    }
  } catch (const std::exception &e) {
    throw IntrospectionError("MSSQL catalog query failed: " +
                             std::string(e.what()));
  }

  std::vector<TableDescriptor> described;
  described.reserve(tables.size());
  for (auto &table : tables) {
    try {
      ODBCResult columns = executeQuery(
          "SELECT COLUMN_NAME, DATA_TYPE FROM INFORMATION_SCHEMA.COLUMNS "
          "WHERE TABLE_SCHEMA = " +
          sqlLiteral(table.schema) + " AND TABLE_NAME = " +
          sqlLiteral(table.name) + " ORDER BY ORDINAL_POSITION");
      for (const auto &col : columns.rows) {
        if (col.size() < 2 || !col[0])
          continue;
        table.columns.push_back({*col[0], col[1].value_or("")});
      }
      described.push_back(std::move(table));
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::SCHEMA, "MSSQLConnection",
                      "Skipping " + table.qualifiedName() + ": " + e.what());
      issues.push_back({table.qualifiedName(), e.what()});
    }
  }
  return described;
}

std::vector<SampledRow>
MSSQLConnection::sampleRows(const TableDescriptor &table, size_t limit,
                            const std::atomic<bool> &cancel) {
  ODBCResult result;
  try {
    result = executeQuery(
        "SELECT TOP (" + std::to_string(limit) + ") * FROM " +
            StringUtils::escapeMSSQLIdentifier(table.schema) + "." +
            StringUtils::escapeMSSQLIdentifier(table.name) +
            " WITH (NOLOCK)",
        &cancel);
  } catch (const std::exception &e) {
    throw SamplingError("MSSQL sampling of " + table.qualifiedName() +
                        " failed: " + e.what());
  }

  std::vector<SampledRow> rows;
  rows.reserve(result.rows.size());
  for (auto &row : result.rows) {
    SampledRow sampled;
    for (size_t i = 0; i < row.size() && i < result.columns.size(); ++i) {
      if (row[i])
        sampled.push_back({result.columns[i], std::move(*row[i])});
    }
    rows.push_back(std::move(sampled));
  }
  return rows;
}
