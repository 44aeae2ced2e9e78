#include "engines/sqlite_engine.h"
#include "core/logger.h"
#include "utils/string_utils.h"

namespace {
// Interrupts a running statement once the cancel flag is raised.
int cancelProgressHandler(void *arg) {
  const auto *cancel = static_cast<const std::atomic<bool> *>(arg);
  return cancel->load() ? 1 : 0;
}

std::string columnText(sqlite3_stmt *stmt, int i) {
  const unsigned char *text = sqlite3_column_text(stmt, i);
  int len = sqlite3_column_bytes(stmt, i);
  return text ? std::string(reinterpret_cast<const char *>(text), len) : "";
}

struct ProgressHandlerGuard {
  sqlite3 *db;
  ~ProgressHandlerGuard() { sqlite3_progress_handler(db, 0, nullptr, nullptr); }
};
} // namespace

SQLiteConnection::SQLiteConnection(const ConnectionParameters &params)
    : path_(params.database) {
  if (path_.empty()) {
    throw ConnectionError(EngineKind::SQLITE, "no database file given");
  }

  sqlite3 *raw = nullptr;
  int rc = sqlite3_open_v2(path_.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    std::string cause = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
    throw ConnectionError(EngineKind::SQLITE, path_ + ": " + cause);
  }

  sqlite3_busy_timeout(db_.get(), params.connectTimeoutSeconds * 1000);

  // sqlite3_open_v2 is lazy; touching the schema catches files that are not
  // databases at all.
  char *errMsg = nullptr;
  rc = sqlite3_exec(db_.get(), "SELECT count(*) FROM sqlite_master", nullptr,
                    nullptr, &errMsg);
  if (rc != SQLITE_OK) {
    std::string cause = errMsg ? errMsg : sqlite3_errstr(rc);
    sqlite3_free(errMsg);
    throw ConnectionError(EngineKind::SQLITE, path_ + ": " + cause);
  }
}

SQLiteStatementPtr SQLiteConnection::prepare(const std::string &sql) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &stmt, nullptr) !=
      SQLITE_OK) {
    throw std::runtime_error(sqlite3_errmsg(db_.get()));
  }
  return SQLiteStatementPtr(stmt);
}

std::vector<TableDescriptor>
SQLiteConnection::introspect(std::vector<IntrospectionIssue> &issues) {
  std::vector<TableDescriptor> tables;
  try {
    SQLiteStatementPtr stmt =
        prepare("SELECT name FROM sqlite_master WHERE type = 'table' "
                "AND name NOT LIKE 'sqlite_%' ORDER BY name");
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
      TableDescriptor table;
      table.name = columnText(stmt.get(), 0);
      tables.push_back(std::move(table));
    }
  } catch (const std::exception &e) {
    throw IntrospectionError("SQLite catalog query failed: " +
                             std::string(e.what()));
  }

  std::vector<TableDescriptor> described;
  described.reserve(tables.size());
  for (auto &table : tables) {
    try {
      std::string quoted = StringUtils::escapeSQLiteIdentifier(table.name);

      SQLiteStatementPtr count = prepare("SELECT COUNT(*) FROM " + quoted);
      if (sqlite3_step(count.get()) != SQLITE_ROW)
        throw std::runtime_error(sqlite3_errmsg(db_.get()));
      table.estimatedRows = sqlite3_column_int64(count.get(), 0);

      SQLiteStatementPtr info = prepare("PRAGMA table_info(" + quoted + ")");
      while (sqlite3_step(info.get()) == SQLITE_ROW) {
        table.columns.push_back(
            {columnText(info.get(), 1), columnText(info.get(), 2)});
      }
      described.push_back(std::move(table));
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::SCHEMA, "SQLiteConnection",
                      "Skipping " + table.name + ": " + e.what());
      issues.push_back({table.name, e.what()});
    }
  }
  return described;
}

std::vector<SampledRow>
SQLiteConnection::sampleRows(const TableDescriptor &table, size_t limit,
                             const std::atomic<bool> &cancel) {
  std::vector<SampledRow> rows;
  sqlite3_progress_handler(db_.get(), 1000, cancelProgressHandler,
                           const_cast<std::atomic<bool> *>(&cancel));
  ProgressHandlerGuard guard{db_.get()};

  SQLiteStatementPtr stmt;
  try {
    stmt = prepare("SELECT * FROM " +
                   StringUtils::escapeSQLiteIdentifier(table.name) +
                   " LIMIT " + std::to_string(limit));
  } catch (const std::exception &e) {
    throw SamplingError("SQLite sampling of " + table.name + " failed: " +
                        e.what());
  }

  int numColumns = sqlite3_column_count(stmt.get());
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    SampledRow sampled;
    for (int i = 0; i < numColumns; ++i) {
      int type = sqlite3_column_type(stmt.get(), i);
      if (type == SQLITE_NULL || type == SQLITE_BLOB)
        continue;
      sampled.push_back(
          {sqlite3_column_name(stmt.get(), i), columnText(stmt.get(), i)});
    }
    rows.push_back(std::move(sampled));
  }

  if (rc == SQLITE_INTERRUPT) {
    return rows;
  }
  if (rc != SQLITE_DONE) {
    throw SamplingError("SQLite sampling of " + table.name + " failed: " +
                        sqlite3_errmsg(db_.get()));
  }
  return rows;
}
