#ifndef SQLITE_ENGINE_H
#define SQLITE_ENGINE_H

#include "engines/database_engine.h"
#include <memory>
#include <sqlite3.h>

struct SQLiteDeleter {
  void operator()(sqlite3 *db) const {
    if (db)
      sqlite3_close_v2(db);
  }
};

struct SQLiteStatementDeleter {
  void operator()(sqlite3_stmt *stmt) const {
    if (stmt)
      sqlite3_finalize(stmt);
  }
};

using SQLitePtr = std::unique_ptr<sqlite3, SQLiteDeleter>;
using SQLiteStatementPtr = std::unique_ptr<sqlite3_stmt, SQLiteStatementDeleter>;

// Opens the file read-only. A missing file is a ConnectionError rather than
// an empty database being created.
class SQLiteConnection : public IDatabaseConnection {
  SQLitePtr db_;
  std::string path_;

public:
  explicit SQLiteConnection(const ConnectionParameters &params);

  EngineKind engine() const override { return EngineKind::SQLITE; }

  std::vector<TableDescriptor>
  introspect(std::vector<IntrospectionIssue> &issues) override;

  std::vector<SampledRow> sampleRows(const TableDescriptor &table,
                                     size_t limit,
                                     const std::atomic<bool> &cancel) override;

private:
  SQLiteStatementPtr prepare(const std::string &sql);
};

#endif
