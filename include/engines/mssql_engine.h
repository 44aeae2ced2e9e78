#ifndef MSSQL_ENGINE_H
#define MSSQL_ENGINE_H

#include "engines/database_engine.h"
#include <optional>
#include <sql.h>
#include <sqlext.h>

class ODBCConnection {
  SQLHENV env_{SQL_NULL_HANDLE};
  SQLHDBC dbc_{SQL_NULL_HANDLE};

public:
  // Throws ConnectionError with the driver diagnostic on failure.
  ODBCConnection(const std::string &connectionString, int loginTimeoutSeconds);
  ~ODBCConnection();

  ODBCConnection(const ODBCConnection &) = delete;
  ODBCConnection &operator=(const ODBCConnection &) = delete;

  ODBCConnection(ODBCConnection &&other) noexcept;
  ODBCConnection &operator=(ODBCConnection &&other) noexcept;

  SQLHDBC getDbc() const { return dbc_; }

private:
  void release();
};

struct ODBCResult {
  std::vector<std::string> columns;
  std::vector<std::vector<std::optional<std::string>>> rows;
};

class MSSQLConnection : public IDatabaseConnection {
  ODBCConnection conn_;
  int queryTimeoutSeconds_;

public:
  explicit MSSQLConnection(const ConnectionParameters &params);

  EngineKind engine() const override { return EngineKind::MSSQL; }

  std::vector<TableDescriptor>
  introspect(std::vector<IntrospectionIssue> &issues) override;

  std::vector<SampledRow> sampleRows(const TableDescriptor &table,
                                     size_t limit,
                                     const std::atomic<bool> &cancel) override;

  static std::string buildConnectionString(const ConnectionParameters &params);

private:
  ODBCResult executeQuery(const std::string &query,
                          const std::atomic<bool> *cancel = nullptr);
};

#endif
