#ifndef POSTGRES_ENGINE_H
#define POSTGRES_ENGINE_H

#include "engines/database_engine.h"
#include <memory>
#include <pqxx/pqxx>

class PostgreSQLConnection : public IDatabaseConnection {
  std::unique_ptr<pqxx::connection> conn_;
  int queryTimeoutSeconds_;

public:
  // Throws ConnectionError when the server cannot be reached.
  explicit PostgreSQLConnection(const ConnectionParameters &params);

  PostgreSQLConnection(const PostgreSQLConnection &) = delete;
  PostgreSQLConnection &operator=(const PostgreSQLConnection &) = delete;

  EngineKind engine() const override { return EngineKind::POSTGRESQL; }

  std::vector<TableDescriptor>
  introspect(std::vector<IntrospectionIssue> &issues) override;

  std::vector<SampledRow> sampleRows(const TableDescriptor &table,
                                     size_t limit,
                                     const std::atomic<bool> &cancel) override;

  static std::string buildConnectionString(const ConnectionParameters &params);
};

#endif
