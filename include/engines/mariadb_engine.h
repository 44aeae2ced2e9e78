#ifndef MARIADB_ENGINE_H
#define MARIADB_ENGINE_H

#include "engines/database_engine.h"
#include <memory>
#include <mysql/mysql.h>

class MySQLConnection {
  MYSQL *conn_{nullptr};

public:
  // Throws ConnectionError when mysql_real_connect fails.
  explicit MySQLConnection(const ConnectionParameters &params);
  ~MySQLConnection();

  MySQLConnection(const MySQLConnection &) = delete;
  MySQLConnection &operator=(const MySQLConnection &) = delete;

  MySQLConnection(MySQLConnection &&other) noexcept;
  MySQLConnection &operator=(MySQLConnection &&other) noexcept;

  MYSQL *get() const { return conn_; }
};

struct MySQLResultDeleter {
  void operator()(MYSQL_RES *res) const {
    if (res)
      mysql_free_result(res);
  }
};

using MySQLResultPtr = std::unique_ptr<MYSQL_RES, MySQLResultDeleter>;

class MariaDBConnection : public IDatabaseConnection {
  MySQLConnection conn_;
  std::string database_;

public:
  explicit MariaDBConnection(const ConnectionParameters &params);

  EngineKind engine() const override { return EngineKind::MARIADB; }

  std::vector<TableDescriptor>
  introspect(std::vector<IntrospectionIssue> &issues) override;

  std::vector<SampledRow> sampleRows(const TableDescriptor &table,
                                     size_t limit,
                                     const std::atomic<bool> &cancel) override;

private:
  std::vector<std::vector<std::string>> executeQuery(const std::string &query);
  std::string escapeLiteral(const std::string &value);
};

#endif
