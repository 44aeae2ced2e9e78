#ifndef DATABASE_ENGINE_H
#define DATABASE_ENGINE_H

#include "engines/connection_params.h"
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

struct ColumnDescriptor {
  std::string name;
  std::string type;
};

struct TableDescriptor {
  // Schema or namespace. Empty for engines without one (SQLite, Redis).
  std::string schema;
  std::string name;
  int64_t estimatedRows = 0;
  std::vector<ColumnDescriptor> columns;
  double priorityScore = 0.0;

  std::string qualifiedName() const {
    return schema.empty() ? name : schema + "." + name;
  }
};

// A table or collection that could not be introspected.
struct IntrospectionIssue {
  std::string table;
  std::string message;
};

struct SampledCell {
  std::string column;
  std::string value;
};

using SampledRow = std::vector<SampledCell>;

// Raised when the engine cannot be reached or refuses the credentials.
class ConnectionError : public std::runtime_error {
public:
  ConnectionError(EngineKind engine, const std::string &cause)
      : std::runtime_error(engineKindToString(engine) +
                           " connection failed: " + cause),
        engine_(engine), cause_(cause) {}

  EngineKind engine() const { return engine_; }
  const std::string &cause() const { return cause_; }

private:
  EngineKind engine_;
  std::string cause_;
};

// Raised when the catalog itself cannot be listed. Failures on a single
// table are reported as IntrospectionIssue instead.
class IntrospectionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Raised from sampleRows when the query fails or is cancelled.
class SamplingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A live connection to one database. Implementations own their native handle
// and release it in the destructor. A connection is used by one thread at a
// time.
class IDatabaseConnection {
public:
  virtual ~IDatabaseConnection() = default;

  virtual EngineKind engine() const = 0;

  virtual std::vector<TableDescriptor>
  introspect(std::vector<IntrospectionIssue> &issues) = 0;

  // Returns up to limit rows of table. NULL cells are omitted from the row.
  // cancel is polled between rows; when it becomes true sampling stops and
  // the rows read so far are returned.
  virtual std::vector<SampledRow>
  sampleRows(const TableDescriptor &table, size_t limit,
             const std::atomic<bool> &cancel) = 0;
};

#endif
