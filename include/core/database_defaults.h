#ifndef DATABASE_DEFAULTS_H
#define DATABASE_DEFAULTS_H

#include <cstddef>

namespace DatabaseDefaults {
constexpr int DEFAULT_POSTGRES_PORT = 5432;
constexpr int DEFAULT_MYSQL_PORT = 3306;
constexpr int DEFAULT_MONGODB_PORT = 27017;
constexpr int DEFAULT_REDIS_PORT = 6379;
constexpr int DEFAULT_MSSQL_PORT = 1433;
constexpr int BUFFER_SIZE = 1024;

constexpr const char *MSSQL_ODBC_DRIVER = "ODBC Driver 18 for SQL Server";

// COUNT hint passed to each Redis SCAN call.
constexpr size_t REDIS_SCAN_BATCH = 500;

// Largest cell value handed to detectors. Longer values are truncated.
constexpr size_t MAX_CELL_LENGTH = 4096;

} // namespace DatabaseDefaults

#endif
