#ifndef CONNECTION_UTILS_H
#define CONNECTION_UTILS_H

#include "engines/connection_params.h"
#include <optional>
#include <string>
#include <string_view>

class ConnectionStringParser {
public:
  static std::optional<ConnectionParameters> parse(std::string_view connStr);

  // SQLite needs a file; every other engine needs a host, and all but Redis
  // a database name.
  static bool hasRequiredFields(const ConnectionParameters &params);
};

#endif
