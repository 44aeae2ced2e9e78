#ifndef ENGINE_FACTORY_H
#define ENGINE_FACTORY_H

#include "engines/database_engine.h"
#include <functional>
#include <memory>

using ConnectionOpener =
    std::function<std::unique_ptr<IDatabaseConnection>(const ConnectionParameters &)>;

namespace EngineFactory {
// Opens a live connection for params.engine. Throws ConnectionError when the
// engine cannot be reached or authenticated. Does not retry.
std::unique_ptr<IDatabaseConnection> open(const ConnectionParameters &params);
} // namespace EngineFactory

#endif
