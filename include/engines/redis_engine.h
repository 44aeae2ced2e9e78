#ifndef REDIS_ENGINE_H
#define REDIS_ENGINE_H

#include "engines/database_engine.h"
#include <hiredis/hiredis.h>
#include <hiredis/hiredis_ssl.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct RedisContextDeleter {
  void operator()(redisContext *ctx) const {
    if (ctx)
      redisFree(ctx);
  }
};

struct RedisReplyDeleter {
  void operator()(redisReply *reply) const {
    if (reply)
      freeReplyObject(reply);
  }
};

struct RedisSSLContextDeleter {
  void operator()(redisSSLContext *ssl) const {
    if (ssl)
      redisFreeSSLContext(ssl);
  }
};

using RedisContextPtr = std::unique_ptr<redisContext, RedisContextDeleter>;
using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;
using RedisSSLContextPtr =
    std::unique_ptr<redisSSLContext, RedisSSLContextDeleter>;

// Key-spaces stand in for tables: "user:42" and "user:43" both belong to
// the "user" key-space. Keys without a ':' are grouped under "(root)".
class RedisConnection : public IDatabaseConnection {
  // Declared before ctx_ so it is destroyed after the connection using it.
  RedisSSLContextPtr ssl_;
  RedisContextPtr ctx_;
  int databaseIndex_ = 0;

public:
  static constexpr const char *ROOT_KEYSPACE = "(root)";

  explicit RedisConnection(const ConnectionParameters &params);

  EngineKind engine() const override { return EngineKind::REDIS; }

  std::vector<TableDescriptor>
  introspect(std::vector<IntrospectionIssue> &issues) override;

  std::vector<SampledRow> sampleRows(const TableDescriptor &table,
                                     size_t limit,
                                     const std::atomic<bool> &cancel) override;

  static std::string keyspaceOf(const std::string &key);

  // Parses the database field as a numeric index. Throws ConnectionError
  // for anything that is not a non-negative int.
  static int parseDatabaseIndex(const std::string &database);

private:
  RedisReplyPtr command(const std::vector<std::string> &argv);
  std::vector<std::string> scanKeys(const std::string &keyspace, size_t limit,
                                    const std::atomic<bool> *cancel);
  SampledRow readKey(const std::string &key);
};

#endif
