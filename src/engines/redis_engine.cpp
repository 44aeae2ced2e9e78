#include "engines/redis_engine.h"
#include "core/database_defaults.h"
#include "core/logger.h"
#include "core/scan_config.h"
#include "utils/string_utils.h"
#include <mutex>
#include <set>
#include <stdexcept>
#include <sys/time.h>

namespace {
// Escapes glob metacharacters so a key-space prefix matches literally.
std::string escapeGlob(const std::string &prefix) {
  std::string out;
  for (char c : prefix) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\')
      out += '\\';
    out += c;
  }
  return out;
}

std::string replyString(const redisReply *reply) {
  if (!reply)
    return "";
  if (reply->type == REDIS_REPLY_STRING || reply->type == REDIS_REPLY_STATUS ||
      reply->type == REDIS_REPLY_ERROR)
    return std::string(reply->str, reply->len);
  if (reply->type == REDIS_REPLY_INTEGER)
    return std::to_string(reply->integer);
  return "";
}
} // namespace

int RedisConnection::parseDatabaseIndex(const std::string &database) {
  if (database.empty()) {
    return 0;
  }
  if (!StringUtils::isAllDigits(database)) {
    throw ConnectionError(EngineKind::REDIS,
                          "database must be a numeric index, got '" +
                              database + "'");
  }
  try {
    return std::stoi(database);
  } catch (const std::out_of_range &) {
    throw ConnectionError(EngineKind::REDIS,
                          "database index out of range: " + database);
  }
}

RedisConnection::RedisConnection(const ConnectionParameters &params) {
  databaseIndex_ = parseDatabaseIndex(params.database);

  struct timeval connectTimeout;
  connectTimeout.tv_sec = params.connectTimeoutSeconds;
  connectTimeout.tv_usec = 0;
  ctx_.reset(redisConnectWithTimeout(params.host.c_str(),
                                     params.effectivePort(), connectTimeout));
  if (!ctx_) {
    throw ConnectionError(EngineKind::REDIS, "could not allocate context");
  }
  if (ctx_->err) {
    throw ConnectionError(EngineKind::REDIS, ctx_->errstr);
  }

  if (params.tlsEnabled()) {
    static std::once_flag sslInitFlag;
    std::call_once(sslInitFlag, []() { redisInitOpenSSL(); });

    const TlsSettings &tls = *params.tls;
    redisSSLOptions options = {};
    options.cacert_filename = tls.caFile.empty() ? nullptr : tls.caFile.c_str();
    options.cert_filename =
        tls.certFile.empty() ? nullptr : tls.certFile.c_str();
    options.private_key_filename =
        tls.keyFile.empty() ? nullptr : tls.keyFile.c_str();
    options.server_name = params.host.c_str();
    options.verify_mode =
        tls.verifyPeer ? REDIS_SSL_VERIFY_PEER : REDIS_SSL_VERIFY_NONE;

    redisSSLContextError sslError = REDIS_SSL_CTX_NONE;
    ssl_.reset(redisCreateSSLContextWithOptions(&options, &sslError));
    if (!ssl_) {
      throw ConnectionError(EngineKind::REDIS,
                            std::string("TLS context: ") +
                                redisSSLContextGetError(sslError));
    }
    if (redisInitiateSSLWithContext(ctx_.get(), ssl_.get()) != REDIS_OK) {
      throw ConnectionError(EngineKind::REDIS,
                            std::string("TLS handshake: ") + ctx_->errstr);
    }
  }

  struct timeval commandTimeout;
  commandTimeout.tv_sec = params.queryTimeoutSeconds;
  commandTimeout.tv_usec = 0;
  redisSetTimeout(ctx_.get(), commandTimeout);

  RedisReplyPtr reply;
  if (!params.password.empty()) {
    if (params.user.empty())
      reply = command({"AUTH", params.password});
    else
      reply = command({"AUTH", params.user, params.password});
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      throw ConnectionError(EngineKind::REDIS,
                            "AUTH failed: " + replyString(reply.get()));
    }
  }

  if (databaseIndex_ != 0) {
    reply = command({"SELECT", std::to_string(databaseIndex_)});
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      throw ConnectionError(EngineKind::REDIS,
                            "SELECT failed: " + replyString(reply.get()));
    }
  }

  reply = command({"PING"});
  if (!reply || reply->type == REDIS_REPLY_ERROR) {
    throw ConnectionError(EngineKind::REDIS,
                          reply ? replyString(reply.get()) : ctx_->errstr);
  }
}

std::string RedisConnection::keyspaceOf(const std::string &key) {
  size_t colon = key.find(':');
  if (colon == std::string::npos || colon == 0)
    return ROOT_KEYSPACE;
  return key.substr(0, colon);
}

// Runs one command with binary-safe arguments. Returns nullptr when the
// connection itself failed; server errors come back as REDIS_REPLY_ERROR.
RedisReplyPtr RedisConnection::command(const std::vector<std::string> &argv) {
  std::vector<const char *> args;
  std::vector<size_t> lens;
  args.reserve(argv.size());
  lens.reserve(argv.size());
  for (const auto &arg : argv) {
    args.push_back(arg.data());
    lens.push_back(arg.size());
  }
  void *raw = redisCommandArgv(ctx_.get(), static_cast<int>(args.size()),
                               args.data(), lens.data());
  return RedisReplyPtr(static_cast<redisReply *>(raw));
}

// Iterates SCAN until the cursor wraps or limit keys have been collected.
// An empty keyspace means every key; ROOT_KEYSPACE keeps only keys without
// a prefix.
std::vector<std::string>
RedisConnection::scanKeys(const std::string &keyspace, size_t limit,
                          const std::atomic<bool> *cancel) {
  std::vector<std::string> keys;
  std::string pattern = "*";
  if (!keyspace.empty() && keyspace != ROOT_KEYSPACE)
    pattern = escapeGlob(keyspace) + ":*";

  std::string cursor = "0";
  do {
    if (cancel && cancel->load())
      break;
    RedisReplyPtr reply =
        command({"SCAN", cursor, "MATCH", pattern, "COUNT",
                 std::to_string(DatabaseDefaults::REDIS_SCAN_BATCH)});
    if (!reply) {
      throw std::runtime_error(std::string("SCAN failed: ") + ctx_->errstr);
    }
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
      throw std::runtime_error("SCAN failed: " + replyString(reply.get()));
    }
    cursor = replyString(reply->element[0]);
    const redisReply *batch = reply->element[1];
    for (size_t i = 0; i < batch->elements && keys.size() < limit; ++i) {
      std::string key = replyString(batch->element[i]);
      if (keyspace == ROOT_KEYSPACE && keyspaceOf(key) != ROOT_KEYSPACE)
        continue;
      keys.push_back(std::move(key));
    }
  } while (cursor != "0" && keys.size() < limit);
  return keys;
}

SampledRow RedisConnection::readKey(const std::string &key) {
  SampledRow row;
  RedisReplyPtr type = command({"TYPE", key});
  if (!type) {
    throw std::runtime_error(std::string("TYPE failed: ") + ctx_->errstr);
  }
  std::string kind = replyString(type.get());

  RedisReplyPtr reply;
  if (kind == "string") {
    reply = command({"GET", key});
    if (reply && reply->type == REDIS_REPLY_STRING)
      row.push_back({"value", replyString(reply.get())});
  } else if (kind == "hash") {
    reply = command({"HGETALL", key});
    if (reply && reply->type == REDIS_REPLY_ARRAY) {
      for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        row.push_back({replyString(reply->element[i]),
                       replyString(reply->element[i + 1])});
      }
    }
  } else if (kind == "list" || kind == "set" || kind == "zset") {
    if (kind == "list")
      reply = command({"LRANGE", key, "0", "9"});
    else if (kind == "set")
      reply = command({"SRANDMEMBER", key, "10"});
    else
      reply = command({"ZRANGE", key, "0", "9"});
    if (reply && reply->type == REDIS_REPLY_ARRAY) {
      for (size_t i = 0; i < reply->elements; ++i)
        row.push_back({"value", replyString(reply->element[i])});
    }
  }
  return row;
}

// Groups up to REDIS_KEY_SCAN_LIMIT keys by prefix. The row estimate of a
// key-space is the number of its keys seen during that bounded scan, so it
// undercounts on very large instances. Column names come from the hash
// fields of a few sampled keys, or a single "value" column otherwise.
std::vector<TableDescriptor>
RedisConnection::introspect(std::vector<IntrospectionIssue> &issues) {
  std::vector<std::string> keys;
  try {
    keys = scanKeys("", ScanConfig::getRedisKeyScanLimit(), nullptr);
  } catch (const std::exception &e) {
    throw IntrospectionError("Redis key scan failed: " + std::string(e.what()));
  }

  std::map<std::string, std::vector<std::string>> grouped;
  for (auto &key : keys) {
    grouped[keyspaceOf(key)].push_back(std::move(key));
  }

  size_t sampleKeys = ScanConfig::getSchemaSampleDocuments();
  std::string schema = "db" + std::to_string(databaseIndex_);
  std::vector<TableDescriptor> tables;
  for (const auto &entry : grouped) {
    TableDescriptor table;
    table.schema = schema;
    table.name = entry.first;
    table.estimatedRows = static_cast<int64_t>(entry.second.size());

    std::set<std::string> seen;
    try {
      for (size_t i = 0; i < entry.second.size() && i < sampleKeys; ++i) {
        const std::string &key = entry.second[i];
        RedisReplyPtr type = command({"TYPE", key});
        if (!type)
          throw std::runtime_error(std::string("TYPE failed: ") +
                                   ctx_->errstr);
        std::string kind = replyString(type.get());
        if (kind == "hash") {
          RedisReplyPtr fields = command({"HKEYS", key});
          if (!fields || fields->type != REDIS_REPLY_ARRAY)
            continue;
          for (size_t f = 0; f < fields->elements; ++f) {
            std::string field = replyString(fields->element[f]);
            if (seen.insert(field).second)
              table.columns.push_back({field, "hash-field"});
          }
        } else if (seen.insert("value").second) {
          table.columns.push_back({"value", kind});
        }
      }
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::SCHEMA, "RedisConnection",
                      "Skipping key-space " + table.name + ": " + e.what());
      issues.push_back({table.qualifiedName(), e.what()});
      continue;
    }
    tables.push_back(std::move(table));
  }
  return tables;
}

std::vector<SampledRow>
RedisConnection::sampleRows(const TableDescriptor &table, size_t limit,
                            const std::atomic<bool> &cancel) {
  std::vector<SampledRow> rows;
  try {
    std::vector<std::string> keys = scanKeys(table.name, limit, &cancel);
    for (const auto &key : keys) {
      if (cancel.load())
        break;
      SampledRow row = readKey(key);
      row.push_back({"_key", key});
      rows.push_back(std::move(row));
    }
  } catch (const std::exception &e) {
    throw SamplingError("Redis sampling of " + table.name + " failed: " +
                        e.what());
  }
  return rows;
}
