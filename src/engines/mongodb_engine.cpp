#include "engines/mongodb_engine.h"
#include "core/logger.h"
#include "core/scan_config.h"
#include <mutex>
#include <set>

namespace {
struct MongoUriDeleter {
  void operator()(mongoc_uri_t *uri) const {
    if (uri)
      mongoc_uri_destroy(uri);
  }
};

using MongoUriPtr = std::unique_ptr<mongoc_uri_t, MongoUriDeleter>;

std::string bsonTypeName(bson_type_t type) {
  switch (type) {
  case BSON_TYPE_UTF8:
    return "string";
  case BSON_TYPE_INT32:
    return "int";
  case BSON_TYPE_INT64:
    return "long";
  case BSON_TYPE_DOUBLE:
    return "double";
  case BSON_TYPE_DECIMAL128:
    return "decimal";
  case BSON_TYPE_BOOL:
    return "bool";
  case BSON_TYPE_DATE_TIME:
    return "date";
  case BSON_TYPE_OID:
    return "objectId";
  case BSON_TYPE_DOCUMENT:
    return "object";
  case BSON_TYPE_ARRAY:
    return "array";
  case BSON_TYPE_BINARY:
    return "binData";
  case BSON_TYPE_NULL:
    return "null";
  default:
    return "unknown";
  }
}

// Renders a top-level value as text for the detectors. Embedded documents
// and arrays become relaxed extended JSON so nested strings are still seen.
// Returns false for values that carry no text (null, binary, min/max keys).
bool bsonValueToString(const bson_iter_t *iter, std::string &out) {
  switch (bson_iter_type(iter)) {
  case BSON_TYPE_UTF8: {
    uint32_t len = 0;
    const char *str = bson_iter_utf8(iter, &len);
    out.assign(str, len);
    return true;
  }
  case BSON_TYPE_INT32:
    out = std::to_string(bson_iter_int32(iter));
    return true;
  case BSON_TYPE_INT64:
    out = std::to_string(bson_iter_int64(iter));
    return true;
  case BSON_TYPE_DOUBLE:
    out = std::to_string(bson_iter_double(iter));
    return true;
  case BSON_TYPE_BOOL:
    out = bson_iter_bool(iter) ? "true" : "false";
    return true;
  case BSON_TYPE_OID: {
    char oid[25];
    bson_oid_to_string(bson_iter_oid(iter), oid);
    out = oid;
    return true;
  }
  case BSON_TYPE_DOCUMENT:
  case BSON_TYPE_ARRAY: {
    const uint8_t *data = nullptr;
    uint32_t len = 0;
    if (bson_iter_type(iter) == BSON_TYPE_DOCUMENT)
      bson_iter_document(iter, &len, &data);
    else
      bson_iter_array(iter, &len, &data);
    bson_t sub;
    if (!data || !bson_init_static(&sub, data, len))
      return false;
    char *json = bson_as_relaxed_extended_json(&sub, nullptr);
    if (!json)
      return false;
    out = json;
    bson_free(json);
    return true;
  }
  default:
    return false;
  }
}
} // namespace

MongoDBConnection::MongoDBConnection(const ConnectionParameters &params)
    : databaseName_(params.database),
      queryTimeoutSeconds_(params.queryTimeoutSeconds) {
  static std::once_flag initFlag;
  std::call_once(initFlag, []() { mongoc_init(); });

  MongoUriPtr uri(mongoc_uri_new_for_host_port(
      params.host.c_str(), static_cast<uint16_t>(params.effectivePort())));
  if (!uri) {
    throw ConnectionError(EngineKind::MONGODB,
                          "invalid host or port: " + params.host);
  }

  if (!params.user.empty()) {
    mongoc_uri_set_username(uri.get(), params.user.c_str());
    mongoc_uri_set_password(uri.get(), params.password.c_str());
  }
  mongoc_uri_set_database(uri.get(), databaseName_.c_str());

  int32_t connectMs = params.connectTimeoutSeconds * 1000;
  mongoc_uri_set_option_as_int32(uri.get(), MONGOC_URI_CONNECTTIMEOUTMS,
                                 connectMs);
  mongoc_uri_set_option_as_int32(uri.get(),
                                 MONGOC_URI_SERVERSELECTIONTIMEOUTMS,
                                 connectMs);
  mongoc_uri_set_option_as_int32(uri.get(), MONGOC_URI_SOCKETTIMEOUTMS,
                                 queryTimeoutSeconds_ * 1000);

  if (params.tlsEnabled()) {
    const TlsSettings &tls = *params.tls;
    mongoc_uri_set_option_as_bool(uri.get(), MONGOC_URI_TLS, true);
    if (!tls.caFile.empty())
      mongoc_uri_set_option_as_utf8(uri.get(), MONGOC_URI_TLSCAFILE,
                                    tls.caFile.c_str());
    if (!tls.certFile.empty())
      mongoc_uri_set_option_as_utf8(uri.get(),
                                    MONGOC_URI_TLSCERTIFICATEKEYFILE,
                                    tls.certFile.c_str());
    if (!tls.verifyPeer)
      mongoc_uri_set_option_as_bool(
          uri.get(), MONGOC_URI_TLSALLOWINVALIDCERTIFICATES, true);
  }

  bson_error_t error;
  client_.reset(mongoc_client_new_from_uri_with_error(uri.get(), &error));
  if (!client_) {
    throw ConnectionError(EngineKind::MONGODB, error.message);
  }
  mongoc_client_set_appname(client_.get(), "intelliscan");

  BsonPtr ping(BCON_NEW("ping", BCON_INT32(1)));
  if (!mongoc_client_command_simple(client_.get(), databaseName_.c_str(),
                                    ping.get(), nullptr, nullptr, &error)) {
    throw ConnectionError(EngineKind::MONGODB,
                          "ping failed: " + std::string(error.message));
  }
}

MongoCursorPtr MongoDBConnection::findDocuments(mongoc_collection_t *coll,
                                                size_t limit) {
  BsonPtr filter(bson_new());
  BsonPtr opts(BCON_NEW("limit", BCON_INT64(static_cast<int64_t>(limit)),
                        "maxTimeMS",
                        BCON_INT64(static_cast<int64_t>(queryTimeoutSeconds_) *
                                   1000)));
  return MongoCursorPtr(
      mongoc_collection_find_with_opts(coll, filter.get(), opts.get(), nullptr));
}

std::vector<TableDescriptor>
MongoDBConnection::introspect(std::vector<IntrospectionIssue> &issues) {
  std::vector<std::string> names;
  {
    mongoc_database_t *db =
        mongoc_client_get_database(client_.get(), databaseName_.c_str());
    bson_error_t error;
    char **collectionNames =
        mongoc_database_get_collection_names_with_opts(db, nullptr, &error);
    mongoc_database_destroy(db);

    if (!collectionNames) {
      throw IntrospectionError("MongoDB could not list collections: " +
                               std::string(error.message));
    }
    for (size_t i = 0; collectionNames[i]; i++) {
      std::string name = collectionNames[i];
      if (name.rfind("system.", 0) == 0)
        continue;
      names.push_back(name);
    }
    bson_strfreev(collectionNames);
  }

  size_t sampleDocs = ScanConfig::getSchemaSampleDocuments();
  std::vector<TableDescriptor> tables;
  for (const auto &name : names) {
    MongoCollectionPtr coll(mongoc_client_get_collection(
        client_.get(), databaseName_.c_str(), name.c_str()));

    TableDescriptor table;
    table.schema = databaseName_;
    table.name = name;

    bson_error_t error;
    int64_t count = mongoc_collection_estimated_document_count(
        coll.get(), nullptr, nullptr, nullptr, &error);
    if (count < 0) {
      Logger::warning(LogCategory::SCHEMA, "MongoDBConnection",
                      "Skipping " + table.qualifiedName() + ": " +
                          error.message);
      issues.push_back({table.qualifiedName(), error.message});
      continue;
    }
    table.estimatedRows = count;

    std::set<std::string> seen;
    MongoCursorPtr cursor = findDocuments(coll.get(), sampleDocs);
    const bson_t *doc;
    while (mongoc_cursor_next(cursor.get(), &doc)) {
      bson_iter_t iter;
      if (!bson_iter_init(&iter, doc))
        continue;
      while (bson_iter_next(&iter)) {
        std::string key = bson_iter_key(&iter);
        if (seen.insert(key).second) {
          table.columns.push_back({key, bsonTypeName(bson_iter_type(&iter))});
        }
      }
    }
    if (mongoc_cursor_error(cursor.get(), &error)) {
      Logger::warning(LogCategory::SCHEMA, "MongoDBConnection",
                      "Skipping " + table.qualifiedName() + ": " +
                          error.message);
      issues.push_back({table.qualifiedName(), error.message});
      continue;
    }
    tables.push_back(std::move(table));
  }
  return tables;
}

std::vector<SampledRow>
MongoDBConnection::sampleRows(const TableDescriptor &table, size_t limit,
                              const std::atomic<bool> &cancel) {
  MongoCollectionPtr coll(mongoc_client_get_collection(
      client_.get(), databaseName_.c_str(), table.name.c_str()));
  MongoCursorPtr cursor = findDocuments(coll.get(), limit);

  std::vector<SampledRow> rows;
  const bson_t *doc;
  while (!cancel.load() && mongoc_cursor_next(cursor.get(), &doc)) {
    SampledRow sampled;
    bson_iter_t iter;
    if (bson_iter_init(&iter, doc)) {
      while (bson_iter_next(&iter)) {
        std::string value;
        if (bsonValueToString(&iter, value))
          sampled.push_back({bson_iter_key(&iter), std::move(value)});
      }
    }
    rows.push_back(std::move(sampled));
  }

  bson_error_t error;
  if (mongoc_cursor_error(cursor.get(), &error)) {
    throw SamplingError("MongoDB sampling of " + table.qualifiedName() +
                        " failed: " + error.message);
  }
  return rows;
}
