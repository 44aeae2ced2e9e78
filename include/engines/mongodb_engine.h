#ifndef MONGODB_ENGINE_H
#define MONGODB_ENGINE_H

#include "engines/database_engine.h"
#include <bson/bson.h>
#include <memory>
#include <mongoc/mongoc.h>
#include <string>
#include <vector>

struct MongoClientDeleter {
  void operator()(mongoc_client_t *client) const {
    if (client)
      mongoc_client_destroy(client);
  }
};

struct MongoCollectionDeleter {
  void operator()(mongoc_collection_t *coll) const {
    if (coll)
      mongoc_collection_destroy(coll);
  }
};

struct MongoCursorDeleter {
  void operator()(mongoc_cursor_t *cursor) const {
    if (cursor)
      mongoc_cursor_destroy(cursor);
  }
};

struct BsonDeleter {
  void operator()(bson_t *doc) const {
    if (doc)
      bson_destroy(doc);
  }
};

using MongoClientPtr = std::unique_ptr<mongoc_client_t, MongoClientDeleter>;
using MongoCollectionPtr =
    std::unique_ptr<mongoc_collection_t, MongoCollectionDeleter>;
using MongoCursorPtr = std::unique_ptr<mongoc_cursor_t, MongoCursorDeleter>;
using BsonPtr = std::unique_ptr<bson_t, BsonDeleter>;

// Collections stand in for tables. Columns are the union of the top-level
// field names found in a few sampled documents.
class MongoDBConnection : public IDatabaseConnection {
  MongoClientPtr client_;
  std::string databaseName_;
  int queryTimeoutSeconds_;

public:
  explicit MongoDBConnection(const ConnectionParameters &params);

  EngineKind engine() const override { return EngineKind::MONGODB; }

  std::vector<TableDescriptor>
  introspect(std::vector<IntrospectionIssue> &issues) override;

  std::vector<SampledRow> sampleRows(const TableDescriptor &table,
                                     size_t limit,
                                     const std::atomic<bool> &cancel) override;

private:
  MongoCursorPtr findDocuments(mongoc_collection_t *coll, size_t limit);
};

#endif
