#ifndef GRIDSTORE_STORE_MONGO_DATABASE_HPP
#define GRIDSTORE_STORE_MONGO_DATABASE_HPP

#include <memory>
#include <string>
#include <vector>
#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/cursor.hpp>
#include <mongocxx/database.hpp>
#include "store/store.hpp"

namespace gridstore {
namespace store {

// Cursor over a mongocxx query result
class MongoCursor : public Cursor {
public:
  explicit MongoCursor(mongocxx::cursor cursor);

  std::optional<bsoncxx::document::value> next() override;

private:
  mongocxx::cursor cursor_;
  std::optional<mongocxx::cursor::iterator> position_;
};

class MongoCollection : public Collection {
public:
  explicit MongoCollection(mongocxx::collection collection);

  const std::string& name() const override { return name_; }

  bsoncxx::oid insert_one(bsoncxx::document::view document, const WriteOptions& options) override;
  UpdateResult update_one(bsoncxx::document::view filter, bsoncxx::document::view update,
                          const WriteOptions& options) override;
  std::int64_t delete_one(bsoncxx::document::view filter, const WriteOptions& options) override;
  std::int64_t delete_many(bsoncxx::document::view filter, const WriteOptions& options) override;

  std::optional<bsoncxx::document::value> find_one(bsoncxx::document::view filter,
                                                   const QueryOptions& options) override;
  std::unique_ptr<Cursor> find(bsoncxx::document::view filter, const QueryOptions& options) override;

  std::vector<bsoncxx::document::value> list_indexes() override;
  void create_index(bsoncxx::document::view keys, const std::string& index_name) override;
  void drop(const WriteOptions& options) override;

private:
  mongocxx::collection collection_;
  std::string name_;

  // Copy of the collection carrying the requested read concern
  mongocxx::collection for_read(const QueryOptions& options) const;
};

// Database backed by a MongoDB deployment. Owns the client connection.
class MongoDatabase : public Database {
public:
  MongoDatabase(const std::string& uri, const std::string& database_name);

  std::unique_ptr<Collection> collection(const std::string& name) override;
  std::vector<std::string> list_collection_names(bsoncxx::document::view filter) override;
  void create_collection(const std::string& name) override;

  const std::string& name() const { return name_; }

private:
  mongocxx::client client_;
  mongocxx::database database_;
  std::string name_;
};

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_MONGO_DATABASE_HPP
