#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/oid.hpp>
#include "options/consistency.hpp"
#include "store/store_error.hpp"

namespace gridstore {
namespace store {

// Settings forwarded with every read round trip
struct QueryOptions {
  std::optional<bsoncxx::document::value> projection;
  std::optional<bsoncxx::document::value> sort;
  std::optional<std::int64_t> limit;
  std::optional<std::int64_t> skip;
  std::optional<std::int32_t> batch_size;
  std::optional<std::chrono::milliseconds> max_time;
  std::optional<bool> allow_disk_use;
  std::optional<bool> no_cursor_timeout;
  std::optional<options::ReadConcern> read_concern;
  std::optional<options::ReadPreference> read_preference;
};

// Settings forwarded with every write round trip
struct WriteOptions {
  std::optional<options::WriteConcern> write_concern;
};

struct UpdateResult {
  std::int64_t matched_count = 0;
  std::int64_t modified_count = 0;
};

// Forward-only, single-pass sequence of documents produced by a query.
// next() may block while the next batch is fetched from the store.
class Cursor {
public:
  virtual ~Cursor() = default;

  // Returns the next document, or nullopt once the cursor is exhausted
  virtual std::optional<bsoncxx::document::value> next() = 0;
};

// Minimal collection interface consumed by the bucket
class Collection {
public:
  virtual ~Collection() = default;

  // ---- IDENTITY ----
  virtual const std::string& name() const = 0;


  // ---- WRITES ----
  // Inserts a document and returns its store-generated _id
  virtual bsoncxx::oid insert_one(bsoncxx::document::view document,
                                  const WriteOptions& options) = 0;
  virtual UpdateResult update_one(bsoncxx::document::view filter,
                                  bsoncxx::document::view update,
                                  const WriteOptions& options) = 0;
  // Both return the number of deleted documents
  virtual std::int64_t delete_one(bsoncxx::document::view filter,
                                  const WriteOptions& options) = 0;
  virtual std::int64_t delete_many(bsoncxx::document::view filter,
                                   const WriteOptions& options) = 0;


  // ---- READS ----
  virtual std::optional<bsoncxx::document::value> find_one(bsoncxx::document::view filter,
                                                           const QueryOptions& options) = 0;
  virtual std::unique_ptr<Cursor> find(bsoncxx::document::view filter,
                                       const QueryOptions& options) = 0;


  // ---- INDEXES AND LIFECYCLE ----
  // Returns the index descriptions ({name, key, ...}) of the collection
  virtual std::vector<bsoncxx::document::value> list_indexes() = 0;
  // Creating an index identical to an existing one is a no-op
  virtual void create_index(bsoncxx::document::view keys, const std::string& index_name) = 0;
  // Dropping a collection that does not exist is a no-op
  virtual void drop(const WriteOptions& options) = 0;
};

// Database handle that owns the collections of a bucket
class Database {
public:
  virtual ~Database() = default;

  virtual std::unique_ptr<Collection> collection(const std::string& name) = 0;
  virtual std::vector<std::string> list_collection_names(bsoncxx::document::view filter) = 0;
  virtual void create_collection(const std::string& name) = 0;
};

} // namespace store
} // namespace gridstore
