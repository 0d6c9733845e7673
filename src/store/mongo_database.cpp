#include "store/mongo_database.hpp"
#include <utility>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/builder/concatenate.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/delete.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/insert.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/read_concern.hpp>
#include <mongocxx/read_preference.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/write_concern.hpp>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace store {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

//==============================================
// ERROR TRANSLATION
//==============================================

// Runs a driver call and rethrows driver failures as StoreError
template <typename Operation>
auto guarded(const std::string& what, Operation&& operation) -> decltype(operation()) {
  try {
    return operation();
  }
  catch (const mongocxx::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Mongo store: " << what << " failed: " << e.what();
    throw StoreError(what + ": " + e.what(), e.code());
  }
  catch (const bsoncxx::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Mongo store: " << what << " failed: " << e.what();
    throw StoreError(what + ": " + e.what(), e.code());
  }
}

//==============================================
// CONSISTENCY KNOBS
//==============================================

mongocxx::write_concern to_mongo(const options::WriteConcern& concern) {
  mongocxx::write_concern result;

  switch (concern.level) {
    case options::WriteConcern::Level::Unacknowledged:
      result.acknowledge_level(mongocxx::write_concern::level::k_unacknowledged);
      break;
    case options::WriteConcern::Level::Acknowledged:
      result.acknowledge_level(mongocxx::write_concern::level::k_acknowledged);
      if (concern.nodes) {
        result.nodes(*concern.nodes);
      }
      break;
    case options::WriteConcern::Level::Majority:
      result.acknowledge_level(mongocxx::write_concern::level::k_majority);
      break;
    case options::WriteConcern::Level::Default:
      result.acknowledge_level(mongocxx::write_concern::level::k_default);
      break;
  }

  if (concern.journal) {
    result.journal(*concern.journal);
  }
  if (concern.timeout) {
    result.timeout(*concern.timeout);
  }
  return result;
}

mongocxx::read_concern to_mongo(options::ReadConcern concern) {
  mongocxx::read_concern result;

  switch (concern) {
    case options::ReadConcern::Local:
      result.acknowledge_level(mongocxx::read_concern::level::k_local);
      break;
    case options::ReadConcern::Available:
      result.acknowledge_level(mongocxx::read_concern::level::k_available);
      break;
    case options::ReadConcern::Majority:
      result.acknowledge_level(mongocxx::read_concern::level::k_majority);
      break;
    case options::ReadConcern::Linearizable:
      result.acknowledge_level(mongocxx::read_concern::level::k_linearizable);
      break;
    case options::ReadConcern::Snapshot:
      result.acknowledge_level(mongocxx::read_concern::level::k_snapshot);
      break;
  }
  return result;
}

mongocxx::read_preference to_mongo(options::ReadPreference preference) {
  mongocxx::read_preference result;

  switch (preference) {
    case options::ReadPreference::Primary:
      result.mode(mongocxx::read_preference::read_mode::k_primary);
      break;
    case options::ReadPreference::PrimaryPreferred:
      result.mode(mongocxx::read_preference::read_mode::k_primary_preferred);
      break;
    case options::ReadPreference::Secondary:
      result.mode(mongocxx::read_preference::read_mode::k_secondary);
      break;
    case options::ReadPreference::SecondaryPreferred:
      result.mode(mongocxx::read_preference::read_mode::k_secondary_preferred);
      break;
    case options::ReadPreference::Nearest:
      result.mode(mongocxx::read_preference::read_mode::k_nearest);
      break;
  }
  return result;
}

mongocxx::options::find to_mongo_find(const QueryOptions& options) {
  mongocxx::options::find result;

  if (options.projection) result.projection(options.projection->view());
  if (options.sort) result.sort(options.sort->view());
  if (options.limit) result.limit(*options.limit);
  if (options.skip) result.skip(*options.skip);
  if (options.batch_size) result.batch_size(*options.batch_size);
  if (options.max_time) result.max_time(*options.max_time);
  if (options.allow_disk_use) result.allow_disk_use(*options.allow_disk_use);
  if (options.no_cursor_timeout) result.no_cursor_timeout(*options.no_cursor_timeout);
  if (options.read_preference) result.read_preference(to_mongo(*options.read_preference));

  return result;
}

} // namespace

//==============================================
// CURSOR
//==============================================

MongoCursor::MongoCursor(mongocxx::cursor cursor) : cursor_(std::move(cursor)) {}

std::optional<bsoncxx::document::value> MongoCursor::next() {
  return guarded("cursor next", [this]() -> std::optional<bsoncxx::document::value> {
    // The first call runs the query, later calls advance
    if (!position_) {
      position_.emplace(cursor_.begin());
    } else if (*position_ != cursor_.end()) {
      ++(*position_);
    }

    if (*position_ == cursor_.end()) {
      return std::nullopt;
    }
    return bsoncxx::document::value(**position_);
  });
}

//==============================================
// COLLECTION
//==============================================

MongoCollection::MongoCollection(mongocxx::collection collection)
  : collection_(std::move(collection)) {
  auto name = collection_.name();
  name_.assign(name.data(), name.size());
}

mongocxx::collection MongoCollection::for_read(const QueryOptions& options) const {
  mongocxx::collection copy = collection_;
  if (options.read_concern) {
    copy.read_concern(to_mongo(*options.read_concern));
  }
  return copy;
}

bsoncxx::oid MongoCollection::insert_one(bsoncxx::document::view document, const WriteOptions& options) {
  mongocxx::options::insert insert_options;
  if (options.write_concern) {
    insert_options.write_concern(to_mongo(*options.write_concern));
  }

  // Generate the id here so it is known even for unacknowledged writes
  auto id_element = document["_id"];
  if (id_element && id_element.type() == bsoncxx::type::k_oid) {
    const bsoncxx::oid id = id_element.get_oid().value;
    guarded("insert_one on " + name_, [&]() { return collection_.insert_one(document, insert_options); });
    return id;
  }

  const bsoncxx::oid id;
  bsoncxx::builder::basic::document with_id;
  with_id.append(kvp("_id", id));
  with_id.append(bsoncxx::builder::concatenate(document));

  guarded("insert_one on " + name_, [&]() { return collection_.insert_one(with_id.view(), insert_options); });
  return id;
}

UpdateResult MongoCollection::update_one(bsoncxx::document::view filter, bsoncxx::document::view update,
                                         const WriteOptions& options) {
  mongocxx::options::update update_options;
  if (options.write_concern) {
    update_options.write_concern(to_mongo(*options.write_concern));
  }

  auto result = guarded("update_one on " + name_, [&]() {
    return collection_.update_one(filter, update, update_options);
  });

  UpdateResult update_result;
  if (result) {
    update_result.matched_count = result->matched_count();
    update_result.modified_count = result->modified_count();
  }
  return update_result;
}

std::int64_t MongoCollection::delete_one(bsoncxx::document::view filter, const WriteOptions& options) {
  mongocxx::options::delete_options delete_options;
  if (options.write_concern) {
    delete_options.write_concern(to_mongo(*options.write_concern));
  }

  auto result = guarded("delete_one on " + name_, [&]() {
    return collection_.delete_one(filter, delete_options);
  });
  return result ? result->deleted_count() : 0;
}

std::int64_t MongoCollection::delete_many(bsoncxx::document::view filter, const WriteOptions& options) {
  mongocxx::options::delete_options delete_options;
  if (options.write_concern) {
    delete_options.write_concern(to_mongo(*options.write_concern));
  }

  auto result = guarded("delete_many on " + name_, [&]() {
    return collection_.delete_many(filter, delete_options);
  });
  return result ? result->deleted_count() : 0;
}

std::optional<bsoncxx::document::value> MongoCollection::find_one(bsoncxx::document::view filter,
                                                                  const QueryOptions& options) {
  return guarded("find_one on " + name_, [&]() -> std::optional<bsoncxx::document::value> {
    auto result = for_read(options).find_one(filter, to_mongo_find(options));
    if (!result) {
      return std::nullopt;
    }
    return bsoncxx::document::value(result->view());
  });
}

std::unique_ptr<Cursor> MongoCollection::find(bsoncxx::document::view filter, const QueryOptions& options) {
  return guarded("find on " + name_, [&]() -> std::unique_ptr<Cursor> {
    return std::make_unique<MongoCursor>(for_read(options).find(filter, to_mongo_find(options)));
  });
}

std::vector<bsoncxx::document::value> MongoCollection::list_indexes() {
  return guarded("list_indexes on " + name_, [&]() {
    std::vector<bsoncxx::document::value> indexes;
    auto cursor = collection_.list_indexes();
    for (const auto& index : cursor) {
      indexes.emplace_back(index);
    }
    return indexes;
  });
}

void MongoCollection::create_index(bsoncxx::document::view keys, const std::string& index_name) {
  guarded("create_index on " + name_, [&]() {
    return collection_.create_index(keys, make_document(kvp("name", index_name)));
  });
}

void MongoCollection::drop(const WriteOptions& options) {
  // The driver ignores "ns not found", so dropping an absent collection succeeds
  guarded("drop " + name_, [&]() {
    if (options.write_concern) {
      collection_.drop(to_mongo(*options.write_concern));
    } else {
      collection_.drop();
    }
  });
}

//==============================================
// DATABASE
//==============================================

MongoDatabase::MongoDatabase(const std::string& uri, const std::string& database_name)
  : client_(guarded("connect", [&]() { return mongocxx::client{mongocxx::uri{uri}}; }))
  , database_(client_[database_name])
  , name_(database_name) {
  BOOST_LOG_TRIVIAL(info) << "Mongo store: Using database " << database_name;
}

std::unique_ptr<Collection> MongoDatabase::collection(const std::string& name) {
  return std::make_unique<MongoCollection>(database_[name]);
}

std::vector<std::string> MongoDatabase::list_collection_names(bsoncxx::document::view filter) {
  return guarded("list_collection_names", [&]() {
    return database_.list_collection_names(filter);
  });
}

void MongoDatabase::create_collection(const std::string& name) {
  guarded("create_collection " + name, [&]() {
    return database_.create_collection(name);
  });
}

} // namespace store
} // namespace gridstore
