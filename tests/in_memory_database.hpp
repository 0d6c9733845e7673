#ifndef GRIDSTORE_TESTS_IN_MEMORY_DATABASE_HPP
#define GRIDSTORE_TESTS_IN_MEMORY_DATABASE_HPP

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/builder/concatenate.hpp>
#include <bsoncxx/types.hpp>
#include <bsoncxx/types/bson_value/view.hpp>
#include "store/store.hpp"

namespace gridstore::testing {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

inline std::string key_of(const bsoncxx::document::element& element) {
  auto key = element.key();
  return std::string(key.data(), key.size());
}

// Orders two values of the types used in sort specifications (numbers, strings, dates, ids)
inline int compare_values(const bsoncxx::types::bson_value::view& a,
                          const bsoncxx::types::bson_value::view& b) {
  auto as_number = [](const bsoncxx::types::bson_value::view& v, double& out) {
    switch (v.type()) {
      case bsoncxx::type::k_int32:  out = v.get_int32().value; return true;
      case bsoncxx::type::k_int64:  out = static_cast<double>(v.get_int64().value); return true;
      case bsoncxx::type::k_double: out = v.get_double().value; return true;
      default: return false;
    }
  };

  double x = 0;
  double y = 0;
  if (as_number(a, x) && as_number(b, y)) {
    return x < y ? -1 : (y < x ? 1 : 0);
  }
  if (a.type() != b.type()) {
    return static_cast<int>(a.type()) < static_cast<int>(b.type()) ? -1 : 1;
  }
  switch (a.type()) {
    case bsoncxx::type::k_string: {
      auto l = a.get_string().value;
      auto r = b.get_string().value;
      return std::string(l.data(), l.size()).compare(std::string(r.data(), r.size()));
    }
    case bsoncxx::type::k_date: {
      auto l = a.get_date().to_int64();
      auto r = b.get_date().to_int64();
      return l < r ? -1 : (r < l ? 1 : 0);
    }
    case bsoncxx::type::k_oid: {
      auto l = a.get_oid().value;
      auto r = b.get_oid().value;
      return l < r ? -1 : (r < l ? 1 : 0);
    }
    default:
      return 0;
  }
}

// Top-level equality match, the only filter shape the bucket issues
inline bool matches(bsoncxx::document::view document, bsoncxx::document::view filter) {
  for (const auto& condition : filter) {
    auto field = document[condition.key()];
    if (!field || !(field.get_value() == condition.get_value())) {
      return false;
    }
  }
  return true;
}

struct CollectionData {
  std::vector<bsoncxx::document::value> documents;
  std::vector<bsoncxx::document::value> indexes;
};

// Shared state of the fake: collections, an operation journal and injected failures
struct InMemoryState {
  std::mutex mutex;
  std::map<std::string, CollectionData> collections;
  // Entries look like "fs.chunks:find" or ":create_collection fs.files"
  std::vector<std::string> journal;
  std::set<std::string> failures;

  void record(const std::string& entry) {
    journal.push_back(entry);
    if (failures.count(entry) != 0) {
      throw store::StoreError("Injected failure: " + entry);
    }
  }

  CollectionData& ensure(const std::string& name) {
    auto it = collections.find(name);
    if (it == collections.end()) {
      it = collections.emplace(name, CollectionData{}).first;
      it->second.indexes.push_back(make_document(
        kvp("v", 2), kvp("key", make_document(kvp("_id", 1)).view()), kvp("name", "_id_")));
    }
    return it->second;
  }
};

class InMemoryCursor : public store::Cursor {
public:
  explicit InMemoryCursor(std::vector<bsoncxx::document::value> documents)
    : documents_(std::move(documents)) {}

  std::optional<bsoncxx::document::value> next() override {
    if (position_ >= documents_.size()) {
      return std::nullopt;
    }
    return documents_[position_++];
  }

private:
  std::vector<bsoncxx::document::value> documents_;
  std::size_t position_ = 0;
};

class InMemoryCollection : public store::Collection {
public:
  InMemoryCollection(std::shared_ptr<InMemoryState> state, std::string name)
    : state_(std::move(state)), name_(std::move(name)) {}

  const std::string& name() const override { return name_; }

  bsoncxx::oid insert_one(bsoncxx::document::view document, const store::WriteOptions&) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":insert_one");

    auto id_element = document["_id"];
    if (id_element && id_element.type() == bsoncxx::type::k_oid) {
      state_->ensure(name_).documents.emplace_back(document);
      return id_element.get_oid().value;
    }

    const bsoncxx::oid id;
    bsoncxx::builder::basic::document with_id;
    with_id.append(kvp("_id", id));
    with_id.append(bsoncxx::builder::concatenate(document));
    state_->ensure(name_).documents.push_back(with_id.extract());
    return id;
  }

  store::UpdateResult update_one(bsoncxx::document::view filter, bsoncxx::document::view update,
                                 const store::WriteOptions&) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":update_one");

    store::UpdateResult result;
    auto it = state_->collections.find(name_);
    if (it == state_->collections.end()) {
      return result;
    }

    for (auto& document : it->second.documents) {
      if (!matches(document.view(), filter)) {
        continue;
      }
      result.matched_count = 1;
      result.modified_count = 1;
      document = apply_set(document.view(), update["$set"].get_document().value);
      break;
    }
    return result;
  }

  std::int64_t delete_one(bsoncxx::document::view filter, const store::WriteOptions&) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":delete_one");
    return erase(filter, 1);
  }

  std::int64_t delete_many(bsoncxx::document::view filter, const store::WriteOptions&) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":delete_many");
    return erase(filter, -1);
  }

  std::optional<bsoncxx::document::value> find_one(bsoncxx::document::view filter,
                                                   const store::QueryOptions& options) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":find_one");

    auto results = query(filter, options);
    if (results.empty()) {
      return std::nullopt;
    }
    return results.front();
  }

  std::unique_ptr<store::Cursor> find(bsoncxx::document::view filter,
                                      const store::QueryOptions& options) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":find");
    return std::make_unique<InMemoryCursor>(query(filter, options));
  }

  std::vector<bsoncxx::document::value> list_indexes() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":list_indexes");

    auto it = state_->collections.find(name_);
    if (it == state_->collections.end()) {
      return {};
    }
    return it->second.indexes;
  }

  void create_index(bsoncxx::document::view keys, const std::string& index_name) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":create_index");

    auto& data = state_->ensure(name_);
    for (const auto& index : data.indexes) {
      if (index.view()["key"].get_document().value == keys) {
        return;
      }
    }
    data.indexes.push_back(make_document(kvp("v", 2), kvp("key", keys), kvp("name", index_name)));
  }

  void drop(const store::WriteOptions&) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(name_ + ":drop");
    state_->collections.erase(name_);
  }

private:
  std::shared_ptr<InMemoryState> state_;
  std::string name_;

  static bsoncxx::document::value apply_set(bsoncxx::document::view original, bsoncxx::document::view set) {
    bsoncxx::builder::basic::document updated;
    for (const auto& element : original) {
      auto replacement = set[element.key()];
      updated.append(kvp(key_of(element), replacement ? replacement.get_value() : element.get_value()));
    }
    for (const auto& element : set) {
      if (!original[element.key()]) {
        updated.append(kvp(key_of(element), element.get_value()));
      }
    }
    return updated.extract();
  }

  std::int64_t erase(bsoncxx::document::view filter, std::int64_t max_count) {
    auto it = state_->collections.find(name_);
    if (it == state_->collections.end()) {
      return 0;
    }

    auto& documents = it->second.documents;
    std::int64_t removed = 0;
    for (auto doc = documents.begin(); doc != documents.end();) {
      if ((max_count < 0 || removed < max_count) && matches(doc->view(), filter)) {
        doc = documents.erase(doc);
        ++removed;
      } else {
        ++doc;
      }
    }
    return removed;
  }

  std::vector<bsoncxx::document::value> query(bsoncxx::document::view filter,
                                              const store::QueryOptions& options) const {
    std::vector<bsoncxx::document::value> results;
    auto it = state_->collections.find(name_);
    if (it == state_->collections.end()) {
      return results;
    }

    for (const auto& document : it->second.documents) {
      if (matches(document.view(), filter)) {
        results.push_back(document);
      }
    }

    if (options.sort) {
      const auto sort = options.sort->view();
      std::stable_sort(results.begin(), results.end(),
        [&sort](const bsoncxx::document::value& a, const bsoncxx::document::value& b) {
          for (const auto& field : sort) {
            auto left = a.view()[field.key()];
            auto right = b.view()[field.key()];
            if (!left || !right) {
              continue;
            }
            int order = compare_values(left.get_value(), right.get_value());
            if (order != 0) {
              const bool descending = field.type() == bsoncxx::type::k_int32 && field.get_int32().value < 0;
              return descending ? order > 0 : order < 0;
            }
          }
          return false;
        });
    }

    const auto skip = static_cast<std::size_t>(std::max<std::int64_t>(0, options.skip.value_or(0)));
    if (skip >= results.size()) {
      return {};
    }
    results.erase(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(skip));

    if (options.limit && *options.limit > 0 && results.size() > static_cast<std::size_t>(*options.limit)) {
      results.erase(results.begin() + static_cast<std::ptrdiff_t>(*options.limit), results.end());
    }
    return results;
  }
};

class InMemoryDatabase : public store::Database {
public:
  InMemoryDatabase() : state_(std::make_shared<InMemoryState>()) {}

  std::unique_ptr<store::Collection> collection(const std::string& name) override {
    return std::make_unique<InMemoryCollection>(state_, name);
  }

  std::vector<std::string> list_collection_names(bsoncxx::document::view filter) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(":list_collection_names");

    std::vector<std::string> names;
    for (const auto& entry : state_->collections) {
      auto wanted = filter["name"];
      if (wanted) {
        auto value = wanted.get_string().value;
        if (entry.first != std::string(value.data(), value.size())) {
          continue;
        }
      }
      names.push_back(entry.first);
    }
    return names;
  }

  void create_collection(const std::string& name) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record(":create_collection " + name);
    if (state_->collections.count(name) != 0) {
      throw store::StoreError("Collection already exists: " + name);
    }
    state_->ensure(name);
  }

  // ---- TEST HELPERS ----
  // Makes the next and every later call of `entry` (journal format) throw StoreError
  void fail_on(const std::string& entry) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->failures.insert(entry);
  }

  void clear_failures() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->failures.clear();
  }

  std::size_t count_calls(const std::string& entry) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return static_cast<std::size_t>(std::count(state_->journal.begin(), state_->journal.end(), entry));
  }

  void clear_journal() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->journal.clear();
  }

  // Documents of `collection` matching `filter`, in insertion order
  std::vector<bsoncxx::document::value> documents(const std::string& collection,
                                                  bsoncxx::document::view filter = bsoncxx::document::view{}) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<bsoncxx::document::value> result;
    auto it = state_->collections.find(collection);
    if (it == state_->collections.end()) {
      return result;
    }
    for (const auto& document : it->second.documents) {
      if (matches(document.view(), filter)) {
        result.push_back(document);
      }
    }
    return result;
  }

  std::vector<bsoncxx::document::value> indexes(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->collections.find(collection);
    if (it == state_->collections.end()) {
      return {};
    }
    return it->second.indexes;
  }

  bool has_collection(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->collections.count(collection) != 0;
  }

  // Inserts a raw document, bypassing the journal
  void seed(const std::string& collection, bsoncxx::document::view document) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->ensure(collection).documents.emplace_back(document);
  }

  // Replaces the index list of a collection, bypassing the journal
  void seed_indexes(const std::string& collection, std::vector<bsoncxx::document::value> indexes) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->ensure(collection).indexes = std::move(indexes);
  }

private:
  std::shared_ptr<InMemoryState> state_;
};

} // namespace gridstore::testing

#endif // GRIDSTORE_TESTS_IN_MEMORY_DATABASE_HPP
