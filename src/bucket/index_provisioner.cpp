#include "bucket/index_provisioner.hpp"
#include <cmath>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace bucket {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

// Tolerance used when comparing a floating-point index direction to 1
constexpr double ASCENDING_EPSILON = 0.0001;

std::string index_name_for(const std::string& collection_name) {
  return collection_name + "_index";
}

} // namespace

//==============================================
// KEY MATCHING
//==============================================

bool is_ascending(const bsoncxx::types::bson_value::view& value) {
  switch (value.type()) {
    case bsoncxx::type::k_int32:
      return value.get_int32().value == 1;
    case bsoncxx::type::k_int64:
      return value.get_int64().value == 1;
    case bsoncxx::type::k_double:
      return std::fabs(value.get_double().value - 1.0) < ASCENDING_EPSILON;
    default:
      return false;
  }
}

bool index_key_matches(bsoncxx::document::view index, const std::vector<std::string>& fields) {
  auto key = index["key"];
  if (!key || key.type() != bsoncxx::type::k_document) {
    return false;
  }

  // Field order and additional key fields are not significant
  const auto key_fields = key.get_document().value;
  for (const auto& field : fields) {
    auto element = key_fields[field];
    if (!element || !is_ascending(element.get_value())) {
      return false;
    }
  }
  return true;
}

//==============================================
// CONSTRUCTOR
//==============================================

IndexProvisioner::IndexProvisioner(store::Database& database, std::string files_collection,
                                   std::string chunks_collection)
  : database_(database)
  , files_collection_(std::move(files_collection))
  , chunks_collection_(std::move(chunks_collection)) {
}

const std::vector<std::string>& IndexProvisioner::files_index_fields() {
  static const std::vector<std::string> fields = {"filename", "uploadDate"};
  return fields;
}

const std::vector<std::string>& IndexProvisioner::chunks_index_fields() {
  static const std::vector<std::string> fields = {"files_id", "n"};
  return fields;
}

//==============================================
// PROVISIONING
//==============================================

void IndexProvisioner::ensure_indexes() {
  if (state() == State::Ready) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // Another writer may have finished while we waited for the lock
  if (state() == State::Ready) {
    return;
  }
  state_.store(State::InProgress, std::memory_order_release);

  try {
    if (has_any_file()) {
      BOOST_LOG_TRIVIAL(debug) << "Index provisioner: " << files_collection_
                               << " already holds files, skipping index check";
    } else {
      BOOST_LOG_TRIVIAL(info) << "Index provisioner: Checking indexes for "
                              << files_collection_ << " and " << chunks_collection_;

      ensure_collection(files_collection_);
      auto files = database_.collection(files_collection_);
      ensure_index(*files, files_index_fields());

      ensure_collection(chunks_collection_);
      auto chunks = database_.collection(chunks_collection_);
      ensure_index(*chunks, chunks_index_fields());
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Index provisioner: Failed to provision indexes: " << e.what();
    state_.store(State::Unprovisioned, std::memory_order_release);
    throw;
  }

  state_.store(State::Ready, std::memory_order_release);
}

bool IndexProvisioner::has_any_file() {
  auto files = database_.collection(files_collection_);

  store::QueryOptions probe;
  probe.projection = make_document(kvp("_id", 1));
  return files->find_one(make_document(), probe).has_value();
}

void IndexProvisioner::ensure_collection(const std::string& name) {
  auto existing = database_.list_collection_names(make_document(kvp("name", name)));
  if (existing.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Index provisioner: Creating collection " << name;
    database_.create_collection(name);
  }
}

void IndexProvisioner::ensure_index(store::Collection& collection,
                                    const std::vector<std::string>& fields) {
  for (const auto& index : collection.list_indexes()) {
    if (index_key_matches(index.view(), fields)) {
      BOOST_LOG_TRIVIAL(debug) << "Index provisioner: Found matching index on " << collection.name();
      return;
    }
  }

  bsoncxx::builder::basic::document keys;
  for (const auto& field : fields) {
    keys.append(kvp(field, 1));
  }

  const std::string index_name = index_name_for(collection.name());
  BOOST_LOG_TRIVIAL(info) << "Index provisioner: Creating index " << index_name;
  collection.create_index(keys.view(), index_name);
}

const char* to_string(IndexProvisioner::State state) {
  switch (state) {
    case IndexProvisioner::State::Unprovisioned: return "Unprovisioned";
    case IndexProvisioner::State::InProgress:    return "InProgress";
    case IndexProvisioner::State::Ready:         return "Ready";
    default:                                     return "Unknown";
  }
}

} // namespace bucket
} // namespace gridstore
