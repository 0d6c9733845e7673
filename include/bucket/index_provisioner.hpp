#ifndef GRIDSTORE_BUCKET_INDEX_PROVISIONER_HPP
#define GRIDSTORE_BUCKET_INDEX_PROVISIONER_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/types/bson_value/view.hpp>
#include "store/store.hpp"

namespace gridstore {
namespace bucket {

// True for an index key value meaning "ascending": integer 1 or a floating-point 1.0
bool is_ascending(const bsoncxx::types::bson_value::view& value);

// True if the index description's key holds every one of `fields` ascending
bool index_key_matches(bsoncxx::document::view index, const std::vector<std::string>& fields);

class IndexProvisioner {
public:
  enum class State {
    Unprovisioned,
    InProgress,
    Ready
  };

  // ---- CONSTRUCTOR ----
  IndexProvisioner(store::Database& database, std::string files_collection,
                   std::string chunks_collection);

  IndexProvisioner(const IndexProvisioner&) = delete;
  IndexProvisioner& operator=(const IndexProvisioner&) = delete;


  // ---- PROVISIONING ----
  // Creates the files and chunks collections and their indexes if the files
  // collection is empty. Runs at most once per instance; a failed pass resets
  // the state so the next call retries.
  void ensure_indexes();

  State state() const { return state_.load(std::memory_order_acquire); }

  static const std::vector<std::string>& files_index_fields();
  static const std::vector<std::string>& chunks_index_fields();

private:
  // ---- PARAMETERS ----
  store::Database& database_;
  std::string files_collection_;
  std::string chunks_collection_;
  std::atomic<State> state_{State::Unprovisioned};
  std::mutex mutex_;


  // ---- PROVISIONING STEPS ----
  bool has_any_file();
  void ensure_collection(const std::string& name);
  void ensure_index(store::Collection& collection, const std::vector<std::string>& fields);
};

const char* to_string(IndexProvisioner::State state);

} // namespace bucket
} // namespace gridstore

#endif // GRIDSTORE_BUCKET_INDEX_PROVISIONER_HPP
