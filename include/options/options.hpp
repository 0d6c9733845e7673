#ifndef GRIDSTORE_OPTIONS_HPP
#define GRIDSTORE_OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <bsoncxx/document/value.hpp>
#include "options/consistency.hpp"

namespace gridstore::options {

// Default chunk size: 255 KiB
constexpr std::int32_t DEFAULT_CHUNK_SIZE_BYTES = 255 * 1024;
constexpr const char* DEFAULT_BUCKET_NAME = "fs";

// Receives the cumulative number of bytes persisted after each chunk write
class ProgressListener {
public:
  virtual ~ProgressListener() = default;
  virtual void on_progress(std::uint64_t bytes_written) = 0;
};

// Per-bucket configuration. Empty consistency knobs are inherited from the database.
struct BucketOptions {
  std::string bucket_name = DEFAULT_BUCKET_NAME;
  std::int32_t chunk_size_bytes = DEFAULT_CHUNK_SIZE_BYTES;
  std::optional<WriteConcern> write_concern;
  std::optional<ReadConcern> read_concern;
  std::optional<ReadPreference> read_preference;
  // When true no md5 field is computed or stored for uploaded files
  bool disable_md5 = false;
};

// Per-upload configuration
struct UploadOptions {
  // Overrides BucketOptions::chunk_size_bytes for this file only
  std::optional<std::int32_t> chunk_size_bytes;
  // Stored as the file document's 'metadata' field, omitted when empty
  std::optional<bsoncxx::document::value> metadata;
  // Legacy fields, written only when supplied
  std::optional<std::string> content_type;
  std::optional<std::vector<std::string>> aliases;
  // Not owned, must outlive the upload call
  ProgressListener* progress = nullptr;
};

// Options for queries against the files collection
struct FindOptions {
  std::optional<bool> allow_disk_use;
  std::optional<std::int32_t> batch_size;
  std::optional<std::int64_t> limit;
  std::optional<std::chrono::milliseconds> max_time;
  std::optional<bool> no_cursor_timeout;
  std::optional<std::int64_t> skip;
  std::optional<bsoncxx::document::value> sort;
};

} // namespace gridstore::options

#endif // GRIDSTORE_OPTIONS_HPP
