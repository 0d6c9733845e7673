#ifndef GRIDSTORE_BUCKET_DOWNLOAD_STREAM_HPP
#define GRIDSTORE_BUCKET_DOWNLOAD_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <bsoncxx/oid.hpp>
#include "store/store.hpp"

namespace gridstore {
namespace bucket {

// Lazy, single-pass sequence of the chunk payloads of one file, in chunk order.
// Each element is exactly one stored chunk; boundaries are never merged or split.
class DownloadStream {
public:
  DownloadStream(bsoncxx::oid file_id, std::unique_ptr<store::Cursor> chunks);

  DownloadStream(DownloadStream&&) = default;
  DownloadStream& operator=(DownloadStream&&) = default;
  DownloadStream(const DownloadStream&) = delete;
  DownloadStream& operator=(const DownloadStream&) = delete;

  // Returns the next chunk's bytes, or nullopt after the last chunk
  std::optional<std::vector<uint8_t>> next();

  const bsoncxx::oid& file_id() const { return file_id_; }
  std::size_t chunks_read() const { return chunks_read_; }
  bool exhausted() const { return !chunks_; }

private:
  bsoncxx::oid file_id_;
  // Released once the cursor reports the end
  std::unique_ptr<store::Cursor> chunks_;
  std::size_t chunks_read_ = 0;
};

} // namespace bucket
} // namespace gridstore

#endif // GRIDSTORE_BUCKET_DOWNLOAD_STREAM_HPP
