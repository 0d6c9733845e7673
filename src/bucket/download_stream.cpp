#include "bucket/download_stream.hpp"
#include <bsoncxx/types.hpp>
#include <boost/log/trivial.hpp>
#include "bucket/bucket_error.hpp"

namespace gridstore {
namespace bucket {

DownloadStream::DownloadStream(bsoncxx::oid file_id, std::unique_ptr<store::Cursor> chunks)
  : file_id_(std::move(file_id))
  , chunks_(std::move(chunks)) {
}

std::optional<std::vector<uint8_t>> DownloadStream::next() {
  if (!chunks_) {
    return std::nullopt;
  }

  auto chunk = chunks_->next();
  if (!chunk) {
    BOOST_LOG_TRIVIAL(debug) << "Download stream: Read " << chunks_read_
                             << " chunks for file " << file_id_.to_string();
    chunks_.reset();
    return std::nullopt;
  }

  auto data = chunk->view()["data"];
  if (!data || data.type() != bsoncxx::type::k_binary) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Chunk " << chunks_read_ << " of file "
                             << file_id_.to_string() << " has no binary payload";
    throw GridStoreError("Chunk without binary payload in file " + file_id_.to_string());
  }

  auto binary = data.get_binary();
  ++chunks_read_;
  return std::vector<uint8_t>(binary.bytes, binary.bytes + binary.size);
}

} // namespace bucket
} // namespace gridstore
