#ifndef GRIDSTORE_BUCKET_HPP
#define GRIDSTORE_BUCKET_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/oid.hpp>
#include "bucket/bucket_error.hpp"
#include "bucket/download_stream.hpp"
#include "bucket/index_provisioner.hpp"
#include "options/options.hpp"
#include "store/store.hpp"

namespace gridstore {
namespace bucket {

// Chunked file storage over a files collection and a chunks collection that
// share the bucket name as prefix (<bucket>.files, <bucket>.chunks).
//
// An upload inserts the file document first, then the chunks, then sets the
// length, upload date and md5. Readers racing an upload can observe a file
// document whose chunks or length are not there yet.
class Bucket {
public:
  // ---- CONSTRUCTOR ----
  explicit Bucket(std::shared_ptr<store::Database> database,
                  options::BucketOptions bucket_options = options::BucketOptions{});

  Bucket(const Bucket&) = delete;
  Bucket& operator=(const Bucket&) = delete;


  // ---- UPLOAD ----
  // Reads `source` until exhausted and stores it under a new file id
  bsoncxx::oid upload_from_stream(const std::string& filename, std::istream& source,
                                  const options::UploadOptions& upload_options = options::UploadOptions{});
  bsoncxx::oid upload_from_bytes(const std::string& filename, const std::vector<uint8_t>& data,
                                 const options::UploadOptions& upload_options = options::UploadOptions{});


  // ---- DOWNLOAD ----
  // Throws FileNotFoundError when no file document has this id
  DownloadStream open_download_stream(const bsoncxx::oid& id);
  std::pair<DownloadStream, std::string> open_download_stream_with_filename(const bsoncxx::oid& id);
  // Writes every chunk of the file to `output`, returns the number of bytes written
  std::uint64_t download_to_stream(const bsoncxx::oid& id, std::ostream& output);


  // ---- CATALOG OPERATIONS ----
  // Deletes the file document then its chunks. Throws FileNotFoundError for an unknown id.
  void remove(const bsoncxx::oid& id);
  // Sets a new filename; an unknown id yields matched_count == 0, not an error
  store::UpdateResult rename(const bsoncxx::oid& id, const std::string& new_filename);
  // Queries the files collection with `filter` passed through unchanged
  std::unique_ptr<store::Cursor> find(bsoncxx::document::view filter,
                                      const options::FindOptions& find_options = options::FindOptions{});
  // Drops both collections
  void drop();


  // ---- GETTERS ----
  const options::BucketOptions& bucket_options() const { return options_; }
  const std::string& files_collection_name() const { return files_collection_; }
  const std::string& chunks_collection_name() const { return chunks_collection_; }
  IndexProvisioner::State index_state() const { return provisioner_.state(); }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::Database> database_;
  options::BucketOptions options_;
  std::string files_collection_;
  std::string chunks_collection_;
  IndexProvisioner provisioner_;


  // ---- UPLOAD SUPPORT ----
  bsoncxx::oid insert_file_document(store::Collection& files, const std::string& filename,
                                    std::int32_t chunk_size,
                                    const options::UploadOptions& upload_options);
  void insert_chunk(store::Collection& chunks, const bsoncxx::oid& file_id, std::int32_t n,
                    const uint8_t* data, std::size_t length);
  void finalize_file(store::Collection& files, const bsoncxx::oid& file_id, std::int64_t length,
                     const std::optional<std::string>& md5);


  // ---- STORE OPTIONS ----
  store::QueryOptions read_options() const;
  store::WriteOptions write_options() const;
};

} // namespace bucket
} // namespace gridstore

#endif // GRIDSTORE_BUCKET_HPP
