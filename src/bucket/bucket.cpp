#include "bucket/bucket.hpp"
#include <chrono>
#include <sstream>
#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <boost/log/trivial.hpp>
#include "crypto/md5_digest.hpp"

namespace gridstore {
namespace bucket {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using bsoncxx::builder::basic::sub_array;
using bsoncxx::builder::basic::sub_document;

//==============================================
// CONSTRUCTOR
//==============================================

Bucket::Bucket(std::shared_ptr<store::Database> database, options::BucketOptions bucket_options)
  : database_(std::move(database))
  , options_(std::move(bucket_options))
  , files_collection_(options_.bucket_name + ".files")
  , chunks_collection_(options_.bucket_name + ".chunks")
  , provisioner_(*database_, files_collection_, chunks_collection_) {
  BOOST_LOG_TRIVIAL(info) << "Bucket: Initializing bucket '" << options_.bucket_name
                          << "' with chunk size " << options_.chunk_size_bytes << " bytes";
  BOOST_LOG_TRIVIAL(debug) << "Bucket: write concern "
                           << (options_.write_concern ? options::to_string(options_.write_concern->level) : "inherited")
                           << ", read concern "
                           << (options_.read_concern ? options::to_string(*options_.read_concern) : "inherited")
                           << ", read preference "
                           << (options_.read_preference ? options::to_string(*options_.read_preference) : "inherited");
}

//==============================================
// UPLOAD
//==============================================

bsoncxx::oid Bucket::upload_from_stream(const std::string& filename, std::istream& source,
                                        const options::UploadOptions& upload_options) {
  const std::int32_t chunk_size = upload_options.chunk_size_bytes.value_or(options_.chunk_size_bytes);
  BOOST_LOG_TRIVIAL(info) << "Bucket: Uploading " << filename << " with chunk size " << chunk_size;

  provisioner_.ensure_indexes();

  auto files = database_->collection(files_collection_);
  auto chunks = database_->collection(chunks_collection_);

  const bsoncxx::oid file_id = insert_file_document(*files, filename, chunk_size, upload_options);
  BOOST_LOG_TRIVIAL(debug) << "Bucket: Created file document " << file_id.to_string();

  std::optional<crypto::Md5Digest> md5;
  if (!options_.disable_md5) {
    md5.emplace();
  }

  // A non-positive chunk size reads nothing and produces an empty file
  std::vector<uint8_t> buffer(chunk_size > 0 ? static_cast<std::size_t>(chunk_size) : 0);
  std::uint64_t length = 0;
  std::int32_t n = 0;

  while (!buffer.empty()) {
    source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (source.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Bucket: Source stream failed after " << length
                               << " bytes of " << filename;
      throw SourceReadError("failed after " + std::to_string(length) + " bytes of " + filename);
    }

    const auto read_size = static_cast<std::size_t>(source.gcount());
    if (read_size == 0) {
      break;
    }

    insert_chunk(*chunks, file_id, n, buffer.data(), read_size);
    if (md5) {
      md5->update(buffer.data(), read_size);
    }
    length += read_size;
    ++n;

    if (upload_options.progress) {
      upload_options.progress->on_progress(length);
    }

    // Short read means the source is exhausted
    if (source.eof()) {
      break;
    }
  }

  std::optional<std::string> checksum;
  if (md5) {
    checksum = md5->hex_digest();
  }
  finalize_file(*files, file_id, static_cast<std::int64_t>(length), checksum);

  BOOST_LOG_TRIVIAL(info) << "Bucket: Stored " << length << " bytes in " << n
                          << " chunks as file " << file_id.to_string();
  return file_id;
}

bsoncxx::oid Bucket::upload_from_bytes(const std::string& filename, const std::vector<uint8_t>& data,
                                       const options::UploadOptions& upload_options) {
  std::istringstream source(std::string(data.begin(), data.end()));
  return upload_from_stream(filename, source, upload_options);
}

bsoncxx::oid Bucket::insert_file_document(store::Collection& files, const std::string& filename,
                                          std::int32_t chunk_size,
                                          const options::UploadOptions& upload_options) {
  bsoncxx::builder::basic::document file_document;
  file_document.append(kvp("filename", filename));
  file_document.append(kvp("chunkSize", chunk_size));

  if (upload_options.metadata) {
    file_document.append(kvp("metadata", bsoncxx::types::b_document{upload_options.metadata->view()}));
  }
  if (upload_options.content_type) {
    file_document.append(kvp("contentType", *upload_options.content_type));
  }
  if (upload_options.aliases) {
    const auto& aliases = *upload_options.aliases;
    file_document.append(kvp("aliases", [&aliases](sub_array array) {
      for (const auto& alias : aliases) {
        array.append(alias);
      }
    }));
  }

  return files.insert_one(file_document.view(), write_options());
}

void Bucket::insert_chunk(store::Collection& chunks, const bsoncxx::oid& file_id, std::int32_t n,
                          const uint8_t* data, std::size_t length) {
  bsoncxx::types::b_binary payload{bsoncxx::binary_sub_type::k_binary,
                                   static_cast<std::uint32_t>(length), data};

  chunks.insert_one(make_document(kvp("files_id", file_id),
                                  kvp("n", n),
                                  kvp("data", payload)),
                    write_options());
}

void Bucket::finalize_file(store::Collection& files, const bsoncxx::oid& file_id, std::int64_t length,
                           const std::optional<std::string>& md5) {
  const bsoncxx::types::b_date upload_date{std::chrono::system_clock::now()};

  auto update = make_document(kvp("$set", [&](sub_document set) {
    set.append(kvp("length", length));
    set.append(kvp("uploadDate", upload_date));
    if (md5) {
      set.append(kvp("md5", *md5));
    }
  }));

  files.update_one(make_document(kvp("_id", file_id)), update.view(), write_options());
}

//==============================================
// DOWNLOAD
//==============================================

std::pair<DownloadStream, std::string> Bucket::open_download_stream_with_filename(const bsoncxx::oid& id) {
  BOOST_LOG_TRIVIAL(info) << "Bucket: Opening download stream for file " << id.to_string();

  auto files = database_->collection(files_collection_);
  auto file = files->find_one(make_document(kvp("_id", id)), read_options());
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: File not found: " << id.to_string();
    throw FileNotFoundError(id.to_string());
  }

  std::string filename;
  auto filename_element = file->view()["filename"];
  if (filename_element && filename_element.type() == bsoncxx::type::k_string) {
    auto value = filename_element.get_string().value;
    filename.assign(value.data(), value.size());
  }

  store::QueryOptions chunk_query = read_options();
  chunk_query.sort = make_document(kvp("n", 1));

  auto chunks = database_->collection(chunks_collection_);
  auto cursor = chunks->find(make_document(kvp("files_id", id)), chunk_query);

  return {DownloadStream(id, std::move(cursor)), filename};
}

DownloadStream Bucket::open_download_stream(const bsoncxx::oid& id) {
  return std::move(open_download_stream_with_filename(id).first);
}

std::uint64_t Bucket::download_to_stream(const bsoncxx::oid& id, std::ostream& output) {
  auto stream = open_download_stream(id);

  std::uint64_t total_bytes = 0;
  while (auto chunk = stream.next()) {
    output.write(reinterpret_cast<const char*>(chunk->data()), static_cast<std::streamsize>(chunk->size()));
    if (!output.good()) {
      throw GridStoreError("Failed to write to output stream");
    }
    total_bytes += chunk->size();
  }

  BOOST_LOG_TRIVIAL(info) << "Bucket: Streamed " << total_bytes << " bytes of file " << id.to_string();
  return total_bytes;
}

//==============================================
// CATALOG OPERATIONS
//==============================================

void Bucket::remove(const bsoncxx::oid& id) {
  BOOST_LOG_TRIVIAL(info) << "Bucket: Removing file " << id.to_string();

  auto files = database_->collection(files_collection_);
  const auto deleted = files->delete_one(make_document(kvp("_id", id)), write_options());
  if (deleted == 0) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: File not found: " << id.to_string();
    throw FileNotFoundError(id.to_string());
  }

  auto chunks = database_->collection(chunks_collection_);
  const auto deleted_chunks = chunks->delete_many(make_document(kvp("files_id", id)), write_options());
  BOOST_LOG_TRIVIAL(info) << "Bucket: Removed file " << id.to_string() << " and "
                          << deleted_chunks << " chunks";
}

store::UpdateResult Bucket::rename(const bsoncxx::oid& id, const std::string& new_filename) {
  BOOST_LOG_TRIVIAL(info) << "Bucket: Renaming file " << id.to_string() << " to " << new_filename;

  auto files = database_->collection(files_collection_);
  auto update = make_document(kvp("$set", [&new_filename](sub_document set) {
    set.append(kvp("filename", new_filename));
  }));
  auto result = files->update_one(make_document(kvp("_id", id)), update.view(), write_options());

  if (result.matched_count == 0) {
    BOOST_LOG_TRIVIAL(warning) << "Bucket: Rename matched no file with id " << id.to_string();
  }
  return result;
}

std::unique_ptr<store::Cursor> Bucket::find(bsoncxx::document::view filter,
                                            const options::FindOptions& find_options) {
  BOOST_LOG_TRIVIAL(debug) << "Bucket: Finding files in " << files_collection_;

  store::QueryOptions query = read_options();
  query.allow_disk_use = find_options.allow_disk_use;
  query.batch_size = find_options.batch_size;
  query.limit = find_options.limit;
  query.max_time = find_options.max_time;
  query.no_cursor_timeout = find_options.no_cursor_timeout;
  query.skip = find_options.skip;
  query.sort = find_options.sort;

  auto files = database_->collection(files_collection_);
  return files->find(filter, query);
}

void Bucket::drop() {
  BOOST_LOG_TRIVIAL(warning) << "Bucket: Dropping " << files_collection_ << " and " << chunks_collection_;

  database_->collection(files_collection_)->drop(write_options());
  database_->collection(chunks_collection_)->drop(write_options());
}

//==============================================
// STORE OPTIONS
//==============================================

store::QueryOptions Bucket::read_options() const {
  store::QueryOptions query;
  query.read_concern = options_.read_concern;
  query.read_preference = options_.read_preference;
  return query;
}

store::WriteOptions Bucket::write_options() const {
  store::WriteOptions write;
  write.write_concern = options_.write_concern;
  return write;
}

} // namespace bucket
} // namespace gridstore
