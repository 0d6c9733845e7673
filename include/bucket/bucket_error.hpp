#ifndef GRIDSTORE_BUCKET_ERROR_HPP
#define GRIDSTORE_BUCKET_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gridstore {
namespace bucket {

class GridStoreError : public std::runtime_error {
public:
  explicit GridStoreError(const std::string& message)
    : std::runtime_error(message) {}
};

// No file document matches the requested id
class FileNotFoundError : public GridStoreError {
public:
  explicit FileNotFoundError(const std::string& file_id)
    : GridStoreError("File not found: " + file_id), file_id_(file_id) {}

  const std::string& file_id() const { return file_id_; }

private:
  std::string file_id_;
};

// The upload source stream failed while being read
class SourceReadError : public GridStoreError {
public:
  explicit SourceReadError(const std::string& message)
    : GridStoreError("Source read error: " + message) {}
};

} // namespace bucket
} // namespace gridstore

#endif // GRIDSTORE_BUCKET_ERROR_HPP
