#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/types.hpp>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace cli {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

// Reports upload progress on the shell output
class ProgressPrinter : public options::ProgressListener {
public:
  explicit ProgressPrinter(std::ostream& output) : output_(output) {}

  void on_progress(std::uint64_t bytes_written) override {
    output_ << "\rUploaded " << bytes_written << " bytes" << std::flush;
    reported_ = true;
  }

  bool reported() const { return reported_; }

private:
  std::ostream& output_;
  bool reported_ = false;
};

std::string join(const std::vector<std::string>& parts, std::size_t first) {
  std::string joined;
  for (std::size_t i = first; i < parts.size(); ++i) {
    if (i > first) {
      joined += ' ';
    }
    joined += parts[i];
  }
  return joined;
}

std::string field_as_string(bsoncxx::document::view document, const char* field) {
  auto element = document[field];
  if (!element) {
    return "-";
  }
  switch (element.type()) {
    case bsoncxx::type::k_string: {
      auto value = element.get_string().value;
      return std::string(value.data(), value.size());
    }
    case bsoncxx::type::k_int32:
      return std::to_string(element.get_int32().value);
    case bsoncxx::type::k_int64:
      return std::to_string(element.get_int64().value);
    case bsoncxx::type::k_oid:
      return element.get_oid().value.to_string();
    case bsoncxx::type::k_date:
      return std::to_string(element.get_date().to_int64());
    default:
      return "?";
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(bucket::Bucket& bucket, std::istream& input, std::ostream& output)
  : running_(false)
  , bucket_(bucket)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized for bucket " << bucket_.bucket_options().bucket_name;
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "gridstore> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "gridstore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  std::vector<std::string> args;

  iss >> command;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }

  if (command.empty()) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "put" && args.size() == 1) {
    handle_put_command(args[0]);
  }
  else if (command == "get" && (args.size() == 1 || args.size() == 2)) {
    handle_get_command(args[0], args.size() == 2 ? args[1] : "");
  }
  else if (command == "cat" && args.size() == 1) {
    handle_cat_command(args[0]);
  }
  else if (command == "ls" && args.size() <= 1) {
    handle_list_command(args.empty() ? "" : args[0]);
  }
  else if (command == "rm" && args.size() == 1) {
    handle_remove_command(args[0]);
  }
  else if (command == "mv" && args.size() >= 2) {
    handle_rename_command(args[0], join(args, 1));
  }
  else if (command == "drop" && args.empty()) {
    handle_drop_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
  }
}

void CLI::handle_put_command(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << path << std::endl;
    return;
  }

  try {
    ProgressPrinter progress(output_);
    options::UploadOptions upload_options;
    upload_options.progress = &progress;

    auto id = bucket_.upload_from_stream(std::filesystem::path(path).filename().string(), file, upload_options);
    if (progress.reported()) {
      output_ << std::endl;
    }
    output_ << "Stored " << path << " as " << id.to_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::string& id, const std::string& output_path) {
  try {
    auto [stream, filename] = bucket_.open_download_stream_with_filename(parse_id(id));
    // A stored name may carry directories or ".." from another client, keep only its last component
    const std::string target = output_path.empty()
      ? std::filesystem::path(filename).filename().string()
      : output_path;
    if (target.empty() || target == "." || target == "..") {
      output_ << "Stored filename is not usable as a local name, give an output path" << std::endl;
      return;
    }

    std::ofstream file(target, std::ios::binary);
    if (!file) {
      output_ << "Error creating file: " << target << std::endl;
      return;
    }

    std::uint64_t total_bytes = 0;
    while (auto chunk = stream.next()) {
      file.write(reinterpret_cast<const char*>(chunk->data()), static_cast<std::streamsize>(chunk->size()));
      total_bytes += chunk->size();
    }
    if (!file.good()) {
      output_ << "Error writing file: " << target << std::endl;
      return;
    }

    output_ << "Wrote " << total_bytes << " bytes to " << target << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error retrieving file", e.what());
  }
}

void CLI::handle_cat_command(const std::string& id) {
  try {
    bucket_.download_to_stream(parse_id(id), output_);
    output_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_list_command(const std::string& filename) {
  try {
    auto filter = filename.empty() ? make_document() : make_document(kvp("filename", filename));

    options::FindOptions find_options;
    find_options.sort = make_document(kvp("uploadDate", 1));

    auto cursor = bucket_.find(filter.view(), find_options);
    std::size_t count = 0;
    while (auto file = cursor->next()) {
      auto view = file->view();
      output_ << field_as_string(view, "_id") << "  "
              << field_as_string(view, "length") << "  "
              << field_as_string(view, "md5") << "  "
              << field_as_string(view, "filename") << std::endl;
      ++count;
    }
    output_ << count << " file(s)" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error listing files", e.what());
  }
}

void CLI::handle_remove_command(const std::string& id) {
  try {
    bucket_.remove(parse_id(id));
    output_ << "File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_rename_command(const std::string& id, const std::string& new_filename) {
  try {
    auto result = bucket_.rename(parse_id(id), new_filename);
    if (result.matched_count == 0) {
      output_ << "No file with id " << id << std::endl;
    } else {
      output_ << "Renamed " << id << " to " << new_filename << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error renaming file", e.what());
  }
}

void CLI::handle_drop_command() {
  try {
    bucket_.drop();
    output_ << "Dropped bucket " << bucket_.bucket_options().bucket_name << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error dropping bucket", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                Display this help message" << std::endl;
  output_ << "  put <path>          Upload local file <path>" << std::endl;
  output_ << "  get <id> [path]     Download file <id> to [path] or its stored name" << std::endl;
  output_ << "  cat <id>            Print contents of file <id>" << std::endl;
  output_ << "  ls [filename]       List stored files, optionally only [filename]" << std::endl;
  output_ << "  rm <id>             Delete file <id> and its chunks" << std::endl;
  output_ << "  mv <id> <filename>  Rename file <id>" << std::endl;
  output_ << "  drop                Drop the whole bucket" << std::endl;
  output_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

bool parse_chunk_size(const std::string& text, std::int32_t& chunk_size) {
  long long value = 0;
  std::size_t consumed = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    return false;
  }
  if (consumed != text.size()
      || value < std::numeric_limits<std::int32_t>::min()
      || value > std::numeric_limits<std::int32_t>::max()) {
    return false;
  }
  chunk_size = static_cast<std::int32_t>(value);
  return true;
}

bsoncxx::oid CLI::parse_id(const std::string& id) {
  try {
    return bsoncxx::oid{id};
  } catch (const bsoncxx::exception&) {
    throw bucket::GridStoreError("Invalid file id: " + id);
  }
}

} // namespace cli
} // namespace gridstore
