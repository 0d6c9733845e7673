#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>
#include <mongocxx/instance.hpp>
#include "bucket/bucket.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/mongo_database.hpp"

struct ProgramOptions {
  std::string uri;
  std::string database;
  gridstore::options::BucketOptions bucket;
  gridstore::logging::LogConfig log;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <database> [options]\n"
        << "Required arguments:\n"
        << "  -d, --database    Database name\n"
        << "Optional arguments:\n"
        << "  -u, --uri         Connection string (default: $MONGO_URI or mongodb://localhost:27017)\n"
        << "  -b, --bucket      Bucket name (default: fs)\n"
        << "  -c, --chunk-size  Chunk size in bytes (default: 261120)\n"
        << "  -l, --log-file    Log file (default: gridstore.log)\n"
        << "  -v, --verbosity   trace|debug|info|warning|error|fatal (default: info)\n"
        << "  --no-md5          Do not compute md5 checksums\n"
        << "Example: " << program_name << " -d test -b photos\n";
}

std::string default_uri() {
  if (const char* env = std::getenv("MONGO_URI")) {
    return env;
  }
  return "mongodb://localhost:27017";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-u", "--uri",
    "-d", "--database",
    "-b", "--bucket",
    "-c", "--chunk-size",
    "-l", "--log-file",
    "-v", "--verbosity"
  };

  ProgramOptions options;
  options.uri = default_uri();

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--no-md5") {
      options.bucket.disable_md5 = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-u" || flag == "--uri") {
      options.uri = value;
    } else if (flag == "-d" || flag == "--database") {
      options.database = value;
    } else if (flag == "-b" || flag == "--bucket") {
      options.bucket.bucket_name = value;
    } else if (flag == "-l" || flag == "--log-file") {
      options.log.file_name = value;
    } else if (flag == "-c" || flag == "--chunk-size") {
      if (!gridstore::cli::parse_chunk_size(value, options.bucket.chunk_size_bytes)) {
        std::cerr << "Error: Invalid chunk size\n";
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-v" || flag == "--verbosity") {
      if (!gridstore::logging::Logger::parse_severity(value, options.log.min_severity)) {
        std::cerr << "Error: Invalid verbosity: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.database.empty()) {
    std::cerr << "Error: Database name is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    gridstore::logging::Logger::init(options.log);

    mongocxx::instance instance{};
    auto database = std::make_shared<gridstore::store::MongoDatabase>(options.uri, options.database);
    gridstore::bucket::Bucket bucket(database, options.bucket);
    gridstore::cli::CLI cli(bucket);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
