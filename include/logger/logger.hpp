#ifndef GRIDSTORE_LOGGER_HPP
#define GRIDSTORE_LOGGER_HPP

#include <cstddef>
#include <string>
#include <boost/log/trivial.hpp>

namespace gridstore::logging {

struct LogConfig {
  // Empty file name disables the file sink
  std::string file_name = "gridstore.log";
  bool console = false;
  boost::log::trivial::severity_level min_severity = boost::log::trivial::info;
  std::size_t rotation_size = 10 * 1024 * 1024;  // 10 MB
};

class Logger {
public:
  // Installs the sinks described by config, replacing any existing ones
  static void init(const LogConfig& config = LogConfig{});

  // Changes the minimum severity without touching the sinks
  static void set_min_severity(boost::log::trivial::severity_level level);

  // Parses "trace", "debug", "info", "warning", "error" or "fatal"
  static bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level);
};

} // namespace gridstore::logging

#endif // GRIDSTORE_LOGGER_HPP
