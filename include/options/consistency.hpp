#ifndef GRIDSTORE_OPTIONS_CONSISTENCY_HPP
#define GRIDSTORE_OPTIONS_CONSISTENCY_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gridstore::options {

// Write acknowledgement requested from the store
struct WriteConcern {
  enum class Level {
    Default,
    Unacknowledged,
    Acknowledged,
    Majority
  };

  Level level = Level::Default;
  // Number of nodes that must acknowledge, only meaningful with Level::Acknowledged
  std::optional<std::int32_t> nodes;
  std::optional<bool> journal;
  std::optional<std::chrono::milliseconds> timeout;
};

// Staleness tolerated by reads
enum class ReadConcern {
  Local,
  Available,
  Majority,
  Linearizable,
  Snapshot
};

// Replica selection for reads
enum class ReadPreference {
  Primary,
  PrimaryPreferred,
  Secondary,
  SecondaryPreferred,
  Nearest
};

inline const char* to_string(WriteConcern::Level level) {
  switch (level) {
    case WriteConcern::Level::Default:        return "default";
    case WriteConcern::Level::Unacknowledged: return "unacknowledged";
    case WriteConcern::Level::Acknowledged:   return "acknowledged";
    case WriteConcern::Level::Majority:       return "majority";
    default:                                  return "unknown";
  }
}

inline const char* to_string(ReadConcern level) {
  switch (level) {
    case ReadConcern::Local:        return "local";
    case ReadConcern::Available:    return "available";
    case ReadConcern::Majority:     return "majority";
    case ReadConcern::Linearizable: return "linearizable";
    case ReadConcern::Snapshot:     return "snapshot";
    default:                        return "unknown";
  }
}

inline const char* to_string(ReadPreference mode) {
  switch (mode) {
    case ReadPreference::Primary:            return "primary";
    case ReadPreference::PrimaryPreferred:   return "primaryPreferred";
    case ReadPreference::Secondary:          return "secondary";
    case ReadPreference::SecondaryPreferred: return "secondaryPreferred";
    case ReadPreference::Nearest:            return "nearest";
    default:                                 return "unknown";
  }
}

} // namespace gridstore::options

#endif // GRIDSTORE_OPTIONS_CONSISTENCY_HPP
