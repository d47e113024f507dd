#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>

namespace config {
inline constexpr const char *PROP_SOURCE_DATABASE = "source_database";
inline constexpr const char *PROP_SOURCE_DATABASE_PATH = "source_database_path";
inline constexpr const char *PROP_NAME_SUFFIX = "name_suffix";
inline constexpr const char *PROP_BACKUP_DIRECTORY = "backup_directory";
inline constexpr const char *PROP_REMOTE_ADDRESS = "remote_address";
inline constexpr const char *PROP_REMOTE_DATABASE = "remote_database";
inline constexpr const char *PROP_REMOTE_USER = "remote_user";
inline constexpr const char *PROP_REMOTE_PASSWORD = "remote_password";
inline constexpr const char *PROP_FAILURE_POLICY = "failure_policy";
inline constexpr const char *PROP_DEADLINE_SECONDS = "deadline_seconds";

inline constexpr std::array<const char *, 10> ALL_PROPERTIES = {
    PROP_SOURCE_DATABASE,   PROP_SOURCE_DATABASE_PATH, PROP_NAME_SUFFIX,
    PROP_BACKUP_DIRECTORY,  PROP_REMOTE_ADDRESS,       PROP_REMOTE_DATABASE,
    PROP_REMOTE_USER,       PROP_REMOTE_PASSWORD,      PROP_FAILURE_POLICY,
    PROP_DEADLINE_SECONDS};

inline bool is_known_property(const std::string &property_name) {
  for (const auto *known : ALL_PROPERTIES) {
    if (property_name == known) {
      return true;
    }
  }
  return false;
}

inline constexpr const char *FAILURE_POLICY_CONTINUE = "continue";
inline constexpr const char *FAILURE_POLICY_STOP = "stop";

// Remote addresses starting with this prefix are MotherDuck databases
inline constexpr const char *MOTHERDUCK_ADDRESS_PREFIX = "md:";

// The one-shot CLI reads the password from here so it does not show up in the
// process list
inline constexpr const char *ENV_REMOTE_PASSWORD = "DBMIRROR_REMOTE_PASSWORD";
inline constexpr const char *ENV_DISABLE_DUCKDB_LOGGING =
    "DBMIRROR_DISABLE_DUCKDB_LOGGING";

template <typename MapLike>
std::string find_property(const MapLike &config,
                          const std::string &property_name) {
  const auto it = config.find(property_name);
  if (it == config.end()) {
    throw std::invalid_argument("Missing property " + property_name);
  }
  return it->second;
}

template <typename MapLike>
std::optional<std::string>
find_optional_property(const MapLike &config,
                       const std::string &property_name) {
  const auto it = config.find(property_name);
  if (it == config.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}
} // namespace config
