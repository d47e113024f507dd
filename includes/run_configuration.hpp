#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

enum class FailurePolicy {
  // Record the failure of a table and carry on with the next one
  ContinueOnTableFailure,
  // Skip all remaining tables after the first table failure
  StopOnFirstFailure
};

struct RemoteCredentials {
  std::string user;
  std::string password;
};

struct RemoteSettings {
  std::string address;
  std::string database;
  std::optional<RemoteCredentials> credentials;

  [[nodiscard]] bool is_motherduck() const;
};

/// Immutable settings of one mirror run.
class RunConfiguration {
public:
  template <typename MapLike>
  static RunConfiguration FromMap(const MapLike &properties);

  std::string source_database;
  std::string source_database_path;
  std::string name_suffix;
  std::string backup_directory;
  RemoteSettings remote;
  FailurePolicy failure_policy = FailurePolicy::ContinueOnTableFailure;
  std::optional<std::chrono::seconds> deadline;

  /// Human readable summary for logs. Never contains the password.
  [[nodiscard]] std::string describe() const;

private:
  RunConfiguration() = default;

  static RunConfiguration
  FromStringMap(const std::map<std::string, std::string> &properties);
};

template <typename MapLike>
RunConfiguration RunConfiguration::FromMap(const MapLike &properties) {
  // Copy into a std::map so that the parsing logic is compiled once, no
  // matter whether the properties come from protobuf or the command line
  std::map<std::string, std::string> copied;
  for (const auto &entry : properties) {
    copied.emplace(entry.first, entry.second);
  }
  return FromStringMap(copied);
}
