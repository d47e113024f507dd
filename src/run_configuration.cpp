#include "run_configuration.hpp"

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace {
std::string require_non_empty(const std::map<std::string, std::string> &props,
                              const std::string &property_name) {
  auto value = config::find_property(props, property_name);
  if (value.empty()) {
    throw std::invalid_argument("Property " + property_name +
                                " must not be empty");
  }
  return value;
}

std::chrono::seconds parse_deadline(const std::string &value) {
  long long numeric_input;
  try {
    std::size_t consumed = 0;
    numeric_input = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
  } catch (std::invalid_argument &) {
    throw std::invalid_argument(
        "Invalid value for property " +
        std::string(config::PROP_DEADLINE_SECONDS) + ": " + value +
        ". Must be an unsigned integer.");
  } catch (std::out_of_range &) {
    throw std::invalid_argument("Invalid value for property " +
                                std::string(config::PROP_DEADLINE_SECONDS) +
                                ": " + value + ". Value is out of range.");
  }
  if (numeric_input <= 0) {
    throw std::invalid_argument("Invalid value for property " +
                                std::string(config::PROP_DEADLINE_SECONDS) +
                                ": " + value + ". Must be greater than 0.");
  }
  // The deadline is added to steady_clock::now(); keep the sum representable
  const auto max_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::steady_clock::duration::max())
          .count() /
      2;
  if (numeric_input > max_seconds) {
    throw std::invalid_argument("Invalid value for property " +
                                std::string(config::PROP_DEADLINE_SECONDS) +
                                ": " + value + ". Must be at most " +
                                std::to_string(max_seconds) + ".");
  }
  return std::chrono::seconds(numeric_input);
}

FailurePolicy parse_failure_policy(const std::string &value) {
  if (value == config::FAILURE_POLICY_CONTINUE) {
    return FailurePolicy::ContinueOnTableFailure;
  }
  if (value == config::FAILURE_POLICY_STOP) {
    return FailurePolicy::StopOnFirstFailure;
  }
  throw std::invalid_argument(
      "Invalid value for property " + std::string(config::PROP_FAILURE_POLICY) +
      ": " + value + ". Must be \"" + config::FAILURE_POLICY_CONTINUE +
      "\" or \"" + config::FAILURE_POLICY_STOP + "\".");
}
} // namespace

bool RemoteSettings::is_motherduck() const {
  return address.rfind(config::MOTHERDUCK_ADDRESS_PREFIX, 0) == 0;
}

RunConfiguration RunConfiguration::FromStringMap(
    const std::map<std::string, std::string> &properties) {
  RunConfiguration result;
  result.source_database =
      require_non_empty(properties, config::PROP_SOURCE_DATABASE);
  result.name_suffix = require_non_empty(properties, config::PROP_NAME_SUFFIX);
  result.backup_directory =
      require_non_empty(properties, config::PROP_BACKUP_DIRECTORY);
  result.remote.address =
      require_non_empty(properties, config::PROP_REMOTE_ADDRESS);
  result.remote.database =
      require_non_empty(properties, config::PROP_REMOTE_DATABASE);

  result.source_database_path =
      config::find_optional_property(properties,
                                     config::PROP_SOURCE_DATABASE_PATH)
          .value_or(result.source_database + ".duckdb");

  const auto user =
      config::find_optional_property(properties, config::PROP_REMOTE_USER);
  const auto password =
      config::find_optional_property(properties, config::PROP_REMOTE_PASSWORD);
  if (user.has_value() || password.has_value()) {
    result.remote.credentials =
        RemoteCredentials{user.value_or(""), password.value_or("")};
  }

  const auto policy =
      config::find_optional_property(properties, config::PROP_FAILURE_POLICY);
  if (policy.has_value()) {
    result.failure_policy = parse_failure_policy(policy.value());
  }

  const auto deadline =
      config::find_optional_property(properties, config::PROP_DEADLINE_SECONDS);
  if (deadline.has_value()) {
    result.deadline = parse_deadline(deadline.value());
  }

  return result;
}

std::string RunConfiguration::describe() const {
  std::string out = "source_database=<" + source_database +
                    ">, source_database_path=<" + source_database_path +
                    ">, name_suffix=<" + name_suffix +
                    ">, backup_directory=<" + backup_directory +
                    ">, remote_address=<" + remote.address +
                    ">, remote_database=<" + remote.database + ">";
  if (remote.credentials.has_value()) {
    out += ", remote_user=<" + remote.credentials->user +
           ">, remote_password=<" +
           (remote.credentials->password.empty() ? "" : "***") + ">";
  } else {
    out += ", credentials=<ambient>";
  }
  out += ", failure_policy=<";
  out += failure_policy == FailurePolicy::StopOnFirstFailure
             ? config::FAILURE_POLICY_STOP
             : config::FAILURE_POLICY_CONTINUE;
  out += ">";
  if (deadline.has_value()) {
    out += ", deadline_seconds=<" + std::to_string(deadline->count()) + ">";
  }
  return out;
}
