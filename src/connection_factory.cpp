#include "connection_factory.hpp"

#include "config.hpp"
#include "duckdb.hpp"
#include "extension_helper.hpp"
#include "mirror_error.hpp"

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>

using mirror_error::ErrorKind;
using mirror_error::MirrorError;

namespace {
void maybe_rewrite_error(const std::string &msg, const std::string &db_name) {
  if (msg.find("Jwt is expired") != std::string::npos) {
    throw MirrorError(
        ErrorKind::RemoteUnreachable,
        "Failed to connect to MotherDuck database \"" + db_name +
            "\" because the MotherDuck token has expired. Please configure a "
            "new token.\nOriginal error: " +
            msg);
  }

  if (msg.find("Your request is not authenticated") !=
          std::string::npos || // Random JWT token
      msg.find("Invalid MotherDuck token") !=
          std::string::npos) { // Revoked token
    throw MirrorError(
        ErrorKind::RemoteUnreachable,
        "Failed to connect to MotherDuck database \"" + db_name +
            "\" because the MotherDuck token is invalid. Please configure a "
            "new token.\nOriginal error: " +
            msg);
  }
}
} // namespace

std::string ConnectionFactory::database_path() const {
  if (settings.is_motherduck()) {
    return std::string(config::MOTHERDUCK_ADDRESS_PREFIX) + settings.database;
  }
  return (std::filesystem::path(settings.address) /
          (settings.database + ".duckdb"))
      .string();
}

duckdb::DuckDB &ConnectionFactory::get_duckdb() {
  if (db) {
    return *db;
  }

  const auto path = database_path();
  duckdb::DBConfig config;
  config.SetOptionByName("custom_user_agent",
                         std::string("dbmirror/") + DBMIRROR_VERSION);

  if (settings.is_motherduck()) {
    try {
      preload_motherduck_extension();
    } catch (std::exception &ex) {
      const duckdb::ErrorData error(ex);
      throw MirrorError(ErrorKind::RemoteUnreachable, error.Message());
    }
    config.SetOptionByName("motherduck_attach_mode", "single");
    if (settings.credentials.has_value()) {
      if (!settings.credentials->user.empty()) {
        logger.warning("get_duckdb: MotherDuck authenticates by token only; "
                       "ignoring remote user <" +
                       settings.credentials->user + ">");
      }
      if (!settings.credentials->password.empty()) {
        config.SetOptionByName("motherduck_token",
                               settings.credentials->password);
      }
    }
  } else {
    if (settings.credentials.has_value()) {
      logger.warning("get_duckdb: file endpoints are protected by file system "
                     "permissions; ignoring remote credentials");
    }
    // A remote server does not create databases on connect either
    if (!std::filesystem::exists(path)) {
      throw MirrorError(ErrorKind::RemoteUnreachable,
                        "Remote database \"" + settings.database +
                            "\" not found at \"" + path + "\"");
    }
  }

  try {
    logger.info("get_duckdb: creating database instance for " + path);
    db = std::make_unique<duckdb::DuckDB>(path, &config);
  } catch (std::exception &ex) {
    const duckdb::ErrorData error(ex);
    maybe_rewrite_error(error.Message(), settings.database);
    throw MirrorError(ErrorKind::RemoteUnreachable,
                      "Failed to open remote database \"" + path +
                          "\": " + error.Message());
  }
  return *db;
}

duckdb::Connection ConnectionFactory::CreateConnection() {
  logger.info("create_connection: start");
  duckdb::DuckDB &instance = get_duckdb();
  try {
    return duckdb::Connection(instance);
  } catch (std::exception &ex) {
    const duckdb::ErrorData error(ex);
    throw MirrorError(ErrorKind::RemoteUnreachable,
                      "Failed to connect to remote database \"" +
                          settings.database + "\": " + error.Message());
  }
}
