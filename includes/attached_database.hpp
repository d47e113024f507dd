#pragma once

#include "duckdb.hpp"
#include "mirror_logging.hpp"
#include <string>

/// A database file attached under an alias that gets detached when it goes
/// out of scope. Its lifetime must be shorter than the connection it is
/// attached to.
class AttachedDatabase final {
public:
  explicit AttachedDatabase(duckdb::Connection &_con, mirlog::Logger &_logger,
                            const std::string &_path, const std::string &_alias,
                            bool read_only);
  ~AttachedDatabase();

  AttachedDatabase(const AttachedDatabase &) = delete;
  AttachedDatabase &operator=(const AttachedDatabase &) = delete;

  /// Detaches right away so that errors surface; the destructor only logs.
  void detach();

  const std::string alias;

private:
  duckdb::Connection &con;
  mirlog::Logger &logger;
  bool attached = false;
};
