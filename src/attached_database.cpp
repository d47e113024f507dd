#include "attached_database.hpp"
#include "mirror_logging.hpp"
#include <stdexcept>
#include <string>

using duckdb::KeywordHelper;

AttachedDatabase::AttachedDatabase(duckdb::Connection &_con,
                                   mirlog::Logger &_logger,
                                   const std::string &_path,
                                   const std::string &_alias,
                                   const bool read_only)
    : alias(_alias), con(_con), logger(_logger) {
  const std::string quoted_alias = KeywordHelper::WriteQuoted(alias, '"');

  // Run DETACH just to be extra sure we don't run into conflicts
  con.Query("DETACH DATABASE IF EXISTS " + quoted_alias);
  const auto attach_res =
      con.Query("ATTACH " + KeywordHelper::WriteQuoted(_path, '\'') + " AS " +
                quoted_alias + (read_only ? " (READ_ONLY)" : ""));
  if (attach_res->HasError()) {
    throw std::runtime_error("Failed to attach database \"" + _path +
                             "\" as \"" + alias +
                             "\": " + attach_res->GetError());
  }
  attached = true;

  logger.info("    attached database " + _path + " as " + alias);
}

void AttachedDatabase::detach() {
  if (!attached) {
    return;
  }
  attached = false;
  logger.info("    detaching database " + alias);
  const auto detach_res = con.Query("DETACH DATABASE IF EXISTS " +
                                    KeywordHelper::WriteQuoted(alias, '"'));
  if (detach_res->HasError()) {
    throw std::runtime_error("Failed to detach database \"" + alias +
                             "\": " + detach_res->GetError());
  }
}

AttachedDatabase::~AttachedDatabase() {
  if (!attached) {
    return;
  }
  // Only log errors during DETACH, but continue execution
  try {
    detach();
  } catch (const std::exception &ex) {
    logger.warning(ex.what());
  }
}
