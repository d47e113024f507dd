#include "mirror_run.hpp"

#include "backup_naming.hpp"
#include "connection_factory.hpp"
#include "duckdb_remote_endpoint.hpp"
#include "duckdb_source.hpp"
#include "mirror_error.hpp"
#include "table_sync.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <string>

using mirror_error::ErrorKind;
using mirror_error::MirrorError;

namespace {
std::string to_lower(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}
} // namespace

MirrorRun::MirrorRun(const RunConfiguration &config_, BackupSink &backup_sink_,
                     SourceCatalog &source_, RemoteEndpoint &remote_,
                     const CancellationToken &token_, mirlog::Logger &logger_)
    : config(config_), backup_sink(backup_sink_), source(source_),
      remote(remote_), token(token_), logger(logger_) {}

void MirrorRun::run_backup(const BackupDescriptor &descriptor) {
  logger.info("Backing up database <" + config.source_database + "> to " +
              descriptor.full_path);
  try {
    backup_sink.backup(config.source_database, descriptor.full_path);
  } catch (const MirrorError &) {
    throw;
  } catch (const std::exception &ex) {
    throw MirrorError(ErrorKind::BackupFailed, ex.what());
  }
  logger.info("Backup of database <" + config.source_database +
              "> completed");
}

std::vector<TableRef> MirrorRun::enumerate_tables() {
  try {
    return source.list_base_tables(config.source_database);
  } catch (const MirrorError &ex) {
    if (mirror_error::is_run_fatal(ex.GetKind())) {
      throw;
    }
    throw MirrorError(ErrorKind::EnumerationFailed, ex.what());
  } catch (const std::exception &ex) {
    throw MirrorError(ErrorKind::EnumerationFailed, ex.what());
  }
}

void MirrorRun::mark_target_collisions(std::vector<TableOutcome> &outcomes) {
  // Identifiers are case insensitive on the remote, so "a_B_x" and "A_b_x"
  // name the same table
  std::map<std::string, std::vector<std::size_t>> by_target;
  for (std::size_t i = 0; i < outcomes.size(); i++) {
    by_target[to_lower(outcomes[i].target_table)].push_back(i);
  }

  for (const auto &entry : by_target) {
    const auto &indexes = entry.second;
    if (indexes.size() < 2) {
      continue;
    }
    std::string sources;
    for (const auto index : indexes) {
      if (!sources.empty()) {
        sources += ", ";
      }
      sources += "<" + outcomes[index].source.qualified_name() + ">";
    }
    for (const auto index : indexes) {
      auto &outcome = outcomes[index];
      outcome.status = TableStatus::Failed;
      outcome.error_kind = ErrorKind::TargetNameCollision;
      outcome.message = "Source tables " + sources +
                        " all map to remote table <" + outcome.target_table +
                        ">";
      logger.severe("Table <" + outcome.source.qualified_name() +
                    "> not mirrored: " + outcome.message);
    }
  }
}

void MirrorRun::sync_tables(std::vector<TableOutcome> &outcomes) {
  TableSyncer syncer(source, remote, token, logger);
  std::string stop_reason;

  for (auto &outcome : outcomes) {
    if (outcome.status == TableStatus::Failed) {
      // Already failed the collision check
      continue;
    }
    if (!stop_reason.empty()) {
      outcome.status = TableStatus::Skipped;
      outcome.message = stop_reason;
      continue;
    }
    if (token.is_cancelled()) {
      outcome.status = TableStatus::Skipped;
      outcome.error_kind = ErrorKind::Cancelled;
      outcome.message = "Run was cancelled or exceeded its deadline";
      continue;
    }

    const auto source_name = outcome.source.qualified_name();
    const table_def target{config.remote.database, REMOTE_SCHEMA_NAME,
                           outcome.target_table};
    logger.info("Table <" + source_name + ">: mirroring to " +
                target.to_escaped_string());
    try {
      syncer.sync(outcome.source, target, outcome);
      outcome.status = TableStatus::Succeeded;
      logger.info("Table <" + source_name + ">: completed, " +
                  std::to_string(outcome.rows_copied) + " rows copied");
    } catch (const MirrorError &ex) {
      outcome.status = TableStatus::Failed;
      outcome.error_kind = ex.GetKind();
      outcome.message = ex.what();
      logger.severe("Table <" + source_name + "> failed (" +
                    mirror_error::to_string(ex.GetKind()) + "): " + ex.what());
    } catch (const std::exception &ex) {
      outcome.status = TableStatus::Failed;
      outcome.message = ex.what();
      logger.severe("Table <" + source_name + "> failed: " + ex.what());
    }

    if (outcome.status == TableStatus::Failed &&
        config.failure_policy == FailurePolicy::StopOnFirstFailure) {
      stop_reason = "Skipped after failure of table <" + source_name + ">";
    }
  }
}

SyncReport MirrorRun::run(const std::chrono::system_clock::time_point now) {
  logger.info("Mirror run started: " + config.describe());

  SyncReport report;
  report.backup = backup_naming::make_descriptor(
      config.source_database, config.backup_directory, now);

  token.throw_if_cancelled("backup");
  run_backup(report.backup);

  token.throw_if_cancelled("table enumeration");
  const auto tables = enumerate_tables();
  logger.info("Found " + std::to_string(tables.size()) +
              " base tables in database <" + config.source_database + ">");

  for (const auto &table : tables) {
    TableOutcome outcome;
    outcome.source = table;
    outcome.target_table = derive_target_table_name(table, config.name_suffix);
    report.tables.push_back(outcome);
  }
  mark_target_collisions(report.tables);
  sync_tables(report.tables);

  logger.info("Mirror run finished: " +
              std::to_string(report.count(TableStatus::Succeeded)) +
              " succeeded, " +
              std::to_string(report.count(TableStatus::Failed)) + " failed, " +
              std::to_string(report.count(TableStatus::Skipped)) + " skipped");
  return report;
}

CancellationToken make_cancellation_token(const RunConfiguration &config) {
  if (config.deadline.has_value()) {
    return CancellationToken(std::chrono::steady_clock::now() +
                             config.deadline.value());
  }
  return CancellationToken();
}

SyncReport execute_mirror_run(const RunConfiguration &config,
                              const CancellationToken &token,
                              mirlog::Logger &logger) {
  DuckDbSource source(config.source_database, config.source_database_path,
                      logger);
  ConnectionFactory connection_factory(config.remote, logger);
  DuckDbRemoteEndpoint remote(connection_factory, logger,
                              config.remote.is_motherduck());

  MirrorRun run(config, source, source, remote, token, logger);
  return run.run(std::chrono::system_clock::now());
}
