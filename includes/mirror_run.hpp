#pragma once

#include "cancellation.hpp"
#include "endpoints.hpp"
#include "mirror_logging.hpp"
#include "run_configuration.hpp"
#include "sync_report.hpp"

#include <chrono>

/// Schema all mirrored tables are created in on the remote database
inline constexpr const char *REMOTE_SCHEMA_NAME = "main";

/// One backup-then-mirror run over the given collaborators.
///
/// The backup and the table enumeration are preconditions: when either fails
/// the run throws MirrorError (BackupFailed or EnumerationFailed) and no table
/// is touched. Every other failure is confined to its table and recorded in
/// the report.
class MirrorRun {
public:
  MirrorRun(const RunConfiguration &config_, BackupSink &backup_sink_,
            SourceCatalog &source_, RemoteEndpoint &remote_,
            const CancellationToken &token_, mirlog::Logger &logger_);

  SyncReport run(std::chrono::system_clock::time_point now);

private:
  void run_backup(const BackupDescriptor &descriptor);
  std::vector<TableRef> enumerate_tables();
  void mark_target_collisions(std::vector<TableOutcome> &outcomes);
  void sync_tables(std::vector<TableOutcome> &outcomes);

  const RunConfiguration &config;
  BackupSink &backup_sink;
  SourceCatalog &source;
  RemoteEndpoint &remote;
  const CancellationToken &token;
  mirlog::Logger &logger;
};

/// Runs against the DuckDB source file and remote endpoint the configuration
/// names. Throws MirrorError for run-fatal failures.
SyncReport execute_mirror_run(const RunConfiguration &config,
                              const CancellationToken &token,
                              mirlog::Logger &logger);

/// Deadline from the configuration, counted from now
CancellationToken make_cancellation_token(const RunConfiguration &config);
