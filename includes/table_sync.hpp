#pragma once

#include "cancellation.hpp"
#include "endpoints.hpp"
#include "mirror_logging.hpp"
#include "schema_types.hpp"
#include "sync_report.hpp"

/// Reconciles one remote table with one source table:
///   translate -> check -> create (if absent) -> clear -> copy
/// Clear and copy share one remote transaction, which is rolled back when
/// anything in between fails or the run is cancelled.
class TableSyncer {
public:
  TableSyncer(SourceCatalog &source_, RemoteEndpoint &remote_,
              const CancellationToken &token_, mirlog::Logger &logger_);

  /// Fills in created and rows_copied of the outcome as the steps complete.
  /// Throws MirrorError on failure; the status is left to the caller.
  void sync(const TableRef &source_table, const table_def &target,
            TableOutcome &outcome);

private:
  void replace_contents(const TableRef &source_table, const table_def &target,
                        TableOutcome &outcome);
  void rollback(const table_def &target);

  SourceCatalog &source;
  RemoteEndpoint &remote;
  const CancellationToken &token;
  mirlog::Logger &logger;
};
