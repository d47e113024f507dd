#include "table_sync.hpp"

#include "sql_generator.hpp"

#include <exception>
#include <string>

TableSyncer::TableSyncer(SourceCatalog &source_, RemoteEndpoint &remote_,
                         const CancellationToken &token_,
                         mirlog::Logger &logger_)
    : source(source_), remote(remote_), token(token_), logger(logger_) {}

void TableSyncer::sync(const TableRef &source_table, const table_def &target,
                       TableOutcome &outcome) {
  const auto absolute_target = target.to_escaped_string();

  token.throw_if_cancelled("schema translation");
  const auto columns = source.list_columns(source_table);
  const auto create_statement = make_create_table_statement(target, columns);

  token.throw_if_cancelled("remote table check");
  if (remote.table_exists(target)) {
    logger.info("    target " + absolute_target + " exists");
  } else {
    logger.info("    target " + absolute_target + " is absent; creating it");
    remote.execute(create_statement);
    outcome.created = true;
  }

  replace_contents(source_table, target, outcome);
}

void TableSyncer::replace_contents(const TableRef &source_table,
                                   const table_def &target,
                                   TableOutcome &outcome) {
  token.throw_if_cancelled("remote table clear");
  remote.execute(make_transaction_statement(StatementKind::BeginTransaction));
  try {
    remote.execute(make_delete_all_statement(target));

    const auto rows = source.open_rows(source_table);
    CancellableRowStream cancellable_rows(*rows, token);
    const auto row_count = remote.bulk_insert(target, cancellable_rows);

    token.throw_if_cancelled("commit");
    remote.execute(make_transaction_statement(StatementKind::Commit));
    outcome.rows_copied = row_count;
  } catch (...) {
    rollback(target);
    throw;
  }
}

void TableSyncer::rollback(const table_def &target) {
  try {
    remote.execute(make_transaction_statement(StatementKind::Rollback));
    logger.warning("    rolled back changes to " + target.to_escaped_string());
  } catch (const std::exception &ex) {
    // The original failure is the one that gets reported
    logger.warning("    could not roll back changes to " +
                   target.to_escaped_string() + ": " + ex.what());
  }
}
