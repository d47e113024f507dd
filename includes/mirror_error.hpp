#pragma once

#include <stdexcept>
#include <string>

namespace mirror_error {

enum class ErrorKind {
  BackupFailed,
  EnumerationFailed,
  TranslationFailed,
  RemoteUnreachable,
  RemoteDDLFailed,
  RemoteCopyFailed,
  TargetNameCollision,
  Cancelled
};

const char *to_string(ErrorKind kind);

/// True for the kinds that stop the whole run instead of a single table.
bool is_run_fatal(ErrorKind kind);

std::string truncate_for_grpc_header(const std::string &message);

/// A classified failure. The run orchestrator catches these at the table
/// boundary and turns them into table outcomes, unless the kind is run-fatal.
class MirrorError : public std::runtime_error {
public:
  explicit MirrorError(ErrorKind kind_, const std::string &msg)
      : runtime_error(msg), kind(kind_) {}

  ErrorKind GetKind() const { return kind; }

private:
  ErrorKind kind;
};
} // namespace mirror_error
