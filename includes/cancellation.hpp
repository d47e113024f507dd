#pragma once

#include "endpoints.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

/// Cancellation flag plus an optional overall deadline for one run. The flag
/// may be set from another thread or a signal handler.
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(std::chrono::steady_clock::time_point deadline_)
      : deadline(deadline_) {}

  void cancel() { cancelled.store(true); }

  [[nodiscard]] bool is_cancelled() const;

  /// Throws MirrorError(Cancelled) once cancelled or past the deadline.
  void throw_if_cancelled(const std::string &during) const;

private:
  std::atomic<bool> cancelled{false};
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

/// Checks the token before handing out each chunk of the wrapped stream.
class CancellableRowStream final : public RowStream {
public:
  CancellableRowStream(RowStream &inner_, const CancellationToken &token_)
      : inner(inner_), token(token_) {}

  duckdb::unique_ptr<duckdb::DataChunk> next_chunk() override;

private:
  RowStream &inner;
  const CancellationToken &token;
};
