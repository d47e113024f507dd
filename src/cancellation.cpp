#include "cancellation.hpp"

#include "mirror_error.hpp"

bool CancellationToken::is_cancelled() const {
  if (cancelled.load()) {
    return true;
  }
  return deadline.has_value() &&
         std::chrono::steady_clock::now() >= deadline.value();
}

void CancellationToken::throw_if_cancelled(const std::string &during) const {
  if (cancelled.load()) {
    throw mirror_error::MirrorError(mirror_error::ErrorKind::Cancelled,
                                    "Run was cancelled during " + during);
  }
  if (deadline.has_value() &&
      std::chrono::steady_clock::now() >= deadline.value()) {
    throw mirror_error::MirrorError(mirror_error::ErrorKind::Cancelled,
                                    "Run deadline exceeded during " + during);
  }
}

duckdb::unique_ptr<duckdb::DataChunk> CancellableRowStream::next_chunk() {
  token.throw_if_cancelled("row copy");
  return inner.next_chunk();
}
