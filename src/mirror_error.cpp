#include "mirror_error.hpp"

#include <cstddef>
#include <string>

namespace mirror_error {

namespace {
// gRPC rejects status messages that do not fit into a HTTP/2 header. 8 KiB is
// well below the default limit of the C++ server and the Go/Java clients.
constexpr std::size_t MAX_GRPC_MESSAGE_SIZE = 8000;
constexpr const char *TRUNCATION_SUFFIX = "...[truncated]";

bool is_utf8_continuation_byte(const char c) {
  return (static_cast<unsigned char>(c) & 0b11000000) == 0b10000000;
}
} // namespace

const char *to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::BackupFailed:
    return "BackupFailed";
  case ErrorKind::EnumerationFailed:
    return "EnumerationFailed";
  case ErrorKind::TranslationFailed:
    return "TranslationFailed";
  case ErrorKind::RemoteUnreachable:
    return "RemoteUnreachable";
  case ErrorKind::RemoteDDLFailed:
    return "RemoteDDLFailed";
  case ErrorKind::RemoteCopyFailed:
    return "RemoteCopyFailed";
  case ErrorKind::TargetNameCollision:
    return "TargetNameCollision";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

bool is_run_fatal(const ErrorKind kind) {
  return kind == ErrorKind::BackupFailed ||
         kind == ErrorKind::EnumerationFailed;
}

std::string truncate_for_grpc_header(const std::string &message) {
  if (message.size() <= MAX_GRPC_MESSAGE_SIZE) {
    return message;
  }

  const std::string suffix(TRUNCATION_SUFFIX);
  std::size_t cut = MAX_GRPC_MESSAGE_SIZE - suffix.size();
  // Never cut in the middle of a multi-byte character: move back to the
  // start byte of the character at the cut position
  while (cut > 0 && is_utf8_continuation_byte(message[cut])) {
    --cut;
  }
  return message.substr(0, cut) + suffix;
}
} // namespace mirror_error
