#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  FormatError,
  AccessDenied,
  NotFound,
  SizeLimitExceeded,
  ChecksumMismatch,
  Timeout,
  IOError,
  ProtocolError,
  TooManyTransfers,
  Cancelled
};

inline const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::FormatError: return "FormatError";
    case ErrorKind::AccessDenied: return "AccessDenied";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
    case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
    case ErrorKind::Timeout: return "Timeout";
    case ErrorKind::IOError: return "IOError";
    case ErrorKind::ProtocolError: return "ProtocolError";
    case ErrorKind::TooManyTransfers: return "TooManyTransfers";
    case ErrorKind::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

// Thrown by the protocol and transfer layers. The message is what gets
// reported to the user or sent to the peer as an ERROR line.
class ShareError : public std::runtime_error {
public:
  ShareError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};
