#ifndef __CMUX_SESSION_ERROR__
#define __CMUX_SESSION_ERROR__

#include "Headers.hpp"

namespace cmux {
/**
 * @brief Classification of a failed command, reported to clients in the
 * `kind` field of an error response.
 */
enum class ErrorKind {
  NotFound,
  InvalidState,
  InvalidArgument,
  Unsupported,
  ProtocolError,
};

inline string errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::InvalidState:
      return "invalid_state";
    case ErrorKind::InvalidArgument:
      return "invalid_argument";
    case ErrorKind::Unsupported:
      return "unsupported";
    case ErrorKind::ProtocolError:
      return "protocol_error";
  }
  return "unknown";
}

/**
 * @brief A recoverable, per-command failure. Thrown by the session layer and
 * turned into an error response at the dispatch boundary.
 */
class SessionError : public std::runtime_error {
 public:
  SessionError(ErrorKind _kind, const string& message)
      : std::runtime_error(message), kind(_kind) {}

  ErrorKind getKind() const { return kind; }

 protected:
  ErrorKind kind;
};

/**
 * @brief The framing of an inbound stream can no longer be trusted; the
 * connection must be closed without a response.
 */
class ProtocolError : public SessionError {
 public:
  explicit ProtocolError(const string& message)
      : SessionError(ErrorKind::ProtocolError, message) {}
};

/**
 * @brief Fatal startup misconfiguration (for example no control socket).
 */
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const string& message)
      : std::runtime_error(message) {}
};
}  // namespace cmux

#endif  // __CMUX_SESSION_ERROR__
