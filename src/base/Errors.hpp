#ifndef __RAILGUN_ERRORS__
#define __RAILGUN_ERRORS__

#include <stdexcept>
#include <string>

namespace railgun {
/**
 * @brief Raised when the TCP session to the nailgun server cannot be
 * established.
 */
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief Raised when a read or write fails on an established session.  The
 * connection should be considered dead.
 */
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief Raised when bytes received from the server cannot be framed or
 * interpreted.
 */
class ProtocolDecodeError : public std::runtime_error {
 public:
  explicit ProtocolDecodeError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief Raised for a tag outside the known set, or a known tag that the
 * server is not allowed to send.
 */
class UnknownMessageTypeError : public ProtocolDecodeError {
 public:
  explicit UnknownMessageTypeError(const std::string& what)
      : ProtocolDecodeError(what) {}
};
}  // namespace railgun

#endif  // __RAILGUN_ERRORS__
