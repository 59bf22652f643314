#ifndef __RAILGUN_MESSAGE_KIND__
#define __RAILGUN_MESSAGE_KIND__

#include "Headers.hpp"

namespace railgun {
/**
 * @brief Semantic type of a nailgun chunk.
 *
 * Every kind travels on the wire as a single tag byte, see tagForKind().
 */
enum class MessageKind {
  /** @brief Client -> server: one positional argument. */
  ARGUMENT,
  /** @brief Client -> server: the command (main class or alias) to run. */
  COMMAND,
  /** @brief Client -> server: working directory of the invocation. */
  CURRENT_DIR,
  /** @brief Client -> server: one KEY=VALUE environment entry. */
  ENVIRONMENT,
  /** @brief Client -> server: end of stdin. */
  END_OF_FILE,
  /** @brief Server -> client: remote process exit code, ends the session. */
  EXIT,
  /** @brief Client -> server: liveness signal, no payload. */
  HEARTBEAT,
  /** @brief Client -> server: argument too long for an ARGUMENT chunk. */
  LONG_ARGUMENT,
  /** @brief Server -> client: the remote process wants stdin. */
  SEND_INPUT,
  /** @brief Server -> client: remote stderr bytes. */
  STDERR,
  /** @brief Client -> server: local stdin bytes. */
  STDIN,
  /** @brief Server -> client: remote stdout bytes. */
  STDOUT,
};

/** @brief All kinds, in declaration order. */
extern const std::array<MessageKind, 12> ALL_MESSAGE_KINDS;

/**
 * @brief Returns the wire tag of a kind.
 */
char tagForKind(MessageKind kind);

/**
 * @brief Returns the kind carried by a wire tag.
 * @throws UnknownMessageTypeError if the byte is not one of the known tags.
 */
MessageKind kindForTag(char tag);

/**
 * @brief True for the kinds a server may send while the client waits for the
 * exit chunk.
 */
bool isServerMessage(MessageKind kind);

/** @brief Lower-case symbolic name, for logs and error messages. */
string kindName(MessageKind kind);

inline ostream& operator<<(ostream& os, MessageKind kind) {
  return os << kindName(kind);
}
}  // namespace railgun

#endif  // __RAILGUN_MESSAGE_KIND__
