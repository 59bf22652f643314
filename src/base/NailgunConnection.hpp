#ifndef __RAILGUN_NAILGUN_CONNECTION__
#define __RAILGUN_NAILGUN_CONNECTION__

#include "Chunk.hpp"
#include "Headers.hpp"
#include "SocketEndpoint.hpp"
#include "SocketHandler.hpp"

namespace railgun {
/**
 * @brief One TCP session with a nailgun server.
 *
 * Owns the socket and a background heartbeat thread.  Every socket access
 * (foreground reads, foreground writes and heartbeats) happens under a single
 * mutex, so chunks are never interleaved on the wire.  A connection is meant
 * to be driven by one foreground thread at a time.
 */
class NailgunConnection {
 public:
  NailgunConnection(shared_ptr<SocketHandler> _socketHandler,
                    const SocketEndpoint& _endpoint,
                    std::chrono::milliseconds _heartbeatPeriod =
                        std::chrono::milliseconds(HEARTBEAT_PERIOD_MS));

  /** @brief Closes the socket and joins the heartbeat thread. */
  virtual ~NailgunConnection();

  /**
   * @brief Opens the socket and starts the heartbeat thread.  Does nothing
   * when already connected.
   * @throws ConnectionError if the server cannot be reached.
   */
  void connect();

  /**
   * @brief Closes the socket, stops the heartbeat and waits for it to exit.
   *
   * Safe to call when disconnected, and from another thread while a read is
   * blocked: the read then fails with TransportError.
   */
  void close();

  /**
   * @brief Writes one chunk under the socket lock.
   * @throws TransportError when disconnected or on I/O failure.
   */
  void writeLocked(MessageKind kind, const string& payload);

  /**
   * @brief Blocks until the next chunk arrives, under the socket lock.
   * @throws UnknownMessageTypeError if the chunk is not a server message.
   * @throws TransportError when disconnected or on I/O failure.
   */
  Chunk readLocked();

  bool isConnected() {
    lock_guard<std::mutex> guard(socketMutex);
    return socketFd != -1;
  }

  const SocketEndpoint& getEndpoint() const { return endpoint; }

  /** @brief Number of heartbeats written during the current session. */
  int64_t getHeartbeatsSent() const { return heartbeatsSent; }

  /**
   * @brief True until the heartbeat thread exits, either because the session
   * was closed or because a heartbeat could not be written.
   */
  bool isHeartbeatRunning() const { return heartbeatRunning; }

 protected:
  /**
   * @brief Body of the heartbeat thread.  Writes a heartbeat chunk every
   * period until the session is closed or a write fails.
   */
  void heartbeatLoop();

  /** @brief Throws TransportError unless a socket is open.  Needs the lock. */
  void checkConnected(const char* operation);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  std::chrono::milliseconds heartbeatPeriod;

  /** @brief Serializes every read and write on the socket. */
  std::mutex socketMutex;
  /** @brief Serializes connect() and close() against each other. */
  std::mutex lifecycleMutex;
  /** @brief Wakes the heartbeat thread early when the session is closed. */
  std::condition_variable heartbeatCondition;
  /** @brief Active socket descriptor, -1 when disconnected. */
  std::atomic<int> socketFd;
  /** @brief Set by close(), guarded by socketMutex. */
  bool heartbeatStopping;
  std::atomic<int64_t> heartbeatsSent;
  std::atomic<bool> heartbeatRunning;
  std::shared_ptr<std::thread> heartbeatThread;
};
}  // namespace railgun

#endif  // __RAILGUN_NAILGUN_CONNECTION__
