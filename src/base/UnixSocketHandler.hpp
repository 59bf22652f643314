#ifndef __RAILGUN_UNIX_SOCKET_HANDLER__
#define __RAILGUN_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace railgun {
/**
 * @brief Default SocketHandler implementation using POSIX sockets.
 *
 * Callers serialize access to each socket themselves.  The handler only keeps
 * track of the descriptors it opened.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /** @brief Reads up to `count` bytes from a tracked socket. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes by retrying until completion or timeout. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Wakes up any reader blocked on the descriptor. */
  virtual void shutdown(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);
  /** @brief Returns all actively tracked sockets. */
  virtual vector<int> getActiveSockets();

 protected:
  /** @brief True while the descriptor is tracked. */
  bool isActive(int fd);
  /** @brief Starts tracking a freshly opened descriptor. */
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (signal handling).
   */
  virtual void initSocket(int fd);

  /** @brief Descriptors opened by this handler and not yet closed. */
  set<int> activeSockets;
  /** @brief Guards the active socket set, never held during I/O. */
  std::mutex activeSocketsMutex;
};
}  // namespace railgun

#endif  // __RAILGUN_UNIX_SOCKET_HANDLER__
