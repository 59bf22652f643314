#include "UnixSocketHandler.hpp"

namespace railgun {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::isActive(int fd) {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  return activeSockets.find(fd) != activeSockets.end();
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  if (!isActive(fd)) {
    LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  if (!isActive(fd)) {
    LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  // Try to write for around 5 seconds before giving up
  time_t startTime = time(NULL);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t w;
#ifdef MSG_NOSIGNAL
    w = ::send(fd, ((const char *)buf) + bytesWritten, count - bytesWritten,
               MSG_NOSIGNAL);
#else
    w = ::write(fd, ((const char *)buf) + bytesWritten, count - bytesWritten);
#endif
    if (w < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (time(NULL) > startTime + 5) {
          // Give up
          return -1;
        }
      } else {
        return -1;
      }
    } else {
      bytesWritten += w;
    }
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  if (!activeSockets.insert(fd).second) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
}

void UnixSocketHandler::shutdown(int fd) {
  if (fd == -1) {
    return;
  }
  VLOG(1) << "Shutting down connection: " << fd;
  if (::shutdown(fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
    LOG(INFO) << "Error shutting down socket " << fd << ": "
              << strerror(errno);
  }
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  lock_guard<std::mutex> guard(activeSocketsMutex);
  auto it = activeSockets.find(fd);
  if (it == activeSockets.end()) {
    // Connection was already killed.
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  VLOG(1) << "Closing connection: " << fd;
  if (::close(fd) == -1) {
    // The peer may already have torn the socket down, nothing left to do.
    LOG(INFO) << "Error closing socket " << fd << ": " << strerror(errno);
  }
  activeSockets.erase(it);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  return vector<int>(activeSockets.begin(), activeSockets.end());
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      // On Debian + ARM processors, this can fail.  if so, just ignore SIGPIPE
      // globally
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
}
}  // namespace railgun
