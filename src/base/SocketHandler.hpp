#ifndef __RAILGUN_SOCKET_HANDLER__
#define __RAILGUN_SOCKET_HANDLER__

#include "Chunk.hpp"
#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace railgun {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the internal transfer timeout while
   * waiting.
   * @throws TransportError on failure, timeout or end of stream.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   * @throws TransportError
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads and decodes the 5-byte header of the next chunk.
   */
  inline ChunkHeader readChunkHeader(int fd) {
    string s(CHUNK_HEADER_SIZE, '\0');
    readAll(fd, &s[0], CHUNK_HEADER_SIZE, false);
    return decodeChunkHeader(s);
  }

  /**
   * @brief Reads the payload announced by a previously read header.
   *
   * The buffer grows as bytes arrive, so a bogus length fails with
   * TransportError once the stream ends instead of allocating it up front.
   */
  inline string readChunkPayload(int fd, const ChunkHeader& header) {
    string s;
    char buf[CHUNK_READ_BLOCK_SIZE];
    size_t remaining = header.length;
    while (remaining > 0) {
      size_t blockSize = std::min(remaining, CHUNK_READ_BLOCK_SIZE);
      readAll(fd, buf, blockSize, false);
      s.append(buf, blockSize);
      remaining -= blockSize;
    }
    return s;
  }

  /**
   * @brief Writes a chunk header and, when non-empty, its payload.
   */
  inline void writeChunk(int fd, MessageKind kind, const string& payload) {
    ChunkHeader header = {kind, checkedPayloadLength(payload)};
    string h = encodeChunkHeader(header);
    writeAllOrThrow(fd, &h[0], h.length(), true);
    if (!payload.empty()) {
      writeAllOrThrow(fd, payload.data(), payload.length(), true);
    }
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Shuts down both directions of the socket without releasing the
   * descriptor, so that a read blocked in another thread returns.
   */
  virtual void shutdown(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace railgun

#endif  // __RAILGUN_SOCKET_HANDLER__
