#include "RawSocketUtils.hpp"

#include "Errors.hpp"

namespace railgun {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw TransportError("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
        continue;
      }
      STERROR << "Cannot write to raw socket: " << strerror(localErrno);
      throw TransportError("Cannot write to raw socket");
    }
    if (rc == 0) {
      throw TransportError("Cannot write to raw socket: socket closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void RawSocketUtils::readAll(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw TransportError("Invalid file descriptor for readAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesRead = 0;
  do {
    if (!waitOnSocketData(fd)) {
      continue;
    }
    ssize_t rc = ::read(fd, buf + bytesRead, count - bytesRead);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        continue;
      }
      STERROR << "Cannot read from raw socket: " << strerror(localErrno);
      throw TransportError("Cannot read from raw socket");
    }
    if (rc == 0) {
      throw TransportError("Socket has closed abruptly.");
    }
    bytesRead += rc;
  } while (bytesRead != count);
}

void RawSocketUtils::writeChunk(int fd, const Chunk& chunk) {
  string s = chunk.serialize();
  writeAll(fd, &s[0], s.length());
}

Chunk RawSocketUtils::readChunk(int fd) {
  string h(CHUNK_HEADER_SIZE, '\0');
  readAll(fd, &h[0], h.length());
  ChunkHeader header = decodeChunkHeader(h);
  string payload;
  char buf[CHUNK_READ_BLOCK_SIZE];
  size_t remaining = header.length;
  while (remaining > 0) {
    size_t blockSize = std::min(remaining, CHUNK_READ_BLOCK_SIZE);
    readAll(fd, buf, blockSize);
    payload.append(buf, blockSize);
    remaining -= blockSize;
  }
  return Chunk(header, payload);
}
}  // namespace railgun
