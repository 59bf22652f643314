#include "Errors.hpp"
#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"
#include "UnixSocketHandler.hpp"

using namespace railgun;

namespace {
// UnixSocketHandler over one end of a socket pair.
class SocketPairHandler : public UnixSocketHandler {
 public:
  virtual int connect(const SocketEndpoint& endpoint) { return -1; }

  int adopt(int fd) {
    addToActiveSockets(fd);
    initSocket(fd);
    return fd;
  }
};
}  // namespace

TEST_CASE("writeChunk frames like encodeChunk", "[SocketHandler]") {
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  SocketPairHandler handler;
  int fd = handler.adopt(fds[0]);

  handler.writeChunk(fd, MessageKind::ARGUMENT, "--verbose");
  handler.writeChunk(fd, MessageKind::HEARTBEAT, "");

  string expected = encodeChunk(MessageKind::ARGUMENT, "--verbose") +
                    encodeChunk(MessageKind::HEARTBEAT, "");
  string actual(expected.length(), '\0');
  RawSocketUtils::readAll(fds[1], &actual[0], actual.length());
  REQUIRE(actual == expected);
  REQUIRE(checkedPayloadLength("--verbose") == 9);

  handler.close(fd);
  ::close(fds[1]);
}

TEST_CASE("Payloads larger than one read block", "[SocketHandler]") {
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  SocketPairHandler handler;
  int fd = handler.adopt(fds[0]);

  string payload;
  for (int i = 0; payload.length() < 3 * CHUNK_READ_BLOCK_SIZE + 17; i++) {
    payload.push_back(char('a' + i % 26));
  }
  std::thread writer([&]() {
    RawSocketUtils::writeChunk(fds[1], Chunk(MessageKind::STDOUT, payload));
  });

  ChunkHeader header = handler.readChunkHeader(fd);
  REQUIRE(header.kind == MessageKind::STDOUT);
  REQUIRE(header.length == payload.length());
  REQUIRE(handler.readChunkPayload(fd, header) == payload);
  writer.join();

  handler.close(fd);
  ::close(fds[1]);
}

TEST_CASE("Announced length longer than the stream", "[SocketHandler]") {
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  SocketPairHandler handler;
  int fd = handler.adopt(fds[0]);

  const string bytes = string("\xff\xff\xff\xf0" "1", 5) + "short";
  RawSocketUtils::writeAll(fds[1], bytes.data(), bytes.length());
  ::close(fds[1]);

  ChunkHeader header = handler.readChunkHeader(fd);
  REQUIRE(header.length == 0xfffffff0u);
  REQUIRE_THROWS_AS(handler.readChunkPayload(fd, header), TransportError);
  handler.close(fd);
}

TEST_CASE("Active sockets are tracked until closed", "[SocketHandler]") {
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  SocketPairHandler handler;
  handler.adopt(fds[0]);
  handler.adopt(fds[1]);
  REQUIRE(handler.getActiveSockets().size() == 2);

  handler.close(fds[0]);
  vector<int> remaining = handler.getActiveSockets();
  REQUIRE(remaining == vector<int>{fds[1]});

  // A closed socket refuses further I/O instead of touching a stale fd.
  char c = 'x';
  ssize_t rc = handler.write(fds[0], &c, 1);
  int writeErrno = errno;
  REQUIRE(rc == -1);
  REQUIRE(writeErrno == EPIPE);
  handler.close(fds[1]);
  REQUIRE(handler.getActiveSockets().empty());
}
