#include "Errors.hpp"
#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"

using namespace railgun;

TEST_CASE("RawSocketUtils moves chunks across a socket pair",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  const string bigPayload(256 * 1024, 'Y');
  std::thread writer([&]() {
    RawSocketUtils::writeChunk(fds[1], Chunk(MessageKind::STDOUT, "hello"));
    RawSocketUtils::writeChunk(fds[1], Chunk(MessageKind::HEARTBEAT, ""));
    RawSocketUtils::writeChunk(fds[1], Chunk(MessageKind::STDERR, bigPayload));
    ::close(fds[1]);
  });

  Chunk first = RawSocketUtils::readChunk(fds[0]);
  REQUIRE(first.getKind() == MessageKind::STDOUT);
  REQUIRE(first.getPayload() == "hello");
  Chunk second = RawSocketUtils::readChunk(fds[0]);
  REQUIRE(second.getKind() == MessageKind::HEARTBEAT);
  REQUIRE(second.getPayload().empty());
  Chunk third = RawSocketUtils::readChunk(fds[0]);
  REQUIRE(third.getKind() == MessageKind::STDERR);
  REQUIRE(third.getPayload() == bigPayload);

  writer.join();
  REQUIRE_THROWS_AS(RawSocketUtils::readChunk(fds[0]), TransportError);
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils readAll throws on early close", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  std::thread writer([&]() {
    const string partial = "partial";
    RawSocketUtils::writeAll(fds[1], partial.data(), partial.size());
    ::close(fds[1]);  // Close before sending all expected data
  });

  char buffer[100];
  REQUIRE_THROWS_AS(RawSocketUtils::readAll(fds[0], buffer, sizeof(buffer)),
                    TransportError);

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils rejects invalid descriptors", "[RawSocketUtils]") {
  const string payload = "test";
  char buffer[4];
  REQUIRE_THROWS_AS(RawSocketUtils::writeAll(-1, payload.data(), 4),
                    TransportError);
  REQUIRE_THROWS_AS(RawSocketUtils::readAll(-1, buffer, 4), TransportError);
}
