#include "Errors.hpp"
#include "MessageKind.hpp"
#include "TestHeaders.hpp"

using namespace railgun;

TEST_CASE("Every kind round trips through its tag", "[MessageKind]") {
  for (auto kind : ALL_MESSAGE_KINDS) {
    REQUIRE(kindForTag(tagForKind(kind)) == kind);
  }
}

TEST_CASE("Tags match the nailgun wire values", "[MessageKind]") {
  REQUIRE(tagForKind(MessageKind::ARGUMENT) == 'A');
  REQUIRE(tagForKind(MessageKind::COMMAND) == 'C');
  REQUIRE(tagForKind(MessageKind::CURRENT_DIR) == 'D');
  REQUIRE(tagForKind(MessageKind::ENVIRONMENT) == 'E');
  REQUIRE(tagForKind(MessageKind::END_OF_FILE) == '.');
  REQUIRE(tagForKind(MessageKind::EXIT) == 'X');
  REQUIRE(tagForKind(MessageKind::HEARTBEAT) == 'H');
  REQUIRE(tagForKind(MessageKind::LONG_ARGUMENT) == 'L');
  REQUIRE(tagForKind(MessageKind::SEND_INPUT) == 'S');
  REQUIRE(tagForKind(MessageKind::STDERR) == '2');
  REQUIRE(tagForKind(MessageKind::STDIN) == '0');
  REQUIRE(tagForKind(MessageKind::STDOUT) == '1');
}

TEST_CASE("Tags are unique", "[MessageKind]") {
  set<char> tags;
  for (auto kind : ALL_MESSAGE_KINDS) {
    tags.insert(tagForKind(kind));
  }
  REQUIRE(tags.size() == ALL_MESSAGE_KINDS.size());
}

TEST_CASE("Unknown tags are rejected", "[MessageKind]") {
  set<char> known;
  for (auto kind : ALL_MESSAGE_KINDS) {
    known.insert(tagForKind(kind));
  }
  int rejected = 0;
  for (int b = 0; b < 256; b++) {
    char tag = char(b);
    if (known.count(tag)) {
      continue;
    }
    REQUIRE_THROWS_AS(kindForTag(tag), UnknownMessageTypeError);
    rejected++;
  }
  REQUIRE(rejected == 256 - 12);
}

TEST_CASE("Only output, exit and sendinput come from the server",
          "[MessageKind]") {
  set<MessageKind> serverKinds = {MessageKind::STDOUT, MessageKind::STDERR,
                                  MessageKind::EXIT, MessageKind::SEND_INPUT};
  for (auto kind : ALL_MESSAGE_KINDS) {
    INFO("kind " << kind);
    REQUIRE(isServerMessage(kind) == (serverKinds.count(kind) > 0));
  }
}

TEST_CASE("Kinds print their protocol names", "[MessageKind]") {
  REQUIRE(kindName(MessageKind::CURRENT_DIR) == "current_dir");
  REQUIRE(kindName(MessageKind::END_OF_FILE) == "eof");
  stringstream ss;
  ss << MessageKind::SEND_INPUT;
  REQUIRE(ss.str() == "sendinput");
}
