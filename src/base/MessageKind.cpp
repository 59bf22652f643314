#include "MessageKind.hpp"

#include "Errors.hpp"

namespace railgun {
const std::array<MessageKind, 12> ALL_MESSAGE_KINDS = {
    MessageKind::ARGUMENT,      MessageKind::COMMAND,
    MessageKind::CURRENT_DIR,   MessageKind::ENVIRONMENT,
    MessageKind::END_OF_FILE,   MessageKind::EXIT,
    MessageKind::HEARTBEAT,     MessageKind::LONG_ARGUMENT,
    MessageKind::SEND_INPUT,    MessageKind::STDERR,
    MessageKind::STDIN,         MessageKind::STDOUT,
};

char tagForKind(MessageKind kind) {
  switch (kind) {
    case MessageKind::ARGUMENT:
      return 'A';
    case MessageKind::COMMAND:
      return 'C';
    case MessageKind::CURRENT_DIR:
      return 'D';
    case MessageKind::ENVIRONMENT:
      return 'E';
    case MessageKind::END_OF_FILE:
      return '.';
    case MessageKind::EXIT:
      return 'X';
    case MessageKind::HEARTBEAT:
      return 'H';
    case MessageKind::LONG_ARGUMENT:
      return 'L';
    case MessageKind::SEND_INPUT:
      return 'S';
    case MessageKind::STDERR:
      return '2';
    case MessageKind::STDIN:
      return '0';
    case MessageKind::STDOUT:
      return '1';
  }
  STFATAL << "Invalid message kind: " << int(kind);
  return '\0';
}

MessageKind kindForTag(char tag) {
  switch (tag) {
    case 'A':
      return MessageKind::ARGUMENT;
    case 'C':
      return MessageKind::COMMAND;
    case 'D':
      return MessageKind::CURRENT_DIR;
    case 'E':
      return MessageKind::ENVIRONMENT;
    case '.':
      return MessageKind::END_OF_FILE;
    case 'X':
      return MessageKind::EXIT;
    case 'H':
      return MessageKind::HEARTBEAT;
    case 'L':
      return MessageKind::LONG_ARGUMENT;
    case 'S':
      return MessageKind::SEND_INPUT;
    case '2':
      return MessageKind::STDERR;
    case '0':
      return MessageKind::STDIN;
    case '1':
      return MessageKind::STDOUT;
    default:
      break;
  }
  stringstream oss;
  oss << "Unknown message type tag: 0x" << std::hex
      << int(static_cast<unsigned char>(tag));
  throw UnknownMessageTypeError(oss.str());
}

bool isServerMessage(MessageKind kind) {
  return kind == MessageKind::STDOUT || kind == MessageKind::STDERR ||
         kind == MessageKind::EXIT || kind == MessageKind::SEND_INPUT;
}

string kindName(MessageKind kind) {
  switch (kind) {
    case MessageKind::ARGUMENT:
      return "argument";
    case MessageKind::COMMAND:
      return "command";
    case MessageKind::CURRENT_DIR:
      return "current_dir";
    case MessageKind::ENVIRONMENT:
      return "environment";
    case MessageKind::END_OF_FILE:
      return "eof";
    case MessageKind::EXIT:
      return "exit";
    case MessageKind::HEARTBEAT:
      return "heartbeat";
    case MessageKind::LONG_ARGUMENT:
      return "longarg";
    case MessageKind::SEND_INPUT:
      return "sendinput";
    case MessageKind::STDERR:
      return "stderr";
    case MessageKind::STDIN:
      return "stdin";
    case MessageKind::STDOUT:
      return "stdout";
  }
  return "unknown";
}
}  // namespace railgun
