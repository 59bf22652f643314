#include "NailgunClient.hpp"

#include "TcpSocketHandler.hpp"

namespace railgun {
NailgunClient::NailgunClient(const SocketEndpoint& _endpoint,
                             shared_ptr<ExecutionContext> _context)
    : connection(new NailgunConnection(
          shared_ptr<SocketHandler>(new TcpSocketHandler()), _endpoint)),
      context(_context) {}

NailgunClient::NailgunClient(shared_ptr<NailgunConnection> _connection,
                             shared_ptr<ExecutionContext> _context)
    : connection(_connection), context(_context) {}

NailgunClient::~NailgunClient() { connection->close(); }

void NailgunClient::connect() { connection->connect(); }

void NailgunClient::close() { connection->close(); }

ExecutionResult NailgunClient::execute(const string& command,
                                       const vector<string>& args) {
  connection->connect();

  LOG(INFO) << "Executing " << command << " with " << args.size()
            << " arguments";
  sendArguments(args);

  // Pass the context for the command execution
  sendEnvironment();
  sendCurrentDirectory();

  connection->writeLocked(MessageKind::COMMAND, command);

  ExecutionResult result = waitForExit();
  LOG(INFO) << command << " exited with " << result.exitCode;
  return result;
}

void NailgunClient::sendArguments(const vector<string>& args) {
  for (const auto& arg : args) {
    connection->writeLocked(MessageKind::ARGUMENT, arg);
  }
}

void NailgunClient::sendEnvironment() {
  connection->writeLocked(
      MessageKind::ENVIRONMENT,
      "NAILGUN_FILESEPARATOR=" + context->getFileSeparator());
  connection->writeLocked(
      MessageKind::ENVIRONMENT,
      "NAILGUN_PATHSEPARATOR=" + context->getPathSeparator());
  auto environment = context->getEnvironment();
  VLOG(1) << "Sending " << environment.size() << " environment entries";
  for (const auto& it : environment) {
    connection->writeLocked(MessageKind::ENVIRONMENT,
                            it.first + "=" + it.second);
  }
}

void NailgunClient::sendCurrentDirectory() {
  connection->writeLocked(MessageKind::CURRENT_DIR,
                          context->getCurrentDirectory());
}

ExecutionResult NailgunClient::waitForExit() {
  ExecutionResult result;
  while (true) {
    Chunk chunk = connection->readLocked();
    switch (chunk.getKind()) {
      case MessageKind::STDOUT:
        result.out.append(chunk.getPayload());
        break;
      case MessageKind::STDERR:
        result.err.append(chunk.getPayload());
        break;
      case MessageKind::EXIT:
        result.exitCode = parseExitCode(chunk.getPayload());
        return result;
      default:
        // No stdin support, the server keeps waiting or gives up.
        LOG(INFO) << "Ignoring " << chunk.getKind() << " chunk";
        break;
    }
  }
}

int parseExitCode(const string& payload) {
  const char* start = payload.c_str();
  char* end = NULL;
  errno = 0;
  long long value = std::strtoll(start, &end, 10);
  if (end == start) {
    LOG(WARNING) << "Exit chunk has no exit code, using 0: \"" << payload
                 << "\"";
    return 0;
  }
  if (errno == ERANGE || value > std::numeric_limits<int>::max() ||
      value < std::numeric_limits<int>::min()) {
    LOG(WARNING) << "Exit code out of range: " << payload;
    return value < 0 ? std::numeric_limits<int>::min()
                     : std::numeric_limits<int>::max();
  }
  return int(value);
}
}  // namespace railgun
