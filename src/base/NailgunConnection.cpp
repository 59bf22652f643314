#include "NailgunConnection.hpp"

#include "Errors.hpp"

namespace railgun {
NailgunConnection::NailgunConnection(
    shared_ptr<SocketHandler> _socketHandler, const SocketEndpoint& _endpoint,
    std::chrono::milliseconds _heartbeatPeriod)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      heartbeatPeriod(_heartbeatPeriod),
      socketFd(-1),
      heartbeatStopping(false),
      heartbeatsSent(0),
      heartbeatRunning(false) {}

NailgunConnection::~NailgunConnection() { close(); }

void NailgunConnection::connect() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  lock_guard<std::mutex> guard(socketMutex);
  if (socketFd != -1) {
    VLOG(1) << "Already connected to " << endpoint;
    return;
  }

  VLOG(1) << "Connecting to " << endpoint;
  int newSocketFd = socketHandler->connect(endpoint);
  if (newSocketFd == -1) {
    stringstream oss;
    oss << "Could not connect to nailgun server at " << endpoint;
    throw ConnectionError(oss.str());
  }
  socketFd = newSocketFd;
  heartbeatStopping = false;
  heartbeatsSent = 0;
  heartbeatRunning = true;
  heartbeatThread = std::shared_ptr<std::thread>(
      new std::thread(&NailgunConnection::heartbeatLoop, this));
  LOG(INFO) << "Connected to " << endpoint << " on fd " << newSocketFd;
}

void NailgunConnection::close() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  int fd = socketFd;
  if (fd == -1 && !heartbeatThread) {
    VLOG(1) << "Tried to close a dead connection";
    return;
  }

  // Wake up a reader that may hold socketMutex while blocked on the socket.
  if (fd != -1) {
    socketHandler->shutdown(fd);
  }
  {
    lock_guard<std::mutex> guard(socketMutex);
    if (socketFd != -1) {
      socketHandler->close(socketFd);
      socketFd = -1;
    }
    heartbeatStopping = true;
    heartbeatCondition.notify_all();
  }

  if (heartbeatThread) {
    VLOG(1) << "Waiting for heartbeat thread to finish";
    heartbeatThread->join();
    heartbeatThread.reset();
  }
  LOG(INFO) << "Closed connection to " << endpoint;
}

void NailgunConnection::writeLocked(MessageKind kind, const string& payload) {
  lock_guard<std::mutex> guard(socketMutex);
  checkConnected("write");
  VLOG(2) << "Writing " << kind << " chunk (" << payload.length()
          << " bytes)";
  socketHandler->writeChunk(socketFd, kind, payload);
}

Chunk NailgunConnection::readLocked() {
  lock_guard<std::mutex> guard(socketMutex);
  checkConnected("read");
  ChunkHeader header = socketHandler->readChunkHeader(socketFd);
  if (!isServerMessage(header.kind)) {
    stringstream oss;
    oss << "Unexpected message type from server: " << header.kind;
    throw UnknownMessageTypeError(oss.str());
  }
  string payload = socketHandler->readChunkPayload(socketFd, header);
  VLOG(2) << "Read " << header.kind << " chunk (" << header.length
          << " bytes)";
  return Chunk(header, payload);
}

void NailgunConnection::checkConnected(const char* operation) {
  if (socketFd == -1) {
    throw TransportError(string("Tried to ") + operation +
                         " on a closed nailgun connection");
  }
}

void NailgunConnection::heartbeatLoop() {
  el::Helpers::setThreadName("heartbeat");
  VLOG(1) << "Heartbeat started";
  std::unique_lock<std::mutex> guard(socketMutex);
  while (true) {
    if (heartbeatStopping || socketFd == -1) {
      break;
    }
    try {
      socketHandler->writeChunk(socketFd, MessageKind::HEARTBEAT, "");
    } catch (const TransportError& te) {
      // The foreground path sees the same failure on its next read or write.
      LOG(WARNING) << "Heartbeat failed, stopping: " << te.what();
      break;
    }
    heartbeatsSent++;
    VLOG(3) << "Wrote heartbeat " << heartbeatsSent;
    heartbeatCondition.wait_for(guard, heartbeatPeriod, [this] {
      return heartbeatStopping || socketFd == -1;
    });
  }
  heartbeatRunning = false;
  VLOG(1) << "Heartbeat stopped";
}
}  // namespace railgun
