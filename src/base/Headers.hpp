#ifndef __RAILGUN_HEADERS__
#define __RAILGUN_HEADERS__

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "easylogging++.h"

namespace fs = std::filesystem;

using namespace std;

// Default nailgun server endpoint
const string DEFAULT_NAILGUN_HOST = "localhost";
const int DEFAULT_NAILGUN_PORT = 2113;

// Period between two heartbeat chunks, in milliseconds
const int HEARTBEAT_PERIOD_MS = 500;

// Seconds to wait for the TCP handshake on each resolved address
const int CONNECT_TIMEOUT_SECONDS = 3;

#define STFATAL LOG(FATAL) << "Fatal error: "

#define STERROR LOG(ERROR) << "Error: "

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "(" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "(" << GetErrno() << "): " << strerror(GetErrno());

#ifndef RAILGUN_VERSION
#define RAILGUN_VERSION "unknown"
#endif

namespace railgun {
inline bool waitOnSocketData(int fd) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  VLOG(4) << "Before polling fd " << fd;
  int rc = ::poll(&pfd, 1, 1000);
  if (rc == -1 && GetErrno() == EINTR) {
    return false;
  }
  FATAL_FAIL(rc);
  // Hangups and errors count as readable so the next read reports them.
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace railgun

#endif  // __RAILGUN_HEADERS__
