#ifndef __RAILGUN_SOCKET_ENDPOINT__
#define __RAILGUN_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace railgun {
class SocketEndpoint {
 public:
  SocketEndpoint() : name(DEFAULT_NAILGUN_HOST), port(DEFAULT_NAILGUN_PORT) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace railgun

#endif  // __RAILGUN_SOCKET_ENDPOINT__
