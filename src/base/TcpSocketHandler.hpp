#ifndef __RAILGUN_TCP_SOCKET_HANDLER__
#define __RAILGUN_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace railgun {
/**
 * @brief Implements IPv4/IPv6 client sockets on top of UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects to the first address that
   * accepts within CONNECT_TIMEOUT_SECONDS.  The returned socket is blocking.
   */
  virtual int connect(const SocketEndpoint& endpoint);

 protected:
  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace railgun

#endif  // __RAILGUN_TCP_SOCKET_HANDLER__
