#ifndef __GM_TCP_SOCKET_HANDLER__
#define __GM_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace gm {
/**
 * @brief IPv4/IPv6 sockets. Serves the client listener and the outbound
 * connection under each remote session.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  explicit TcpSocketHandler(int _connectTimeoutSeconds = 3);
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the endpoint and connects to the first address that
   * answers within the connect timeout. The returned fd is non-blocking.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds the endpoint port. An endpoint name restricts the bind to
   * that address, otherwise every interface is used.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  int connectTimeoutSeconds;
  map<int, set<int>> portServerSockets;

  virtual void initSocket(int fd);
  /** @returns a connected fd or -1 with `error` set. */
  int connectToAddress(const addrinfo* address, const SocketEndpoint& endpoint,
                       int* error);
};
}  // namespace gm

#endif  // __GM_TCP_SOCKET_HANDLER__
