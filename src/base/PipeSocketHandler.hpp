#ifndef __GM_PIPE_SOCKET_HANDLER__
#define __GM_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace gm {
/**
 * @brief UNIX domain sockets addressed by the endpoint name (a path).
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  virtual int connect(const SocketEndpoint& endpoint);
  /** @brief Replaces any stale socket file and restricts it to the owner. */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  static const int CONNECT_TIMEOUT_SECONDS = 3;

  static sockaddr_un pipeAddress(const string& pipePath);

  map<string, set<int>> pipeServerSockets;
};
}  // namespace gm

#endif  // __GM_PIPE_SOCKET_HANDLER__
