#ifndef __GM_GDBMUX_SERVER_H__
#define __GM_GDBMUX_SERVER_H__

#include "BackgroundTasks.hpp"
#include "ClientConnectionRegistry.hpp"
#include "EventGateway.hpp"
#include "SocketHandler.hpp"

namespace gm {
/**
 * @brief Accepts client sockets, runs the CONNECT handshake on a worker pool
 * and gives every admitted client a reader thread that feeds EVENT packets
 * to the gateway.
 */
class GdbMuxServer {
 public:
  /** @brief Starts listening on `_serverEndpoint` right away. */
  GdbMuxServer(shared_ptr<SocketHandler> _socketHandler,
               const SocketEndpoint& _serverEndpoint,
               shared_ptr<ClientConnectionRegistry> _registry,
               shared_ptr<EventGateway> _gateway);
  virtual ~GdbMuxServer();

  /** @brief Accept loop. Returns after shutdown() once every client thread
   * has finished. */
  void run();
  /** @brief Signals the accept loop and the client readers to stop. */
  void shutdown() { halt = true; }
  bool isHalted() { return halt; }

 protected:
  void acceptNewConnection(int fd);
  void handshake(int clientFd);
  void readClientEvents(const string& clientId, int clientFd);
  void dispatchPacket(const string& clientId, const Packet& packet);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<ClientConnectionRegistry> registry;
  shared_ptr<EventGateway> gateway;
  atomic<bool> halt;

  BackgroundTasks clientThreads;
  unique_ptr<ThreadPool> handshakePool;
};
}  // namespace gm

#endif  // __GM_GDBMUX_SERVER_H__
