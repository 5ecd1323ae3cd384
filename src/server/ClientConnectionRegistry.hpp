#ifndef __GM_CLIENT_CONNECTION_REGISTRY_H__
#define __GM_CLIENT_CONNECTION_REGISTRY_H__

#include "BackgroundTasks.hpp"
#include "EventSink.hpp"
#include "SocketHandler.hpp"

namespace gm {
/**
 * @brief Maps client ids (rooms) to open sockets and delivers events to
 * them. Each client has its own outbound queue drained by its own writer
 * thread, so emitting never waits on a socket. A client whose writes fail or
 * whose backlog overflows stops receiving; the reader thread notices the
 * dead socket and cleans up.
 */
class ClientConnectionRegistry : public EventSink {
 public:
  explicit ClientConnectionRegistry(shared_ptr<SocketHandler> _socketHandler);
  virtual ~ClientConnectionRegistry();

  void addClient(const string& clientId, int fd);
  /**
   * @brief Forgets the client and waits for its writer to flush what was
   * already queued (or give up on a stalled peer). The fd is not closed.
   */
  void removeClient(const string& clientId);
  bool hasClient(const string& clientId);
  vector<string> getClientIds();

  virtual void emit(const string& room, const string& event,
                    const json& payload);

  /** @brief Queues a packet outside of the event stream. */
  void sendPacket(const string& clientId, const Packet& packet);

  static const int MAX_QUEUED_PACKETS = 4096;

 protected:
  struct ClientSocket {
    explicit ClientSocket(int _fd)
        : fd(_fd), open(true), closing(false), writerDone(false) {}

    int fd;
    // False once the socket failed; queued and later packets are dropped
    bool open;
    // Set by removeClient; the writer exits when the queue is empty
    bool closing;
    bool writerDone;
    deque<Packet> outbox;
    mutex queueMutex;
    condition_variable queueCv;
  };

  shared_ptr<ClientSocket> getClient(const string& clientId);
  void drainOutbox(const string& clientId, shared_ptr<ClientSocket> client);
  void stopWriter(shared_ptr<ClientSocket> client);

  shared_ptr<SocketHandler> socketHandler;
  mutex registryMutex;
  map<string, shared_ptr<ClientSocket>> clients;
  BackgroundTasks writers;
};
}  // namespace gm

#endif  // __GM_CLIENT_CONNECTION_REGISTRY_H__
