#ifndef __GM_SOCKET_HANDLER__
#define __GM_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace gm {
/**
 * @brief Abstract socket API used by the server and its tests.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /** @brief True when fd is readable right now. */
  virtual bool hasData(int fd) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @param timeout Throw if no byte arrives for 10 seconds.
   * @throws std::runtime_error when the peer goes away.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Writes all `count` bytes.
   * @throws std::runtime_error on failure or (with `timeout`) a stall.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads one length prefixed packet.
   * @returns false for an empty (zero length) frame.
   */
  inline bool readPacket(int fd, Packet* packet, bool timeout = false) {
    int64_t length;
    readAll(fd, (char*)&length, sizeof(int64_t), timeout);
    if (length < 0 || length > MAX_PACKET_LENGTH) {
      string s("Invalid packet size: ");
      s += std::to_string(length);
      throw std::runtime_error(s.c_str());
    }
    if (length == 0) {
      return false;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeout);
    *packet = Packet(s);
    return true;
  }

  /**
   * @param timeout Throw once the peer accepts no byte for 10 seconds.
   */
  inline void writePacket(int fd, const Packet& packet, bool timeout = true) {
    string s = packet.serialize();
    int64_t length = s.length();
    if (length > MAX_PACKET_LENGTH) {
      throw std::runtime_error("Tried to write an oversized packet");
    }
    writeAllOrThrow(fd, (const char*)&length, sizeof(int64_t), timeout);
    writeAllOrThrow(fd, &s[0], length, timeout);
  }

  /** @returns a connected fd, or -1 on failure. */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Starts listening and returns the listening fds. */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /** @returns the accepted fd, or -1 when nothing was pending. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;

  static const int64_t MAX_PACKET_LENGTH = 128 * 1024 * 1024;
};
}  // namespace gm

#endif  // __GM_SOCKET_HANDLER__
