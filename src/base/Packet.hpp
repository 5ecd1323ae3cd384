#ifndef __GM_PACKET_H__
#define __GM_PACKET_H__

#include "Headers.hpp"

namespace gm {
/**
 * @brief One framed message on a client connection: a `PacketType` byte
 * followed by an opaque payload.
 */
class Packet {
 public:
  Packet() : header(255) {}

  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}

  /** @brief Rebuilds a packet from the bytes produced by `serialize()`. */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Tried to parse an empty packet");
    }
    header = serializedPacket[0];
    payload = serializedPacket.substr(1);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "0" + payload;
    s[0] = header;
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};

/** @brief Wraps an event name and JSON body into an EVENT packet. */
inline Packet makeEventPacket(const string& name, const json& payload) {
  EventMessage message;
  message.set_name(name);
  // Invalid UTF-8 is replaced instead of throwing
  message.set_json_payload(
      payload.dump(-1, ' ', false, json::error_handler_t::replace));
  return Packet(uint8_t(PacketType::EVENT), protoToString(message));
}
}  // namespace gm

#endif  // __GM_PACKET_H__
