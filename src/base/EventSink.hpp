#ifndef __GM_EVENT_SINK_H__
#define __GM_EVENT_SINK_H__

#include "Headers.hpp"

namespace gm {
/**
 * @brief Destination for outbound events. A room is a client id; emitting
 * to a room reaches the connection with that id, if it is still open.
 */
class EventSink {
 public:
  virtual ~EventSink() {}

  virtual void emit(const string& room, const string& event,
                    const json& payload) = 0;
};
}  // namespace gm

#endif  // __GM_EVENT_SINK_H__
