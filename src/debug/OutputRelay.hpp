#ifndef __GM_OUTPUT_RELAY_H__
#define __GM_OUTPUT_RELAY_H__

#include "EventSink.hpp"
#include "SessionManager.hpp"

namespace gm {
/**
 * @brief Drains every debug session and fans its output out to the
 * subscribed clients.
 *
 * Each tick polls the MI controller once per session, then reads both ptys.
 * Sessions that failed during the tick are removed after all of the tick's
 * broadcasts. Between ticks the loop waits on the sessions' fds for at most
 * one interval.
 */
class OutputRelay {
 public:
  OutputRelay(shared_ptr<SessionManager> _manager,
              shared_ptr<EventSink> _sink,
              int _intervalMs = RELAY_POLL_INTERVAL_MS);
  ~OutputRelay() { stop(); }

  void tick();

  /** @brief Starts the loop thread on the first call only. */
  void startIfNeeded();
  void stop();
  bool isRunning() { return running; }

  static const char* GDB_KILLED_MESSAGE;

 protected:
  void run();
  void waitForOutput(const SessionManager::Snapshot& sessions);
  void broadcast(const set<string>& clientIds, const string& event,
                 const json& payload);

  shared_ptr<SessionManager> manager;
  shared_ptr<EventSink> sink;
  int intervalMs;
  atomic<bool> running;
  mutex threadMutex;
  shared_ptr<thread> relayThread;
};
}  // namespace gm

#endif  // __GM_OUTPUT_RELAY_H__
