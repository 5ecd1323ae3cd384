#ifndef __GM_BACKGROUND_TASKS_H__
#define __GM_BACKGROUND_TASKS_H__

#include "Headers.hpp"

namespace gm {
/**
 * @brief Owns the long-lived relay threads (one per command or shell).
 * Finished threads are joined lazily on the next spawn.
 */
class BackgroundTasks {
 public:
  BackgroundTasks() {}
  ~BackgroundTasks() { joinAll(); }

  void spawn(const string& name, function<void()> task);

  /** @brief Joins every task, including ones spawned while joining. */
  void joinAll();

  int numRunning();

 protected:
  struct Task {
    shared_ptr<thread> worker;
    shared_ptr<atomic<bool>> done;
  };

  void reapFinished();

  recursive_mutex tasksMutex;
  vector<Task> tasks;
};
}  // namespace gm

#endif  // __GM_BACKGROUND_TASKS_H__
