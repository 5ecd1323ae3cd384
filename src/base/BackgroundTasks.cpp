#include "BackgroundTasks.hpp"

namespace gm {
void BackgroundTasks::spawn(const string& name, function<void()> task) {
  lock_guard<recursive_mutex> guard(tasksMutex);
  reapFinished();
  auto done = make_shared<atomic<bool>>(false);
  auto worker = make_shared<thread>([name, task, done]() {
    el::Helpers::setThreadName(name);
    try {
      task();
    } catch (const std::exception& ex) {
      STERROR << "Background task " << name << " died: " << ex.what();
    }
    done->store(true);
  });
  tasks.push_back({worker, done});
}

void BackgroundTasks::joinAll() {
  while (true) {
    vector<Task> toJoin;
    {
      lock_guard<recursive_mutex> guard(tasksMutex);
      if (tasks.empty()) {
        return;
      }
      toJoin.swap(tasks);
    }
    for (auto& task : toJoin) {
      if (task.worker->get_id() == this_thread::get_id()) {
        // A task cannot join itself
        task.worker->detach();
      } else if (task.worker->joinable()) {
        task.worker->join();
      }
    }
  }
}

int BackgroundTasks::numRunning() {
  lock_guard<recursive_mutex> guard(tasksMutex);
  int count = 0;
  for (auto& task : tasks) {
    if (!task.done->load()) {
      count++;
    }
  }
  return count;
}

void BackgroundTasks::reapFinished() {
  auto it = tasks.begin();
  while (it != tasks.end()) {
    if (it->done->load()) {
      if (it->worker->joinable()) {
        it->worker->join();
      }
      it = tasks.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace gm
