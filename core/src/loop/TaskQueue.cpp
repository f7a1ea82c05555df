#include "sl/loop/TaskQueue.hpp"

#include <utility>

namespace sl {

void TaskQueue::post(Task task) {
  if (!task) return;
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.push_back(std::move(task));
}

std::size_t TaskQueue::runPending() {
  std::deque<Task> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(tasks_);
  }
  for (auto& task : batch) task();
  return batch.size();
}

std::size_t TaskQueue::drain(std::size_t maxTicks) {
  std::size_t total = 0;
  for (std::size_t tick = 0; tick < maxTicks; tick++) {
    std::size_t ran = runPending();
    if (ran == 0) break;
    total += ran;
  }
  return total;
}

std::size_t TaskQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

} // namespace sl
