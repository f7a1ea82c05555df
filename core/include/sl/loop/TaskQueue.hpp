#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace sl {

// The UI thread's task queue. Pointer events, resize events and network
// completions all arrive as tasks. post() may be called from any thread;
// runPending() only from the UI thread.
class TaskQueue {
public:
  using Task = std::function<void()>;

  void post(Task task);

  // Runs the tasks queued before this call (one "tick"). Tasks posted while
  // running are left for the next tick. Returns the number run.
  std::size_t runPending();

  // Ticks until the queue is empty or `maxTicks` is reached.
  std::size_t drain(std::size_t maxTicks = 64);

  std::size_t pending() const;

private:
  mutable std::mutex mutex_;
  std::deque<Task> tasks_;
};

} // namespace sl
