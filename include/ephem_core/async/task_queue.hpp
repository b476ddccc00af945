#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "ephem_core/async/ITask.hpp"

namespace ephem_core::async {

// FIFO of pending tasks shared by the workers of one pool
class TaskQueue {
 public:
  TaskQueue() = default;
  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  // Throws std::runtime_error once the queue is closed
  void push(ITaskPtr task);

  // Waits up to `wait` for a task. Returns nullptr on timeout or when closed.
  ITaskPtr pop(std::chrono::milliseconds wait);

  // Wakes every waiter and rejects further pushes
  void close();

  // Removes and returns everything still queued
  std::vector<ITaskPtr> drain();

  size_t size() const;
  bool is_closed() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ITaskPtr> tasks_;
  bool closed_ = false;
};

}  // namespace ephem_core::async
