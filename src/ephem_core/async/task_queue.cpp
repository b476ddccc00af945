#include "ephem_core/async/task_queue.hpp"

#include <stdexcept>

namespace ephem_core::async {

void TaskQueue::push(ITaskPtr task) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) {
      throw std::runtime_error("Task queue is closed");
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

ITaskPtr TaskQueue::pop(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lk(mutex_);
  cv_.wait_for(lk, wait, [this] { return closed_ || !tasks_.empty(); });
  if (closed_ || tasks_.empty()) {
    return nullptr;
  }
  ITaskPtr task = std::move(tasks_.front());
  tasks_.pop_front();
  return task;
}

void TaskQueue::close() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::vector<ITaskPtr> TaskQueue::drain() {
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<ITaskPtr> out;
  out.reserve(tasks_.size());
  while (!tasks_.empty()) {
    out.push_back(std::move(tasks_.front()));
    tasks_.pop_front();
  }
  return out;
}

size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return tasks_.size();
}

bool TaskQueue::is_closed() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return closed_;
}

}  // namespace ephem_core::async
