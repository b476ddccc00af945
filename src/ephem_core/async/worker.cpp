#include "ephem_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "ephem_core/async/task_queue.hpp"

namespace ephem_core::async {

namespace {
constexpr std::chrono::milliseconds POLL_INTERVAL{200};
}

Worker::Worker(int worker_id, TaskQueue& queue) : worker_id_(worker_id), queue_(queue) {}

Worker::~Worker() {
  stop();
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::execute_task(ITask& task) {
  try {
    task.execute();
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR in " << task.get_type()
              << " task: " << e.what() << std::endl;
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop_.load()) {
    ITaskPtr task = queue_.pop(POLL_INTERVAL);
    if (task) {
      execute_task(*task);
    } else if (queue_.is_closed()) {
      break;
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  ITaskPtr task = queue_.pop(std::chrono::milliseconds(0));
  if (!task) {
    return false;
  }
  execute_task(*task);
  return true;
}

}  // namespace ephem_core::async
