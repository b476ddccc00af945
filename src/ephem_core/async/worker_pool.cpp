#include "ephem_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace ephem_core::async {

WorkerPool::WorkerPool(size_t num_threads) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  m_workers.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), m_queue));
  }
  std::cout << "WorkerPool created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  std::lock_guard<std::mutex> lk(m_state_mutex);
  if (m_is_running) {
    std::cerr << "Warning: WorkerPool is already running." << std::endl;
    return;
  }
  if (m_queue.is_closed()) {
    throw std::runtime_error("WorkerPool cannot be restarted after stop().");
  }
  for (const auto& worker : m_workers) {
    worker->start();
  }
  m_is_running = true;
}

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lk(m_state_mutex);
    if (m_queue.is_closed()) {
      return;
    }
    m_queue.close();
    m_is_running = false;
  }

  std::cout << "Stopping all workers in the pool..." << std::endl;
  for (const auto& worker : m_workers) {
    worker->stop();
  }
  for (const auto& worker : m_workers) {
    worker->join();
  }

  std::vector<ITaskPtr> leftover = m_queue.drain();
  for (const auto& task : leftover) {
    task->abandon("worker pool stopped before the task ran");
  }
  if (!leftover.empty()) {
    std::cout << "Abandoned " << leftover.size() << " queued tasks." << std::endl;
  }
}

void WorkerPool::submit(ITaskPtr task) {
  if (!task) {
    throw std::invalid_argument("Cannot submit a null task.");
  }
  m_queue.push(std::move(task));
}

bool WorkerPool::is_running() const {
  std::lock_guard<std::mutex> lk(m_state_mutex);
  return m_is_running;
}

}  // namespace ephem_core::async
