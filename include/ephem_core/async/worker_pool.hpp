#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "ephem_core/async/ITask.hpp"
#include "ephem_core/async/task_queue.hpp"
#include "ephem_core/async/worker.hpp"

namespace ephem_core::async {

/**
 * @class WorkerPool
 * @brief Owns a task queue and the worker threads that drain it.
 *
 * Used to run calls to external collaborators off the request threads so
 * callers can wait on them with a deadline. Follows RAII: destroying the
 * pool stops and joins every worker.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads Number of workers. Throws std::invalid_argument on 0.
   */
  explicit WorkerPool(size_t num_threads);

  /**
   * @brief Destructor. Stops the pool if it is still running.
   */
  ~WorkerPool();

  /**
   * @brief Starts every worker. A second call logs a warning and returns.
   */
  void start();

  /**
   * @brief Stops accepting work, joins the workers and abandons whatever is
   *        still queued. Safe to call more than once.
   */
  void stop();

  /**
   * @brief Queues a task. Throws std::runtime_error once the pool is stopped.
   */
  void submit(ITaskPtr task);

  bool is_running() const;
  size_t size() const {
    return m_workers.size();
  }
  size_t pending() const {
    return m_queue.size();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  TaskQueue m_queue;
  std::vector<std::unique_ptr<Worker>> m_workers;
  mutable std::mutex m_state_mutex;
  bool m_is_running = false;
};

}  // namespace ephem_core::async
