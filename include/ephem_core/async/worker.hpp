#pragma once

#include <atomic>
#include <thread>

namespace ephem_core::async {

class TaskQueue;
class ITask;

/**
 * @class Worker
 * @brief A background thread that executes tasks from a shared TaskQueue.
 *
 * Workers are owned by a WorkerPool. They are non-copyable and non-movable
 * so that ownership of the underlying thread stays unambiguous.
 */
class Worker {
 public:
  /**
   * @brief Constructs a Worker instance.
   * @param worker_id Identifier used in log lines.
   * @param queue The queue this worker pulls from. Must outlive the worker.
   */
  Worker(int worker_id, TaskQueue& queue);

  /**
   * @brief Stops the worker and joins its thread.
   */
  ~Worker();

  /**
   * @brief Starts the processing loop in a new thread.
   *
   * Throws std::runtime_error if the worker is already running.
   */
  void start();

  /**
   * @brief Signals the loop to exit after its current task. Does not block.
   */
  void stop();

  /**
   * @brief Blocks until the worker thread has exited.
   */
  void join();

  /**
   * @brief Runs at most one queued task on the calling thread.
   * @return true if a task was executed.
   */
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();
  void execute_task(ITask& task);

  int worker_id_;
  TaskQueue& queue_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace ephem_core::async
