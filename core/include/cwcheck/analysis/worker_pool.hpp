// cwcheck/analysis/worker_pool.hpp - Fixed-size thread pool
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cwcheck::analysis
{

/**
 * Data-parallel executor: `std::thread` workers pull tasks from one queue.
 *
 * Tasks must not block on other tasks of the same pool.
 */
class WorkerPool
{
public:
  using Task = std::function<void()>;

  /// @param workers 0 = std::thread::hardware_concurrency()
  explicit WorkerPool(size_t workers = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool & operator=(const WorkerPool &) = delete;

  void submit(Task task);

  /**
   * Run every task and block until all of them have finished.
   * Must not be called from a worker thread.
   */
  void run_batch(std::vector<Task> tasks);

  /// Block until the queue is empty and no task is running.
  void wait_idle();

  [[nodiscard]] size_t size() const noexcept { return threads_.size(); }

private:
  void run();

  std::vector<std::thread> threads_;
  std::deque<Task> queue_;
  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  size_t active_ = 0;
  bool stopping_ = false;
};

}  // namespace cwcheck::analysis
