// cwcheck/analysis/worker_pool.cpp - Fixed-size thread pool
#include "cwcheck/analysis/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <latch>
#include <utility>

#include "cwcheck/basic/log.hpp"

namespace cwcheck::analysis
{

WorkerPool::WorkerPool(size_t workers)
{
  if (workers == 0) {
    workers = std::max<size_t>(1, std::thread::hardware_concurrency());
  }
  threads_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads_.emplace_back([this] { run(); });
  }
  log::debug("worker pool started with {} threads", workers);
}

WorkerPool::~WorkerPool()
{
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  for (auto & t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void WorkerPool::submit(Task task)
{
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
}

void WorkerPool::run_batch(std::vector<Task> tasks)
{
  if (tasks.empty()) {
    return;
  }
  std::latch done(static_cast<std::ptrdiff_t>(tasks.size()));
  for (auto & task : tasks) {
    submit([&done, t = std::move(task)] {
      struct CountDown
      {
        std::latch & latch;
        ~CountDown() { latch.count_down(); }
      } guard{done};
      t();
    });
  }
  done.wait();
}

void WorkerPool::wait_idle()
{
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::run()
{
  for (;;) {
    Task task;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    try {
      task();
    } catch (const std::exception & e) {
      log::error("worker task failed: {}", e.what());
    }

    {
      std::lock_guard lock(mutex_);
      --active_;
      if (queue_.empty() && active_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

}  // namespace cwcheck::analysis
