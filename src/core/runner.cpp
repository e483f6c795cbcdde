// core/runner.cpp - Worker pool and offload runner implementation
#include "runner.hpp"
#include "../utils.hpp"

namespace safio {

static thread_local bool t_on_worker = false;

WorkerPool::WorkerPool(unsigned threads) {
  if (threads == 0) {
    threads = 1;
  }
  for (unsigned i = 0; i < threads; ++i) {
    workers_.emplace_back(&WorkerPool::worker, this);
  }
  LOG_DEBUG("Worker pool started with " + std::to_string(threads) +
            " threads");
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto &t : workers_) {
    if (t.joinable())
      t.join();
  }
}

bool WorkerPool::on_worker_thread() { return t_on_worker; }

void WorkerPool::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerPool::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::worker() {
  t_on_worker = true;
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
      // Queued work still runs after stop is requested
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR(std::string("Background task failed: ") + e.what());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      if (queue_.empty() && active_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

void OffloadRunner::execute(const std::function<void()> &step) {
  // A step issued from inside a pool task would wait on its own pool
  if (WorkerPool::on_worker_thread()) {
    step();
    return;
  }
  std::promise<void> done;
  std::future<void> fut = done.get_future();
  pool_.submit([&step, &done] {
    step();
    done.set_value();
  });
  fut.get();
}

} // namespace safio
