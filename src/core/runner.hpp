// core/runner.hpp - Blocking step execution strategies
#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace safio {

// Fixed-size pool of worker threads consuming a FIFO task queue.
// The destructor drains queued tasks before joining.
class WorkerPool {
public:
  explicit WorkerPool(unsigned threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  // Fire-and-forget; a throwing task is logged and dropped
  void submit(std::function<void()> task);

  template <typename F>
  auto spawn(F &&fn) -> std::future<std::invoke_result_t<std::decay_t<F> &>> {
    using T = std::invoke_result_t<std::decay_t<F> &>;
    auto task =
        std::make_shared<std::packaged_task<T()>>(std::forward<F>(fn));
    std::future<T> fut = task->get_future();
    submit([task] { (*task)(); });
    return fut;
  }

  // Blocks until the queue is empty and no task is running
  void drain();

  size_t thread_count() const { return workers_.size(); }
  static bool on_worker_thread();

private:
  void worker();

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  size_t active_ = 0;
  bool stop_ = false;
};

// Runs one blocking step (a bridge call or a local syscall) and hands back
// its value or rethrows its exception. Algorithms are written once against
// this interface; the strategy is picked where the facade is built.
class Runner {
public:
  virtual ~Runner() = default;

  template <typename F> auto run(F &&step) -> std::invoke_result_t<F &> {
    using T = std::invoke_result_t<F &>;
    std::exception_ptr error;
    if constexpr (std::is_void_v<T>) {
      execute([&] {
        try {
          step();
        } catch (...) {
          error = std::current_exception();
        }
      });
      if (error)
        std::rethrow_exception(error);
    } else {
      std::optional<T> result;
      execute([&] {
        try {
          result.emplace(step());
        } catch (...) {
          error = std::current_exception();
        }
      });
      if (error)
        std::rethrow_exception(error);
      return std::move(*result);
    }
  }

  virtual const char *name() const = 0;

protected:
  // Must not return before step has finished
  virtual void execute(const std::function<void()> &step) = 0;
};

// Executes the step on the calling thread
class InlineRunner : public Runner {
public:
  const char *name() const override { return "inline"; }

protected:
  void execute(const std::function<void()> &step) override { step(); }
};

// Hands the step to a worker thread and suspends the caller until it is done
class OffloadRunner : public Runner {
public:
  explicit OffloadRunner(WorkerPool &pool) : pool_(pool) {}
  const char *name() const override { return "offload"; }

protected:
  void execute(const std::function<void()> &step) override;

private:
  WorkerPool &pool_;
};

} // namespace safio
