#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include "core/logger.h"
#include "service/thread_safe_queue.h"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

class WorkerPool {
private:
  struct Task {
    std::string name;
    std::function<bool()> run;
  };

  std::vector<std::thread> workers_;
  ThreadSafeQueue<Task> tasks_;
  std::atomic<size_t> activeWorkers_{0};
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};
  std::atomic<size_t> totalTasksSubmitted_{0};
  std::atomic<bool> shutdown_{false};

  void workerThread(size_t workerId);
  void enqueue(Task task);

public:
  explicit WorkerPool(size_t numWorkers);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  // Queues `fn` and returns a future for its result. Exceptions thrown by
  // `fn` are delivered through the future and counted as failed tasks.
  // Throws std::runtime_error once the pool is shutting down.
  template <typename Fn>
  auto submit(const std::string &name, Fn fn)
      -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    enqueue(Task{name, [promise, fn = std::move(fn)]() mutable {
                   try {
                     if constexpr (std::is_void_v<Result>) {
                       fn();
                       promise->set_value();
                     } else {
                       promise->set_value(fn());
                     }
                     return true;
                   } catch (...) {
                     promise->set_exception(std::current_exception());
                     return false;
                   }
                 }});
    return future;
  }

  // Queues a fire-and-forget job. Exceptions are logged and counted.
  void post(const std::string &name, std::function<void()> job);

  // Stops accepting work, runs what is queued and joins the workers.
  // Idempotent.
  void shutdown();

  size_t activeWorkers() const { return activeWorkers_.load(); }
  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
  size_t pendingTasks() const { return tasks_.size(); }
  size_t totalWorkers() const { return workers_.size(); }
  size_t totalTasksSubmitted() const { return totalTasksSubmitted_.load(); }
  bool isShutdown() const { return shutdown_.load(); }
};

#endif
