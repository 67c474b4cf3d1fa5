#include "service/worker_pool.h"
#include <algorithm>

// Creates the pool with `numWorkers` threads, or one per core when 0. Workers
// start immediately and block on the task queue.
WorkerPool::WorkerPool(size_t numWorkers) {
  if (numWorkers == 0) {
    numWorkers = std::max<size_t>(1, std::thread::hardware_concurrency());
    Logger::warning(LogCategory::SERVICE, "WorkerPool",
                    "numWorkers was 0, using hardware_concurrency: " +
                        std::to_string(numWorkers));
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&WorkerPool::workerThread, this, i);
  }

  Logger::info(LogCategory::SERVICE, "WorkerPool",
               "Created worker pool with " + std::to_string(numWorkers) +
                   " workers");
}

WorkerPool::~WorkerPool() { shutdown(); }

// Pops tasks until the queue is closed and drained. A task reports failure
// either by returning false or by throwing; both count as failed.
void WorkerPool::workerThread(size_t workerId) {
  Logger::debug(LogCategory::SERVICE, "workerThread",
                "Worker #" + std::to_string(workerId) + " started");

  Task task;
  while (tasks_.popBlocking(task)) {
    activeWorkers_++;

    try {
      if (task.run()) {
        completedTasks_++;
      } else {
        failedTasks_++;
        Logger::warning(LogCategory::SERVICE, "workerThread",
                        "Worker #" + std::to_string(workerId) + " task " +
                            task.name + " failed");
      }
    } catch (const std::exception &e) {
      failedTasks_++;
      Logger::error(LogCategory::SERVICE, "workerThread",
                    "Worker #" + std::to_string(workerId) + " task " +
                        task.name + " threw: " + std::string(e.what()));
    }

    activeWorkers_--;
    task = Task{};
  }

  Logger::debug(LogCategory::SERVICE, "workerThread",
                "Worker #" + std::to_string(workerId) + " stopped");
}

void WorkerPool::enqueue(Task task) {
  std::string name = task.name;
  if (shutdown_.load() || !tasks_.push(std::move(task))) {
    throw std::runtime_error("Worker pool is shutting down; task " + name +
                             " rejected");
  }
  totalTasksSubmitted_++;
}

void WorkerPool::post(const std::string &name, std::function<void()> job) {
  enqueue(Task{name, [job = std::move(job)]() {
                 job();
                 return true;
               }});
}

// Closes the queue, lets the workers finish what was already queued and joins
// them. Safe to call more than once.
void WorkerPool::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }

  Logger::info(LogCategory::SERVICE, "WorkerPool",
               "Shutting down worker pool...");

  tasks_.close();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  Logger::info(LogCategory::SERVICE, "WorkerPool",
               "Worker pool stopped - Completed: " +
                   std::to_string(completedTasks_.load()) +
                   " | Failed: " + std::to_string(failedTasks_.load()));
}
