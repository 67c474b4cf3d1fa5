#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

template <typename T> class ThreadSafeQueue {
private:
  mutable std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable cv;
  std::atomic<bool> closed{false};

public:
  // Returns false once the queue is closed; the item is not enqueued.
  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (closed) {
        return false;
      }
      queue.push(std::move(item));
    }
    cv.notify_one();
    return true;
  }

  bool pop(T &item,
           std::chrono::milliseconds timeout = std::chrono::milliseconds(100)) {
    std::unique_lock<std::mutex> lock(mtx);
    if (cv.wait_for(lock, timeout,
                    [this] { return !queue.empty() || closed; })) {
      if (!queue.empty()) {
        item = std::move(queue.front());
        queue.pop();
        return true;
      }
    }
    return false;
  }

  // Blocks until an item is available. Returns false only when the queue is
  // closed and fully drained.
  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || closed; });

    if (queue.empty()) {
      return false;
    }

    item = std::move(queue.front());
    queue.pop();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      closed = true;
    }
    cv.notify_all();
  }

  bool isClosed() const { return closed.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.empty();
  }
};

#endif
