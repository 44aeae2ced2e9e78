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
  std::atomic<bool> shutdown{false};

public:
  void push(T item) {
    std::lock_guard<std::mutex> lock(mtx);
    queue.push(std::move(item));
    cv.notify_one();
  }

  // Waits up to timeout for an item. Returns false on timeout or shutdown.
  bool pop(T &item,
           std::chrono::milliseconds timeout = std::chrono::milliseconds(100)) {
    std::unique_lock<std::mutex> lock(mtx);
    if (cv.wait_for(lock, timeout,
                    [this] { return !queue.empty() || shutdown; })) {
      if (!queue.empty()) {
        item = std::move(queue.front());
        queue.pop();
        return true;
      }
    }
    return false;
  }

  void shutdown_queue() {
    shutdown = true;
    cv.notify_all();
  }

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
