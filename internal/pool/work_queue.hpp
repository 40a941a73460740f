#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace trajectory::pool {

/*
  Thread-safe blocking queue shared by a set of workers.

  After Shutdown, Push is refused and Pop drains what is left before
  returning nullopt.
*/
template <typename T>
class WorkQueue {
 public:
  bool Push(T item) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return false;
      queue_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace trajectory::pool
