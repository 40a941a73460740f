#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

#include "internal/pool/work_queue.hpp"

namespace trajectory::engine {

/*
  Fixed number of run slots.

  Each slot is a worker thread executing whole run jobs one after another,
  so at most `slots` runs advance at the same time. Steps inside a job stay
  sequential; jobs are independent of each other.
*/
class RunScheduler {
 public:
  using Job = std::function<void()>;

  explicit RunScheduler(std::uint32_t slots);
  ~RunScheduler();

  RunScheduler(const RunScheduler&)            = delete;
  RunScheduler& operator=(const RunScheduler&) = delete;

  void Start();

  // Throws util::InvalidState once stopped.
  void Submit(Job job);

  // Runs every queued job to completion, then joins the slots.
  void Stop();

  std::uint32_t slots() const {
    return slots_;
  }

 private:
  void Run();

  std::uint32_t            slots_;
  pool::WorkQueue<Job>     queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace trajectory::engine
