#include "internal/engine/run_scheduler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trajectory::engine {

RunScheduler::RunScheduler(std::uint32_t slots) : slots_(slots == 0 ? 1 : slots) {
}

RunScheduler::~RunScheduler() {
  Stop();
}

void RunScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(slots_);
  for (std::uint32_t i = 0; i < slots_; ++i) {
    threads_.emplace_back(&RunScheduler::Run, this);
  }
}

void RunScheduler::Submit(Job job) {
  if (!queue_.Push(std::move(job))) {
    throw util::InvalidState("run scheduler is stopped");
  }
}

void RunScheduler::Stop() {
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  running_ = false;
}

void RunScheduler::Run() {
  while (auto job = queue_.Pop()) {
    try {
      (*job)();
    } catch (const std::exception& e) {
      TRAJECTORY_LOG_ERROR("run job failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace trajectory::engine
