#include "internal/engine/invocation_channel.hpp"

namespace trajectory::engine {

InvocationChannel::InvocationChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool InvocationChannel::Push(model::Invocation invocation) {
  std::unique_lock lock(mutex_);
  not_full_.wait(lock, [&] { return cancelled_ || closed_ || buffer_.size() < capacity_; });
  if (cancelled_ || closed_) {
    return false;
  }

  buffer_.push_back(std::move(invocation));
  not_empty_.notify_one();
  return true;
}

std::optional<model::Invocation> InvocationChannel::Pop() {
  std::unique_lock lock(mutex_);
  not_empty_.wait(lock, [&] { return cancelled_ || closed_ || !buffer_.empty(); });
  if (cancelled_ || buffer_.empty()) {
    return std::nullopt;
  }

  auto invocation = std::move(buffer_.front());
  buffer_.pop_front();
  not_full_.notify_one();
  return invocation;
}

void InvocationChannel::Close() {
  std::lock_guard lock(mutex_);
  closed_ = true;
  not_empty_.notify_all();
  not_full_.notify_all();
}

void InvocationChannel::Cancel() {
  std::lock_guard lock(mutex_);
  cancelled_ = true;
  buffer_.clear();
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool InvocationChannel::cancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

} // namespace trajectory::engine
