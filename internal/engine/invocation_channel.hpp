#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/model/run.hpp"

namespace trajectory::engine {

/*
  Ordered single-run produce/consume channel.

  Push blocks while the buffer is full. Close() marks the end of the
  sequence; Pop drains what is buffered and then returns nullopt.
  Cancel() is the consumer walking away: buffered items are dropped and
  every later Push returns false so the producer stops advancing.
*/
class InvocationChannel {
 public:
  explicit InvocationChannel(std::size_t capacity = 16);

  bool                             Push(model::Invocation invocation);
  std::optional<model::Invocation> Pop();

  void Close();
  void Cancel();

  bool cancelled() const;

 private:
  std::size_t capacity_;

  mutable std::mutex            mutex_;
  std::condition_variable       not_empty_;
  std::condition_variable       not_full_;
  std::deque<model::Invocation> buffer_;
  bool                          closed_    = false;
  bool                          cancelled_ = false;
};

} // namespace trajectory::engine
