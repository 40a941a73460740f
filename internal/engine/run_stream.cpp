#include "internal/engine/run_stream.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trajectory::engine {

RunStream::RunStream(RunDriver driver, std::size_t buffer)
    : driver_(std::make_unique<RunDriver>(std::move(driver))),
      channel_(buffer) {
  producer_ = std::thread([this] {
    try {
      driver_->Drive(channel_);
    } catch (const std::exception& e) {
      TRAJECTORY_LOG_ERROR("run producer failed", {observability::StringField("run_id", driver_->run().id),
                                                   observability::StringField("error", e.what())});
      failure_ = std::current_exception();
      channel_.Close();
    }
  });
}

RunStream::~RunStream() {
  channel_.Cancel();
  Join();
}

std::optional<model::Invocation> RunStream::Next() {
  return channel_.Pop();
}

void RunStream::Cancel() {
  channel_.Cancel();
}

void RunStream::Join() {
  if (producer_.joinable()) {
    producer_.join();
  }
}

RunOutcome RunStream::Finish() {
  if (finished_) {
    throw util::InvalidState("run stream already finished");
  }
  finished_ = true;

  while (channel_.Pop()) {
  }
  Join();

  if (failure_) {
    std::rethrow_exception(failure_);
  }

  RunOutcome outcome;
  outcome.state = driver_->state();
  outcome.error = driver_->error();
  outcome.run   = driver_->TakeRun();
  return outcome;
}

} // namespace trajectory::engine
