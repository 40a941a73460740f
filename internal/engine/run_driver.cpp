#include "internal/engine/run_driver.hpp"

#include <stdexcept>

#include "internal/hashing/content_hasher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace trajectory::engine {

RunDriver::RunDriver(model::Run run, std::shared_ptr<const TrajectoryStepper> stepper)
    : run_(std::move(run)),
      stepper_(std::move(stepper)),
      detector_(run_.max_length),
      trace_parent_(observability::CurrentTraceParent()) {
  if (!stepper_) {
    throw std::invalid_argument("RunDriver requires a stepper");
  }
  model::Validate(run_);
  if (run_.state != model::RunState::kPending || !run_.invocations.empty()) {
    throw util::InvalidConfig("run " + run_.id + " has already been started");
  }
}

void RunDriver::Transition(model::RunState to) {
  if (!model::CanTransition(run_.state, to)) {
    throw util::InvalidState("run " + run_.id + ": illegal transition " + std::string(model::ToString(run_.state)) + " -> " +
                             std::string(model::ToString(to)));
  }
  run_.state = to;
}

void RunDriver::Fail(const std::string& message) {
  run_.error = message;
  Transition(model::RunState::kFailed);
  observability::Metrics::Instance().RecordRunFinished("failed");

  TRAJECTORY_LOG_WARN("run failed", {observability::StringField("run_id", run_.id),
                                     observability::IntField("invocations", static_cast<std::int64_t>(run_.invocations.size())),
                                     observability::StringField("error", message)});
}

std::optional<model::Invocation> RunDriver::Next() {
  if (model::IsTerminal(run_.state)) {
    return std::nullopt;
  }
  if (run_.state == model::RunState::kPending) {
    Transition(model::RunState::kRunning);
    TRAJECTORY_LOG_INFO("run started", {observability::StringField("run_id", run_.id),
                                        observability::IntField("seed", run_.seed),
                                        observability::IntField("max_length", run_.max_length)});
  }

  const model::Invocation* previous        = run_.invocations.empty() ? nullptr : &run_.invocations.back();
  const std::uint32_t      sequence_number = previous ? previous->sequence_number + 1 : 0;

  model::Invocation invocation;
  std::string       hash;
  try {
    invocation = stepper_->Step(run_, previous);
    hash       = hashing::HashOutput(*invocation.output);
  } catch (const util::GenerationError& e) {
    Fail(e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    // Output that cannot be fingerprinted is as fatal as a failed call.
    Fail(util::GenerationError(e.what(), run_.id, sequence_number, model::ModelAt(run_.network, sequence_number)).what());
    return std::nullopt;
  }

  auto stop = detector_.Observe(invocation.sequence_number, hash);
  run_.invocations.push_back(invocation);

  if (stop) {
    run_.stop_reason = *stop;
    Transition(model::RunState::kCompleted);
    auto& metrics = observability::Metrics::Instance();
    if (stop->kind == model::StopKind::kDuplicate) {
      metrics.RecordRunFinished("duplicate");
      metrics.ObserveLoopLength(stop->loop_length);
    } else {
      metrics.RecordRunFinished("length_exhausted");
    }

    TRAJECTORY_LOG_INFO("run completed", {observability::StringField("run_id", run_.id),
                                          observability::IntField("invocations", static_cast<std::int64_t>(run_.invocations.size())),
                                          observability::StringField("stop_reason", model::ToString(*stop))});
  }
  return invocation;
}

void RunDriver::Drive(InvocationChannel& channel) {
  observability::SpanScope span("run.execute", trace_parent_);
  span.SetAttribute("run_id", run_.id);
  span.SetAttribute("seed", run_.seed);

  while (auto invocation = Next()) {
    if (!channel.Push(std::move(*invocation))) {
      TRAJECTORY_LOG_INFO("run stream cancelled", {observability::StringField("run_id", run_.id),
                                                   observability::IntField("invocations", static_cast<std::int64_t>(run_.invocations.size()))});
      span.AddEvent("cancelled");
      break;
    }
  }
  if (run_.error) {
    span.RecordException(*run_.error);
  }
  channel.Close();
}

} // namespace trajectory::engine
