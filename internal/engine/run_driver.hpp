#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/engine/cycle_detector.hpp"
#include "internal/engine/invocation_channel.hpp"
#include "internal/engine/trajectory_stepper.hpp"
#include "internal/model/run.hpp"
#include "internal/observability/spans.hpp"

namespace trajectory::engine {

/*
  Run state machine.

    Pending -> Running -> Completed(length exhausted | duplicate)
                       -> Failed

  Each Next() performs exactly one step: generate, hash, observe. The
  invocation is appended to the run before the stop decision is applied,
  so a run that stops on a duplicate keeps the repeating invocation.
  A generation failure moves the run to Failed and keeps the error text;
  it is never retried.

  The sequence is lazy, ordered and not restartable.
*/
class RunDriver {
 public:
  // Throws util::InvalidConfig for an invalid run or one already started.
  RunDriver(model::Run run, std::shared_ptr<const TrajectoryStepper> stepper);

  // The invocation just completed, or nullopt once the run is terminal.
  std::optional<model::Invocation> Next();

  // Feeds the channel until the run is terminal or the consumer cancels,
  // then closes it. Runs under a "run.execute" span parented to the span
  // that was active when the driver was constructed.
  void Drive(InvocationChannel& channel);

  model::RunState state() const {
    return run_.state;
  }
  const model::Run& run() const {
    return run_;
  }
  const std::optional<std::string>& error() const {
    return run_.error;
  }

  model::Run TakeRun() {
    return std::move(run_);
  }

 private:
  void Transition(model::RunState to);
  void Fail(const std::string& message);

  model::Run                               run_;
  std::shared_ptr<const TrajectoryStepper> stepper_;
  CycleDetector                            detector_;
  observability::TraceParent               trace_parent_;
};

} // namespace trajectory::engine
