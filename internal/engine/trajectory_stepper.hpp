#pragma once

#include <chrono>
#include <memory>

#include "internal/model/run.hpp"
#include "internal/pool/model_pools.hpp"
#include "internal/registry/model_registry.hpp"

namespace trajectory::engine {

/*
  Produces the next invocation of a run.

  The model is network[seq mod len]; the input is the run's initial prompt
  at seq 0 and the previous invocation's output afterwards. The generator
  is called through the model's worker pool and timed around the call.

  Any failure (generator exception, wrong output modality, timeout) is
  raised as util::GenerationError. Nothing is recorded on failure.
*/
class TrajectoryStepper {
 public:
  // step_timeout of zero waits indefinitely. A timed-out call is abandoned,
  // not interrupted: it keeps its pool worker until the generator returns,
  // and later calls to that model queue behind it.
  TrajectoryStepper(std::shared_ptr<const registry::ModelRegistry> registry,
                    std::shared_ptr<pool::ModelPools>              pools,
                    std::chrono::milliseconds                      step_timeout = std::chrono::milliseconds{0});

  model::Invocation Step(const model::Run& run, const model::Invocation* previous) const;

 private:
  std::shared_ptr<const registry::ModelRegistry> registry_;
  std::shared_ptr<pool::ModelPools>              pools_;
  std::chrono::milliseconds                      step_timeout_;
};

} // namespace trajectory::engine
