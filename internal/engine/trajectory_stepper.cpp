#include "internal/engine/trajectory_stepper.hpp"

#include <future>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace trajectory::engine {

TrajectoryStepper::TrajectoryStepper(std::shared_ptr<const registry::ModelRegistry> registry,
                                     std::shared_ptr<pool::ModelPools>              pools,
                                     std::chrono::milliseconds                      step_timeout)
    : registry_(std::move(registry)),
      pools_(std::move(pools)),
      step_timeout_(step_timeout) {
  if (!registry_ || !pools_) {
    throw std::invalid_argument("TrajectoryStepper requires registry and pools");
  }
}

model::Invocation TrajectoryStepper::Step(const model::Run& run, const model::Invocation* previous) const {
  const std::uint32_t sequence_number = previous ? previous->sequence_number + 1 : 0;
  const std::string&  model_id        = model::ModelAt(run.network, sequence_number);

  observability::SpanScope span("run.step");
  span.SetAttribute("run_id", run.id);
  span.SetAttribute("sequence_number", static_cast<std::int64_t>(sequence_number));
  span.SetAttribute("model", model_id);

  if (previous && !previous->output) {
    throw util::GenerationError("previous invocation has no output", run.id, sequence_number, model_id);
  }

  model::Invocation invocation;
  invocation.id              = util::NewId();
  invocation.run_id          = run.id;
  invocation.sequence_number = sequence_number;
  invocation.model           = model_id;
  invocation.seed            = run.seed;
  if (previous) {
    invocation.input_invocation_id = previous->id;
  }

  model::Content input = previous ? *previous->output : model::Content{run.initial_prompt};

  try {
    invocation.modality = registry_->OutputModality(model_id);

    invocation.started_at = util::Now();
    auto future           = pools_->Generate(model_id, std::move(input), run.seed);
    if (step_timeout_.count() > 0 && future.wait_for(step_timeout_) != std::future_status::ready) {
      throw std::runtime_error("step timed out after " + std::to_string(step_timeout_.count()) + "ms");
    }
    model::Content output   = future.get();
    invocation.completed_at = util::Now();

    if (model::ModalityOf(output) != invocation.modality) {
      throw std::runtime_error("model returned " + std::string(model::ToString(model::ModalityOf(output))) + ", declared " +
                               std::string(model::ToString(invocation.modality)));
    }
    invocation.output = std::move(output);
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordInvocation(model_id, false);
    span.RecordException(e.what());
    TRAJECTORY_LOG_ERROR("invocation failed", {observability::StringField("run_id", run.id),
                                               observability::IntField("sequence_number", sequence_number),
                                               observability::StringField("model", model_id),
                                               observability::StringField("error", e.what())});
    throw util::GenerationError(e.what(), run.id, sequence_number, model_id);
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordInvocation(model_id, true);
  metrics.ObserveInvocationLatencyMs(model_id, invocation.duration() * 1000.0);

  TRAJECTORY_LOG_DEBUG("invocation completed", {observability::StringField("run_id", run.id),
                                                observability::IntField("sequence_number", sequence_number),
                                                observability::StringField("model", model_id),
                                                observability::DoubleField("duration_s", invocation.duration())});
  return invocation;
}

} // namespace trajectory::engine
