#include "internal/model/experiment.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace trajectory::model {

void ExperimentConfig::Validate() const {
  if (networks.empty()) {
    throw util::InvalidConfig("networks list cannot be empty");
  }
  for (const auto& network : networks) {
    if (network.empty()) {
      throw util::InvalidConfig("network list cannot be empty");
    }
  }
  if (seeds.empty()) {
    throw util::InvalidConfig("seeds list cannot be empty");
  }
  if (prompts.empty()) {
    throw util::InvalidConfig("prompts list cannot be empty");
  }
  if (embedding_models.empty()) {
    throw util::InvalidConfig("embedding_models list cannot be empty");
  }
  if (run_length == 0) {
    throw util::InvalidConfig("run length must be greater than 0");
  }
}

std::vector<Run> ExperimentConfig::Expand() const {
  Validate();

  const auto experiment_id = util::NewId();

  std::vector<Run> runs;
  runs.reserve(networks.size() * seeds.size() * prompts.size());
  for (const auto& network : networks) {
    for (const auto seed : seeds) {
      for (const auto& prompt : prompts) {
        Run run;
        run.id             = util::NewId();
        run.experiment_id  = experiment_id;
        run.network        = network;
        run.seed           = seed;
        run.initial_prompt = prompt;
        run.max_length     = run_length;
        runs.push_back(std::move(run));
      }
    }
  }
  return runs;
}

} // namespace trajectory::model
