#include "internal/analysis/embedding_collector.hpp"

#include <algorithm>
#include <unordered_map>

namespace trajectory::analysis {

Trajectory CollectTrajectory(const model::Run& run, const std::vector<model::Embedding>& embeddings, const std::string& embedding_model) {
  std::unordered_map<std::string, const model::Embedding*> by_invocation;
  for (const auto& embedding : embeddings) {
    if (embedding.embedding_model == embedding_model && !embedding.vector.empty()) {
      by_invocation.emplace(embedding.invocation_id, &embedding);
    }
  }

  std::vector<const model::Invocation*> ordered;
  ordered.reserve(run.invocations.size());
  for (const auto& invocation : run.invocations) {
    ordered.push_back(&invocation);
  }
  std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) { return a->sequence_number < b->sequence_number; });

  Trajectory trajectory;
  for (const auto* invocation : ordered) {
    if (invocation->modality != model::Modality::kText) continue;
    if (!invocation->output || model::ModalityOf(*invocation->output) != model::Modality::kText) continue;

    auto it = by_invocation.find(invocation->id);
    if (it == by_invocation.end()) continue;

    trajectory.push_back(it->second->vector);
  }
  return trajectory;
}

} // namespace trajectory::analysis
