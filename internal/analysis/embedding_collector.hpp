#pragma once

#include <string>
#include <vector>

#include "internal/model/embedding.hpp"
#include "internal/model/run.hpp"

namespace trajectory::analysis {

using Trajectory = std::vector<std::vector<float>>;

/*
  Ordered embedding trajectory of one run for one embedding model.

  Only invocations that produced text and have an embedding from exactly
  that model contribute, in increasing sequence number. Embeddings stored
  for image invocations are ignored; a missing embedding is a gap.
*/
Trajectory CollectTrajectory(const model::Run&                   run,
                             const std::vector<model::Embedding>& embeddings,
                             const std::string&                   embedding_model);

} // namespace trajectory::analysis
