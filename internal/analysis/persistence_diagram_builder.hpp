#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/analysis/embedding_collector.hpp"
#include "internal/analysis/homology.hpp"
#include "internal/model/persistence_diagram.hpp"

namespace trajectory::analysis {

/*
  Normalized persistence entropy of one dimension: -sum(p_i * log p_i)
  with p_i = persistence_i / total over finite generators. nullopt when
  there are no finite generators or their total persistence is 0.
*/
std::optional<double> PersistenceEntropy(const std::vector<model::Generator>& generators);

/*
  Embedding trajectory -> persistence diagram.

  Pure and order independent; building twice from the same trajectory
  gives the same generators and entropies. A homology failure (empty or
  degenerate cloud included) is logged and yields nullopt: an absent
  diagram is a valid outcome, not an error.
*/
class PersistenceDiagramBuilder {
 public:
  PersistenceDiagramBuilder(std::shared_ptr<const HomologyEngine> engine, int max_dimension = 1);

  std::optional<model::PersistenceDiagram> Build(const std::string& run_id,
                                                 const std::string& embedding_model,
                                                 const Trajectory&  trajectory) const;

  int max_dimension() const {
    return max_dimension_;
  }

 private:
  std::shared_ptr<const HomologyEngine> engine_;
  int                                   max_dimension_;
};

} // namespace trajectory::analysis
