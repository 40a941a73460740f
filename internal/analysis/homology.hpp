#pragma once

#include <map>
#include <vector>

#include "internal/model/persistence_diagram.hpp"

namespace trajectory::analysis {

using PointCloud = std::vector<std::vector<float>>;

// dimension -> (birth, death) pairs; every dimension 0..max_dimension present.
using Intervals = std::map<int, std::vector<model::Generator>>;

/*
  Persistent homology of a point cloud. Implementations must be pure:
  the same points give the same intervals regardless of point order.
  Failures are reported as util::HomologyError.
*/
class HomologyEngine {
 public:
  virtual ~HomologyEngine() = default;

  virtual Intervals Compute(const PointCloud& points, int max_dimension) const = 0;
};

} // namespace trajectory::analysis
