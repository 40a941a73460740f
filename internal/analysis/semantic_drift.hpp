#pragma once

#include <vector>

#include "internal/analysis/embedding_collector.hpp"

namespace trajectory::analysis {

// 1 - cos(a, b). With a zero-norm side: 0 when a == b, else 1.
// Throws std::invalid_argument on a length mismatch.
double CosineDistance(const std::vector<float>& a, const std::vector<float>& b);

// Distance of every point from the first; empty in, empty out.
std::vector<double> SemanticDrift(const Trajectory& trajectory);

} // namespace trajectory::analysis
