#include "internal/analysis/semantic_drift.hpp"

#include <cmath>
#include <stdexcept>

namespace trajectory::analysis {

double CosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("vectors differ in length");
  }

  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return a == b ? 0.0 : 1.0;
  }
  return 1.0 - dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

std::vector<double> SemanticDrift(const Trajectory& trajectory) {
  std::vector<double> drift;
  drift.reserve(trajectory.size());
  for (const auto& point : trajectory) {
    drift.push_back(CosineDistance(trajectory.front(), point));
  }
  return drift;
}

} // namespace trajectory::analysis
