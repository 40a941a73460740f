#include "internal/analysis/vietoris_rips.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <numeric>
#include <string>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace trajectory::analysis {

namespace {

constexpr std::uint64_t kSaturated = std::numeric_limits<std::uint64_t>::max();

std::uint64_t SaturatingAdd(std::uint64_t a, std::uint64_t b) {
  return a > kSaturated - b ? kSaturated : a + b;
}

// binom[n][k] for n <= max_n, k <= max_k, saturating.
std::vector<std::vector<std::uint64_t>> BinomialTable(std::size_t max_n, std::size_t max_k) {
  std::vector<std::vector<std::uint64_t>> binom(max_n + 1, std::vector<std::uint64_t>(max_k + 1, 0));
  for (std::size_t n = 0; n <= max_n; ++n) {
    binom[n][0] = 1;
    for (std::size_t k = 1; k <= std::min(n, max_k); ++k) {
      binom[n][k] = SaturatingAdd(binom[n - 1][k - 1], k <= n - 1 ? binom[n - 1][k] : 0);
    }
  }
  return binom;
}

struct Simplex {
  double      filtration = 0.0;
  int         dimension  = 0;
  std::size_t offset     = 0; // into the flat vertex store
};

// Reduced boundary column: ascending simplex indices, Z/2 coefficients.
using Column = std::vector<std::size_t>;

void AddColumn(Column& target, const Column& source) {
  Column sum;
  sum.reserve(target.size() + source.size());
  std::set_symmetric_difference(target.begin(), target.end(), source.begin(), source.end(), std::back_inserter(sum));
  target.swap(sum);
}

void ValidateCloud(const PointCloud& points, std::size_t max_points) {
  if (points.empty()) {
    throw util::HomologyError("point cloud is empty");
  }
  if (points.size() > max_points) {
    throw util::HomologyError("point cloud has " + std::to_string(points.size()) + " points, limit is " + std::to_string(max_points));
  }

  const std::size_t dimension = points.front().size();
  if (dimension == 0) {
    throw util::HomologyError("points have no coordinates");
  }
  for (const auto& point : points) {
    if (point.size() != dimension) {
      throw util::HomologyError("points have inconsistent dimensions");
    }
    for (float value : point) {
      if (!std::isfinite(value)) {
        throw util::HomologyError("point cloud contains non-finite coordinates");
      }
    }
  }
}

std::vector<double> DistanceMatrix(const PointCloud& points) {
  const std::size_t   n = points.size();
  std::vector<double> distances(n * n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      double sum = 0.0;
      for (std::size_t d = 0; d < points[i].size(); ++d) {
        const double delta = static_cast<double>(points[i][d]) - static_cast<double>(points[j][d]);
        sum += delta * delta;
      }
      distances[i * n + j] = distances[j * n + i] = std::sqrt(sum);
    }
  }
  return distances;
}

} // namespace

VietorisRipsHomology::VietorisRipsHomology(std::size_t max_points, std::size_t max_simplices)
    : max_points_(max_points == 0 ? kDefaultMaxPoints : max_points),
      max_simplices_(max_simplices == 0 ? kDefaultMaxSimplices : max_simplices) {
}

Intervals VietorisRipsHomology::Compute(const PointCloud& points, int max_dimension) const {
  if (max_dimension < 0) {
    throw util::HomologyError("max_dimension must be non-negative");
  }
  ValidateCloud(points, max_points_);

  const std::size_t n      = points.size();
  const std::size_t stride = static_cast<std::size_t>(max_dimension) + 2; // vertices of the largest simplex
  const std::size_t top    = std::min(n, stride);

  const auto binom = BinomialTable(n, stride);

  std::uint64_t total = 0;
  for (std::size_t k = 1; k <= top; ++k) {
    total = SaturatingAdd(total, binom[n][k]);
  }
  if (total > max_simplices_) {
    throw util::HomologyError("filtration would contain " + (total == kSaturated ? std::string("too many") : std::to_string(total)) +
                              " simplices, limit is " + std::to_string(max_simplices_));
  }

  const auto distances = DistanceMatrix(points);

  // Enumerate every simplex with at most `stride` vertices.
  std::vector<std::uint32_t> vertices;
  std::vector<Simplex>       simplices;
  vertices.reserve(static_cast<std::size_t>(total) * stride);
  simplices.reserve(static_cast<std::size_t>(total));

  for (std::size_t k = 1; k <= top; ++k) {
    std::vector<std::uint32_t> combo(k);
    std::iota(combo.begin(), combo.end(), 0u);

    while (true) {
      double filtration = 0.0;
      for (std::size_t a = 0; a < k; ++a) {
        for (std::size_t b = a + 1; b < k; ++b) {
          filtration = std::max(filtration, distances[combo[a] * n + combo[b]]);
        }
      }

      simplices.push_back({filtration, static_cast<int>(k) - 1, vertices.size()});
      vertices.insert(vertices.end(), combo.begin(), combo.end());
      vertices.resize(vertices.size() + (stride - k), 0);

      std::size_t i = k;
      while (i > 0 && combo[i - 1] == n - k + (i - 1)) --i;
      if (i == 0) break;
      ++combo[i - 1];
      for (std::size_t j = i; j < k; ++j) combo[j] = combo[j - 1] + 1;
    }
  }

  auto vertex_of = [&](const Simplex& s, std::size_t i) { return vertices[s.offset + i]; };

  // Faces precede cofaces: filtration, then dimension, then vertices.
  std::sort(simplices.begin(), simplices.end(), [&](const Simplex& a, const Simplex& b) {
    if (a.filtration != b.filtration) return a.filtration < b.filtration;
    if (a.dimension != b.dimension) return a.dimension < b.dimension;
    for (int i = 0; i <= a.dimension; ++i) {
      if (vertex_of(a, i) != vertex_of(b, i)) return vertex_of(a, i) < vertex_of(b, i);
    }
    return false;
  });

  // Combinatorial number system key, unique within one dimension.
  auto key_of = [&](const std::uint32_t* sorted, std::size_t count) {
    std::uint64_t key = 0;
    for (std::size_t i = 0; i < count; ++i) key += binom[sorted[i]][i + 1];
    return key;
  };

  std::vector<std::unordered_map<std::uint64_t, std::size_t>> index(top);
  for (std::size_t s = 0; s < simplices.size(); ++s) {
    const auto& simplex = simplices[s];
    index[simplex.dimension].emplace(key_of(&vertices[simplex.offset], simplex.dimension + 1), s);
  }

  Intervals intervals;
  for (int d = 0; d <= max_dimension; ++d) intervals[d];

  std::vector<Column>                          reduced(simplices.size());
  std::unordered_map<std::size_t, std::size_t> pivot_owner;
  std::vector<bool>                            killed(simplices.size(), false);
  std::vector<std::uint32_t>                   face(stride);

  for (std::size_t j = 0; j < simplices.size(); ++j) {
    const auto& simplex = simplices[j];

    Column column;
    if (simplex.dimension > 0) {
      const std::size_t count = simplex.dimension + 1;
      for (std::size_t skip = 0; skip < count; ++skip) {
        std::size_t f = 0;
        for (std::size_t i = 0; i < count; ++i) {
          if (i != skip) face[f++] = vertex_of(simplex, i);
        }
        column.push_back(index[simplex.dimension - 1].at(key_of(face.data(), f)));
      }
      std::sort(column.begin(), column.end());
    }

    while (!column.empty()) {
      auto owner = pivot_owner.find(column.back());
      if (owner == pivot_owner.end()) break;
      AddColumn(column, reduced[owner->second]);
    }

    if (!column.empty()) {
      const std::size_t birth_index = column.back();
      pivot_owner.emplace(birth_index, j);
      killed[birth_index] = true;

      const auto& born = simplices[birth_index];
      if (born.dimension <= max_dimension && simplex.filtration > born.filtration) {
        intervals[born.dimension].push_back({born.filtration, simplex.filtration});
      }
    }
    reduced[j] = std::move(column);
  }

  for (std::size_t i = 0; i < simplices.size(); ++i) {
    const auto& simplex = simplices[i];
    if (simplex.dimension <= max_dimension && reduced[i].empty() && !killed[i]) {
      intervals[simplex.dimension].push_back({simplex.filtration, std::numeric_limits<double>::infinity()});
    }
  }

  for (auto& entry : intervals) {
    auto& generators = entry.second;
    std::sort(generators.begin(), generators.end(), [](const model::Generator& a, const model::Generator& b) {
      return a.birth != b.birth ? a.birth < b.birth : a.death < b.death;
    });
  }
  return intervals;
}

} // namespace trajectory::analysis
