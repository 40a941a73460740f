#pragma once

#include <cstddef>

#include "internal/analysis/homology.hpp"

namespace trajectory::analysis {

/*
  Vietoris-Rips persistent homology over Z/2.

  Builds the full Euclidean Rips filtration up to (max_dimension + 1)
  simplices and reduces its boundary matrix column by column. Pairs with
  zero persistence are dropped; classes that never die are reported with
  death = +infinity.

  Rejects (util::HomologyError) empty clouds, zero-length, ragged or
  non-finite vectors, clouds larger than max_points, and filtrations with
  more than max_simplices simplices.
*/
class VietorisRipsHomology final : public HomologyEngine {
 public:
  static constexpr std::size_t kDefaultMaxPoints    = 256;
  static constexpr std::size_t kDefaultMaxSimplices = 3'000'000;

  explicit VietorisRipsHomology(std::size_t max_points = kDefaultMaxPoints, std::size_t max_simplices = kDefaultMaxSimplices);

  Intervals Compute(const PointCloud& points, int max_dimension) const override;

 private:
  std::size_t max_points_;
  std::size_t max_simplices_;
};

} // namespace trajectory::analysis
