#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace trajectory::model {

// Birth/death pair; death is +infinity for essential classes.
struct Generator {
  double birth = 0.0;
  double death = 0.0;

  bool finite() const {
    return std::isfinite(death);
  }
  double persistence() const {
    return death - birth;
  }

  bool operator==(const Generator&) const = default;
};

struct DimensionDiagram {
  int                    dimension = 0;
  std::vector<Generator> generators;
  std::optional<double>  entropy; // absent when total finite persistence is 0
};

/*
  Topological summary of one (run, embedding model) trajectory.
  Derived and read-only once built.
*/
struct PersistenceDiagram {
  std::string                   id;
  std::string                   run_id;
  std::string                   embedding_model;
  std::vector<DimensionDiagram> dimensions; // ascending by dimension

  util::TimePoint started_at{};
  util::TimePoint completed_at{};

  double duration() const {
    return util::DurationSeconds(started_at, completed_at);
  }
};

} // namespace trajectory::model
