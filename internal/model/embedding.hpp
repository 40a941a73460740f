#pragma once

#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace trajectory::model {

struct Embedding {
  std::string        id;
  std::string        invocation_id;
  std::string        embedding_model;
  std::vector<float> vector;

  util::TimePoint started_at{};
  util::TimePoint completed_at{};

  std::size_t dimension() const {
    return vector.size();
  }
  double duration() const {
    return util::DurationSeconds(started_at, completed_at);
  }
};

} // namespace trajectory::model
