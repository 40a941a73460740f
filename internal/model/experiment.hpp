#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/run.hpp"

namespace trajectory::model {

/*
  Cartesian product driver: one run per (network, seed, prompt).
*/
struct ExperimentConfig {
  std::vector<Network>      networks;
  std::vector<std::int64_t> seeds;
  std::vector<std::string>  prompts;
  std::vector<std::string>  embedding_models;
  std::uint32_t             run_length = 0;

  // Throws util::InvalidConfig on empty lists, empty networks or run_length 0.
  void Validate() const;

  // Network-major, then seed, then prompt. All runs share one experiment id.
  std::vector<Run> Expand() const;
};

} // namespace trajectory::model
