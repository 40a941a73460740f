#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/run.hpp"

namespace trajectory::engine {

/*
  Per-run loop detector.

  Remembers the first sequence number at which each output hash appeared.
  A repeat of any earlier hash stops the run with
  loop_length = sequence_number - first_seen, which covers cycles of any
  period. Reaching max_length - 1 without a repeat stops it as length
  exhausted; a repeat at that final step still reports the duplicate.

  One instance per run; never shared across runs.
*/
class CycleDetector {
 public:
  explicit CycleDetector(std::uint32_t max_length);

  // nullopt means continue.
  std::optional<model::StopReason> Observe(std::uint32_t sequence_number, const std::string& output_hash);

  std::size_t size() const {
    return first_seen_.size();
  }

 private:
  std::uint32_t                                  max_length_;
  std::unordered_map<std::string, std::uint32_t> first_seen_;
};

} // namespace trajectory::engine
