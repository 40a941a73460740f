#include "internal/engine/cycle_detector.hpp"

namespace trajectory::engine {

CycleDetector::CycleDetector(std::uint32_t max_length) : max_length_(max_length) {
}

std::optional<model::StopReason> CycleDetector::Observe(std::uint32_t sequence_number, const std::string& output_hash) {
  auto [it, inserted] = first_seen_.try_emplace(output_hash, sequence_number);
  if (!inserted) {
    return model::StopReason::Duplicate(sequence_number - it->second);
  }

  if (max_length_ > 0 && sequence_number + 1 >= max_length_) {
    return model::StopReason::LengthExhausted();
  }
  return std::nullopt;
}

} // namespace trajectory::engine
