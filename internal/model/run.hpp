#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/content.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace trajectory::model {

// Ordered model identifiers, applied cyclically.
using Network = std::vector<std::string>;

const std::string& ModelAt(const Network& network, std::uint32_t sequence_number);

enum class StopKind : std::uint8_t {
  kLengthExhausted = 1,
  kDuplicate       = 2,
};

struct StopReason {
  StopKind      kind        = StopKind::kLengthExhausted;
  std::uint32_t loop_length = 0; // only meaningful for kDuplicate

  static StopReason LengthExhausted() {
    return {StopKind::kLengthExhausted, 0};
  }
  static StopReason Duplicate(std::uint32_t loop_length) {
    return {StopKind::kDuplicate, loop_length};
  }

  bool operator==(const StopReason&) const = default;
};

std::string ToString(const StopReason& reason);

struct Invocation {
  std::string   id;
  std::string   run_id;
  std::uint32_t sequence_number = 0;
  std::string   model;
  Modality      modality = Modality::kText;
  std::int64_t  seed     = 0;

  // Empty for sequence number 0, whose input is the run's initial prompt.
  std::string input_invocation_id;

  std::optional<Content> output;

  util::TimePoint started_at{};
  util::TimePoint completed_at{};

  double duration() const {
    return util::DurationSeconds(started_at, completed_at);
  }
};

/*
  One trajectory over a cyclic network, starting from one prompt and seed.
  Invocations are owned by the run and kept in sequence order.
*/
struct Run {
  std::string   id;
  std::string   experiment_id;
  Network       network;
  std::int64_t  seed = 0;
  std::string   initial_prompt;
  std::uint32_t max_length = 0;

  std::vector<Invocation> invocations;

  RunState                  state = RunState::kPending;
  std::optional<StopReason> stop_reason;
  std::optional<std::string> error;
};

// Throws util::InvalidConfig when the network is empty or max_length is 0.
void Validate(const Run& run);

// True once the final allowed step produced output, or the run stopped on a
// detected duplicate.
bool IsComplete(const Run& run);

} // namespace trajectory::model
