#include "internal/model/run.hpp"

#include "internal/util/errors.hpp"

namespace trajectory::model {

const std::string& ModelAt(const Network& network, std::uint32_t sequence_number) {
  if (network.empty()) {
    throw util::InvalidConfig("network must contain at least one model");
  }
  return network[sequence_number % network.size()];
}

std::string ToString(const StopReason& reason) {
  if (reason.kind == StopKind::kDuplicate) {
    return "duplicate(loop_length=" + std::to_string(reason.loop_length) + ")";
  }
  return "length-exhausted";
}

void Validate(const Run& run) {
  if (run.network.empty()) {
    throw util::InvalidConfig("run " + run.id + ": network list cannot be empty");
  }
  if (run.max_length == 0) {
    throw util::InvalidConfig("run " + run.id + ": max_length must be greater than 0");
  }
}

bool IsComplete(const Run& run) {
  if (run.stop_reason && run.stop_reason->kind == StopKind::kDuplicate) {
    return true;
  }
  if (run.invocations.empty() || run.max_length == 0) {
    return false;
  }

  for (const auto& invocation : run.invocations) {
    if (invocation.sequence_number == run.max_length - 1) {
      return invocation.output.has_value();
    }
  }
  return false;
}

} // namespace trajectory::model
