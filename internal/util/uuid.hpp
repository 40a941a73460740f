#pragma once

#include <optional>
#include <string>

#include "time.hpp"

namespace trajectory::util {

/*
  Entity ids are RFC 9562 version 7 UUIDs in canonical lowercase form.
  The leading 48 bits hold the unix millisecond timestamp and the 12-bit
  rand_a field is a per-process counter within one millisecond, so ids
  generated by this process sort in creation order.
*/
std::string NewId();

// True for a canonical 36-character version 7 id.
bool IsValidId(const std::string& id);

// Creation time encoded in a version 7 id; nullopt for anything else.
std::optional<TimePoint> IdCreatedAt(const std::string& id);

} // namespace trajectory::util
