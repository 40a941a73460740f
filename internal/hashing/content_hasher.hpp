#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>

#include "internal/model/content.hpp"

namespace trajectory::hashing {

// Images are re-encoded at this JPEG quality before hashing.
constexpr int kImageHashQuality = 30;

/*
  Deterministic SHA-256 fingerprints of invocation outputs, used only for
  cycle detection. Digests are lowercase hex.

  Text is hashed over its bytes. Images are first re-encoded to baseline
  JPEG at kImageHashQuality so pixel-identical images hash identically
  regardless of how they were originally serialized. This is exact
  equality on pixels, not perceptual similarity.
*/
std::string Sha256Hex(const void* data, std::size_t size);

std::string HashText(std::string_view text);
std::string HashImage(const model::Image& image);
std::string HashOutput(const model::Content& content);

// Any other streamable value is hashed via its string representation.
template <typename T>
std::string HashRepresentation(const T& value) {
  std::ostringstream out;
  out << value;
  return HashText(out.str());
}

} // namespace trajectory::hashing
