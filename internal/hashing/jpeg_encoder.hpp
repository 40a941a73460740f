#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/content.hpp"

namespace trajectory::hashing {

/*
  Baseline JPEG encoding of a decoded image via libjpeg.

  Encoder settings are fixed (library defaults + quality), so identical
  pixels always produce identical bytes. An alpha channel is dropped.
  Throws std::runtime_error on malformed images or encoder failure.
*/
std::vector<std::uint8_t> EncodeJpeg(const model::Image& image, int quality);

} // namespace trajectory::hashing
