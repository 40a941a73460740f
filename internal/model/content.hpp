#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trajectory::model {

enum class Modality : std::uint8_t {
  kText  = 0,
  kImage = 1,
};

constexpr std::string_view ToString(Modality modality) {
  return modality == Modality::kText ? "text" : "image";
}

/*
  Decoded raster image. Pixels are row-major and channel-interleaved
  (1 = grayscale, 3 = RGB, 4 = RGBA).
*/
struct Image {
  std::uint32_t             width    = 0;
  std::uint32_t             height   = 0;
  std::uint8_t              channels = 3;
  std::vector<std::uint8_t> pixels;

  bool operator==(const Image&) const = default;
};

// Output of a generative model: exactly one of text or image.
using Content = std::variant<std::string, Image>;

inline Modality ModalityOf(const Content& content) {
  return std::holds_alternative<std::string>(content) ? Modality::kText : Modality::kImage;
}

} // namespace trajectory::model
