#include "internal/hashing/content_hasher.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/hashing/jpeg_encoder.hpp"

namespace {

using trajectory::model::Content;
using trajectory::model::Image;

Image Solid(std::uint32_t size, std::uint8_t channels, std::uint8_t value) {
  Image image;
  image.width    = size;
  image.height   = size;
  image.channels = channels;
  image.pixels.assign(static_cast<std::size_t>(size) * size * channels, value);
  return image;
}

Image Gradient(std::uint32_t size) {
  Image image;
  image.width    = size;
  image.height   = size;
  image.channels = 3;
  for (std::uint32_t y = 0; y < size; ++y) {
    for (std::uint32_t x = 0; x < size; ++x) {
      image.pixels.push_back(static_cast<std::uint8_t>(x * 8));
      image.pixels.push_back(static_cast<std::uint8_t>(y * 8));
      image.pixels.push_back(128);
    }
  }
  return image;
}

void TestTextDigestIsSha256() {
  assert(trajectory::hashing::HashText("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(trajectory::hashing::HashText("").size() == 64);
}

void TestTextHashingIsPure() {
  const auto first  = trajectory::hashing::HashOutput(Content{std::string("a red balloon")});
  const auto second = trajectory::hashing::HashOutput(Content{std::string("a red balloon")});
  assert(first == second);
  assert(first == trajectory::hashing::HashText("a red balloon"));
  assert(first != trajectory::hashing::HashText("a red balloon."));
}

void TestIdenticalPixelsHashIdentically() {
  const auto a = Gradient(32);
  const auto b = Gradient(32);
  assert(trajectory::hashing::HashImage(a) == trajectory::hashing::HashImage(b));
  assert(trajectory::hashing::HashOutput(Content{a}) == trajectory::hashing::HashImage(a));
}

void TestAlphaChannelIsIgnored() {
  auto rgb  = Gradient(16);
  auto rgba = rgb;
  rgba.channels = 4;
  rgba.pixels.clear();
  for (std::size_t i = 0; i < rgb.pixels.size(); i += 3) {
    rgba.pixels.insert(rgba.pixels.end(), {rgb.pixels[i], rgb.pixels[i + 1], rgb.pixels[i + 2], 17});
  }
  assert(trajectory::hashing::HashImage(rgb) == trajectory::hashing::HashImage(rgba));
}

void TestDifferentImagesDiffer() {
  assert(trajectory::hashing::HashImage(Solid(16, 3, 0)) != trajectory::hashing::HashImage(Solid(16, 3, 255)));
  assert(trajectory::hashing::HashImage(Solid(16, 1, 0)) != trajectory::hashing::HashImage(Solid(16, 3, 0)));
}

void TestJpegOutputIsBaselineJpeg() {
  const auto bytes = trajectory::hashing::EncodeJpeg(Gradient(8), trajectory::hashing::kImageHashQuality);
  assert(bytes.size() > 4);
  assert(bytes[0] == 0xFF && bytes[1] == 0xD8);
  assert(bytes[bytes.size() - 2] == 0xFF && bytes[bytes.size() - 1] == 0xD9);
}

void TestMalformedImagesThrow() {
  auto truncated = Gradient(8);
  truncated.pixels.pop_back();

  bool threw = false;
  try {
    (void)trajectory::hashing::HashImage(truncated);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)trajectory::hashing::HashImage(Image{});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestOtherValuesHashViaRepresentation() {
  assert(trajectory::hashing::HashRepresentation(42) == trajectory::hashing::HashText("42"));
  assert(trajectory::hashing::HashRepresentation(std::string("x")) == trajectory::hashing::HashText("x"));
}

} // namespace

int main() {
  TestTextDigestIsSha256();
  TestTextHashingIsPure();
  TestIdenticalPixelsHashIdentically();
  TestAlphaChannelIsIgnored();
  TestDifferentImagesDiffer();
  TestJpegOutputIsBaselineJpeg();
  TestMalformedImagesThrow();
  TestOtherValuesHashViaRepresentation();

  std::cout << "trajectory_unit_content_hasher: pass\n";
  return 0;
}
