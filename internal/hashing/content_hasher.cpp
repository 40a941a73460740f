#include "internal/hashing/content_hasher.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <variant>

#include "internal/hashing/jpeg_encoder.hpp"

namespace trajectory::hashing {

std::string Sha256Hex(const void* data, std::size_t size) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_Digest(data, size, digest, &length, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

std::string HashText(std::string_view text) {
  return Sha256Hex(text.data(), text.size());
}

std::string HashImage(const model::Image& image) {
  const auto encoded = EncodeJpeg(image, kImageHashQuality);
  return Sha256Hex(encoded.data(), encoded.size());
}

std::string HashOutput(const model::Content& content) {
  if (const auto* text = std::get_if<std::string>(&content)) {
    return HashText(*text);
  }
  return HashImage(std::get<model::Image>(content));
}

} // namespace trajectory::hashing
