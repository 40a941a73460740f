#include "internal/models/dummy_models.hpp"

#include <algorithm>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace trajectory::models {
namespace {

// FNV-1a, stable across platforms unlike std::hash.
std::uint64_t Fingerprint(const std::string& text) {
  std::uint64_t hash = 1469598103934665603ULL;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

const std::string& ExpectText(const model::Content& input, const char* model) {
  const auto* text = std::get_if<std::string>(&input);
  if (!text) {
    throw std::invalid_argument(std::string(model) + " expects text input");
  }
  return *text;
}

const model::Image& ExpectImage(const model::Content& input, const char* model) {
  const auto* image = std::get_if<model::Image>(&input);
  if (!image) {
    throw std::invalid_argument(std::string(model) + " expects image input");
  }
  return *image;
}

std::uint8_t Luma(const model::Image& image, std::size_t pixel) {
  const auto* p = image.pixels.data() + pixel * image.channels;
  if (image.channels < 3) {
    return p[0];
  }
  return static_cast<std::uint8_t>((299 * p[0] + 587 * p[1] + 114 * p[2]) / 1000);
}

} // namespace

const std::vector<std::string>& CaptionVocabulary() {
  static const std::vector<std::string> kVocabulary = {
      "a dark room",
      "a quiet street at night",
      "a forest under clouds",
      "a field of grass",
      "a bright beach",
      "a white winter sky",
  };
  return kVocabulary;
}

model::Content DummyT2I::Generate(const model::Content& input, std::int64_t seed) {
  const auto& text = ExpectText(input, "DummyT2I");

  std::mt19937_64 rng(Fingerprint(text) ^ static_cast<std::uint64_t>(seed));
  std::uniform_int_distribution<int> channel(0, 255);
  const int base[3] = {channel(rng), channel(rng), channel(rng)};

  model::Image image;
  image.width    = kDummyImageSize;
  image.height   = kDummyImageSize;
  image.channels = 3;
  image.pixels.resize(static_cast<std::size_t>(kDummyImageSize) * kDummyImageSize * 3);

  // Horizontal gradient over a base colour.
  for (std::uint32_t y = 0; y < kDummyImageSize; ++y) {
    for (std::uint32_t x = 0; x < kDummyImageSize; ++x) {
      auto* px = image.pixels.data() + (static_cast<std::size_t>(y) * kDummyImageSize + x) * 3;
      for (int c = 0; c < 3; ++c) {
        px[c] = static_cast<std::uint8_t>(std::clamp(base[c] + static_cast<int>(x) - 32, 0, 255));
      }
    }
  }
  return image;
}

model::Content DummyI2T::Generate(const model::Content& input, std::int64_t /*seed*/) {
  const auto& image = ExpectImage(input, "DummyI2T");
  if (image.width == 0 || image.height == 0) {
    throw std::invalid_argument("DummyI2T received an empty image");
  }

  const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
  std::uint64_t     total = 0;
  for (std::size_t i = 0; i < count; ++i) {
    total += Luma(image, i);
  }

  const auto&       vocabulary = CaptionVocabulary();
  const std::size_t mean       = total / count;
  const std::size_t bucket     = std::min(vocabulary.size() - 1, mean * vocabulary.size() / 256);
  return vocabulary[bucket];
}

model::Content DummyT2T::Generate(const model::Content& input, std::int64_t /*seed*/) {
  const auto& text = ExpectText(input, "DummyT2T");

  std::istringstream       in(text);
  std::vector<std::string> words;
  for (std::string word; in >> word;) {
    words.push_back(std::move(word));
  }
  std::reverse(words.begin(), words.end());

  std::string out;
  for (const auto& word : words) {
    if (!out.empty()) out.push_back(' ');
    out += word;
  }
  return out;
}

std::vector<float> DummyEmbedder::Embed(const model::Content& content) {
  std::uint64_t seed = 0;
  if (const auto* text = std::get_if<std::string>(&content)) {
    for (unsigned char c : *text) seed += c;
  } else {
    const auto& image = std::get<model::Image>(content);
    for (auto v : image.pixels) seed += v;
    seed %= 10000;
  }

  std::mt19937                          rng(static_cast<std::uint32_t>(seed));
  std::uniform_real_distribution<float> uniform(0.0F, 1.0F);

  std::vector<float> vector(kDummyEmbeddingSize);
  for (auto& v : vector) v = uniform(rng);
  return vector;
}

std::vector<float> Dummy2Embedder::Embed(const model::Content& content) {
  std::vector<float> vector(kDummyEmbeddingSize, 0.0F);

  if (const auto* text = std::get_if<std::string>(&content)) {
    const std::size_t n = std::min<std::size_t>(text->size(), 100);
    for (std::size_t i = 0; i < n; ++i) {
      vector[i] = static_cast<unsigned char>((*text)[i]) / 255.0F;
    }
    return vector;
  }

  // 16x16 nearest-neighbour grayscale thumbnail, tiled.
  const auto& image = std::get<model::Image>(content);
  if (image.width == 0 || image.height == 0) {
    return vector;
  }
  constexpr std::uint32_t kThumb = 16;
  std::vector<float>      thumb;
  thumb.reserve(kThumb * kThumb);
  for (std::uint32_t y = 0; y < kThumb; ++y) {
    for (std::uint32_t x = 0; x < kThumb; ++x) {
      const std::size_t sx = static_cast<std::size_t>(x) * image.width / kThumb;
      const std::size_t sy = static_cast<std::size_t>(y) * image.height / kThumb;
      thumb.push_back(Luma(image, sy * image.width + sx) / 255.0F);
    }
  }
  for (std::size_t i = 0; i < vector.size(); ++i) {
    vector[i] = thumb[i % thumb.size()];
  }
  return vector;
}

void RegisterBuiltinModels(registry::ModelRegistry& registry) {
  registry.Register(registry::GeneratorDescriptor{
      "DummyT2I", model::Modality::kImage, 1, [] { return std::make_unique<DummyT2I>(); }});
  registry.Register(registry::GeneratorDescriptor{
      "DummyI2T", model::Modality::kText, 1, [] { return std::make_unique<DummyI2T>(); }});
  registry.Register(registry::GeneratorDescriptor{
      "DummyT2T", model::Modality::kText, 1, [] { return std::make_unique<DummyT2T>(); }});

  registry.Register(registry::EmbedderDescriptor{
      "Dummy", kDummyEmbeddingSize, 1, [] { return std::make_unique<DummyEmbedder>(); }});
  registry.Register(registry::EmbedderDescriptor{
      "Dummy2", kDummyEmbeddingSize, 1, [] { return std::make_unique<Dummy2Embedder>(); }});
}

} // namespace trajectory::models
