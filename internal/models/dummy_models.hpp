#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/registry/model_registry.hpp"

namespace trajectory::models {

constexpr std::uint32_t kDummyImageSize     = 64;
constexpr std::uint32_t kDummyEmbeddingSize = 768;

/*
  Deterministic stand-in models.

  They need no accelerator and are pure functions of their inputs, which
  makes them suitable for tests and dry runs. The caption vocabulary is
  small, so T2I/I2T networks settle into loops quickly.
*/

// text -> 64x64 RGB image derived from (text, seed)
class DummyT2I : public registry::GenerativeModel {
 public:
  model::Content Generate(const model::Content& input, std::int64_t seed) override;
};

// image -> caption chosen by mean intensity
class DummyI2T : public registry::GenerativeModel {
 public:
  model::Content Generate(const model::Content& input, std::int64_t seed) override;
};

// text -> text with the word order reversed
class DummyT2T : public registry::GenerativeModel {
 public:
  model::Content Generate(const model::Content& input, std::int64_t seed) override;
};

// Pseudo-random vector in [0,1) seeded by the content.
class DummyEmbedder : public registry::EmbeddingModel {
 public:
  std::vector<float> Embed(const model::Content& content) override;
};

// Character codes (or grayscale intensities) scaled to [0,1], zero padded.
class Dummy2Embedder : public registry::EmbeddingModel {
 public:
  std::vector<float> Embed(const model::Content& content) override;
};

const std::vector<std::string>& CaptionVocabulary();

void RegisterBuiltinModels(registry::ModelRegistry& registry);

} // namespace trajectory::models
