#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/content.hpp"

namespace trajectory::registry {

/*
  Generative model contract.

  Instances are stateful and expensive to construct; a pool worker loads one
  and reuses it for every call. Generate may throw; any exception is treated
  as a generation failure by the caller.
*/
class GenerativeModel {
 public:
  virtual ~GenerativeModel() = default;

  virtual model::Content Generate(const model::Content& input, std::int64_t seed) = 0;
};

class EmbeddingModel {
 public:
  virtual ~EmbeddingModel() = default;

  virtual std::vector<float> Embed(const model::Content& content) = 0;
};

using GeneratorFactory = std::function<std::unique_ptr<GenerativeModel>()>;
using EmbedderFactory  = std::function<std::unique_ptr<EmbeddingModel>()>;

struct GeneratorDescriptor {
  std::string      name;
  model::Modality  output_modality = model::Modality::kText;
  std::uint32_t    default_capacity = 1;
  GeneratorFactory factory;
};

struct EmbedderDescriptor {
  std::string     name;
  std::uint32_t   dimension        = 0;
  std::uint32_t   default_capacity = 1;
  EmbedderFactory factory;
};

/*
  Explicit name -> capability mapping, populated at startup.

  Lookups of unknown names throw util::NotFound. Registering a name twice
  replaces the earlier descriptor.
*/
class ModelRegistry {
 public:
  void Register(GeneratorDescriptor descriptor);
  void Register(EmbedderDescriptor descriptor);

  GeneratorDescriptor Generator(const std::string& name) const;
  EmbedderDescriptor  Embedder(const std::string& name) const;

  model::Modality OutputModality(const std::string& name) const;

  bool HasGenerator(const std::string& name) const;
  bool HasEmbedder(const std::string& name) const;

  std::vector<std::string> GeneratorNames() const;
  std::vector<std::string> EmbedderNames() const;

 private:
  mutable std::shared_mutex                            mutex_;
  std::unordered_map<std::string, GeneratorDescriptor> generators_;
  std::unordered_map<std::string, EmbedderDescriptor>  embedders_;
};

} // namespace trajectory::registry
