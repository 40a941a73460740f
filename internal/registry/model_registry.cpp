#include "internal/registry/model_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/errors.hpp"

namespace trajectory::registry {
namespace {

template <typename Map>
std::vector<std::string> SortedKeys(const Map& map) {
  std::vector<std::string> names;
  names.reserve(map.size());
  for (const auto& [name, _] : map) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace

void ModelRegistry::Register(GeneratorDescriptor descriptor) {
  if (descriptor.name.empty()) {
    throw util::InvalidConfig("generator name cannot be empty");
  }
  if (!descriptor.factory) {
    throw util::InvalidConfig("generator " + descriptor.name + " has no factory");
  }
  if (descriptor.default_capacity == 0) {
    descriptor.default_capacity = 1;
  }

  std::unique_lock lock(mutex_);
  auto             name = descriptor.name;
  generators_.insert_or_assign(std::move(name), std::move(descriptor));
}

void ModelRegistry::Register(EmbedderDescriptor descriptor) {
  if (descriptor.name.empty()) {
    throw util::InvalidConfig("embedder name cannot be empty");
  }
  if (!descriptor.factory) {
    throw util::InvalidConfig("embedder " + descriptor.name + " has no factory");
  }
  if (descriptor.default_capacity == 0) {
    descriptor.default_capacity = 1;
  }

  std::unique_lock lock(mutex_);
  auto             name = descriptor.name;
  embedders_.insert_or_assign(std::move(name), std::move(descriptor));
}

GeneratorDescriptor ModelRegistry::Generator(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = generators_.find(name);
  if (it == generators_.end()) {
    throw util::NotFound("unknown generative model: " + name);
  }
  return it->second;
}

EmbedderDescriptor ModelRegistry::Embedder(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = embedders_.find(name);
  if (it == embedders_.end()) {
    throw util::NotFound("unknown embedding model: " + name);
  }
  return it->second;
}

model::Modality ModelRegistry::OutputModality(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = generators_.find(name);
  if (it == generators_.end()) {
    throw util::NotFound("unknown generative model: " + name);
  }
  return it->second.output_modality;
}

bool ModelRegistry::HasGenerator(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return generators_.count(name) != 0;
}

bool ModelRegistry::HasEmbedder(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return embedders_.count(name) != 0;
}

std::vector<std::string> ModelRegistry::GeneratorNames() const {
  std::shared_lock lock(mutex_);
  return SortedKeys(generators_);
}

std::vector<std::string> ModelRegistry::EmbedderNames() const {
  std::shared_lock lock(mutex_);
  return SortedKeys(embedders_);
}

} // namespace trajectory::registry
