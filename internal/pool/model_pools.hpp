#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/content.hpp"
#include "internal/pool/model_pool.hpp"
#include "internal/registry/model_registry.hpp"
#include "internal/util/time.hpp"

namespace trajectory::pool {

struct EmbeddingResult {
  std::vector<float> vector;
  util::TimePoint    started_at{};
  util::TimePoint    completed_at{};
};

/*
  One worker pool per model id, created on first use.

  Pool capacity is the configured override for that id, else the registry
  descriptor's default. Unknown ids throw util::NotFound at submit time.
*/
class ModelPools {
 public:
  explicit ModelPools(std::shared_ptr<const registry::ModelRegistry> registry,
                      std::unordered_map<std::string, std::uint32_t> capacities = {});
  ~ModelPools();

  ModelPools(const ModelPools&)            = delete;
  ModelPools& operator=(const ModelPools&) = delete;

  std::future<model::Content>  Generate(const std::string& model, model::Content input, std::int64_t seed);
  std::future<EmbeddingResult> Embed(const std::string& model, model::Content content);

  void Shutdown();

 private:
  ModelPool<registry::GenerativeModel>& GeneratorPool(const std::string& model);
  ModelPool<registry::EmbeddingModel>&  EmbedderPool(const std::string& model, std::uint32_t& dimension);

  std::uint32_t CapacityFor(const std::string& model, std::uint32_t fallback) const;

  std::shared_ptr<const registry::ModelRegistry> registry_;
  std::unordered_map<std::string, std::uint32_t> capacities_;

  std::mutex mutex_;
  bool       shutdown_ = false;

  std::unordered_map<std::string, std::unique_ptr<ModelPool<registry::GenerativeModel>>> generators_;
  std::unordered_map<std::string, std::unique_ptr<ModelPool<registry::EmbeddingModel>>>  embedders_;
  std::unordered_map<std::string, std::uint32_t>                                         dimensions_;
};

} // namespace trajectory::pool
