#include "internal/pool/model_pools.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace trajectory::pool {

ModelPools::ModelPools(std::shared_ptr<const registry::ModelRegistry> registry, std::unordered_map<std::string, std::uint32_t> capacities)
    : registry_(std::move(registry)),
      capacities_(std::move(capacities)) {
  if (!registry_) {
    throw std::invalid_argument("ModelPools requires a registry");
  }
}

ModelPools::~ModelPools() {
  Shutdown();
}

std::uint32_t ModelPools::CapacityFor(const std::string& model, std::uint32_t fallback) const {
  auto it = capacities_.find(model);
  if (it != capacities_.end() && it->second > 0) {
    return it->second;
  }
  return fallback;
}

ModelPool<registry::GenerativeModel>& ModelPools::GeneratorPool(const std::string& model) {
  std::lock_guard lock(mutex_);
  if (shutdown_) {
    throw util::InvalidState("model pools are shut down");
  }

  auto it = generators_.find(model);
  if (it != generators_.end()) {
    return *it->second;
  }

  auto descriptor = registry_->Generator(model);
  auto pool       = std::make_unique<ModelPool<registry::GenerativeModel>>(model, CapacityFor(model, descriptor.default_capacity),
                                                                     std::move(descriptor.factory));
  pool->Start();

  TRAJECTORY_LOG_INFO("generator pool started", {observability::StringField("model", model), observability::IntField("capacity", pool->capacity())});
  return *generators_.emplace(model, std::move(pool)).first->second;
}

ModelPool<registry::EmbeddingModel>& ModelPools::EmbedderPool(const std::string& model, std::uint32_t& dimension) {
  std::lock_guard lock(mutex_);
  if (shutdown_) {
    throw util::InvalidState("model pools are shut down");
  }

  auto it = embedders_.find(model);
  if (it != embedders_.end()) {
    dimension = dimensions_[model];
    return *it->second;
  }

  auto descriptor = registry_->Embedder(model);
  dimension       = descriptor.dimension;
  auto pool       = std::make_unique<ModelPool<registry::EmbeddingModel>>(model, CapacityFor(model, descriptor.default_capacity),
                                                                    std::move(descriptor.factory));
  pool->Start();

  TRAJECTORY_LOG_INFO("embedder pool started", {observability::StringField("model", model), observability::IntField("capacity", pool->capacity())});
  dimensions_[model] = dimension;
  return *embedders_.emplace(model, std::move(pool)).first->second;
}

std::future<model::Content> ModelPools::Generate(const std::string& model, model::Content input, std::int64_t seed) {
  auto& pool = GeneratorPool(model);
  return pool.Submit([input = std::move(input), seed, model, parent = observability::CurrentTraceParent()](registry::GenerativeModel& generator) {
    observability::SpanScope span("model.generate", parent);
    span.SetAttribute("model", model);
    try {
      return generator.Generate(input, seed);
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      throw;
    }
  });
}

std::future<EmbeddingResult> ModelPools::Embed(const std::string& model, model::Content content) {
  std::uint32_t dimension = 0;
  auto&         pool      = EmbedderPool(model, dimension);

  return pool.Submit([content = std::move(content), dimension, model, parent = observability::CurrentTraceParent()](registry::EmbeddingModel& embedder) {
    observability::SpanScope span("embedding.compute", parent);
    span.SetAttribute("embedding_model", model);
    auto& metrics = observability::Metrics::Instance();

    EmbeddingResult result;
    try {
      result.started_at   = util::Now();
      result.vector       = embedder.Embed(content);
      result.completed_at = util::Now();
      if (dimension > 0 && result.vector.size() != dimension) {
        throw std::runtime_error(model + " returned " + std::to_string(result.vector.size()) + " values, expected " + std::to_string(dimension));
      }
    } catch (const std::exception& e) {
      metrics.RecordEmbedding(model, false);
      span.RecordException(e.what());
      throw;
    }

    metrics.RecordEmbedding(model, true);
    metrics.ObserveEmbeddingLatencyMs(model, util::DurationSeconds(result.started_at, result.completed_at) * 1000.0);
    return result;
  });
}

void ModelPools::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    shutdown_ = true;
  }

  // No pool is added once shutdown_ is set.
  for (auto& [_, pool] : generators_) pool->Stop();
  for (auto& [_, pool] : embedders_) pool->Stop();
}

} // namespace trajectory::pool
