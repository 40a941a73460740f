#include "internal/analysis/persistence_diagram_builder.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace trajectory::analysis {

std::optional<double> PersistenceEntropy(const std::vector<model::Generator>& generators) {
  double total = 0.0;
  for (const auto& generator : generators) {
    if (generator.finite()) total += generator.persistence();
  }
  if (!(total > 0.0)) {
    return std::nullopt;
  }

  double entropy = 0.0;
  for (const auto& generator : generators) {
    if (!generator.finite()) continue;
    const double p = generator.persistence() / total;
    if (p > 0.0) entropy -= p * std::log(p);
  }
  return entropy;
}

PersistenceDiagramBuilder::PersistenceDiagramBuilder(std::shared_ptr<const HomologyEngine> engine, int max_dimension)
    : engine_(std::move(engine)),
      max_dimension_(max_dimension) {
  if (!engine_) {
    throw std::invalid_argument("PersistenceDiagramBuilder requires a homology engine");
  }
  if (max_dimension_ < 0) {
    throw util::InvalidConfig("max_homology_dimension must be non-negative");
  }
}

std::optional<model::PersistenceDiagram> PersistenceDiagramBuilder::Build(const std::string& run_id,
                                                                          const std::string& embedding_model,
                                                                          const Trajectory&  trajectory) const {
  observability::SpanScope span("persistence_diagram.build");
  span.SetAttribute("run_id", run_id);
  span.SetAttribute("embedding_model", embedding_model);
  span.SetAttribute("points", static_cast<std::int64_t>(trajectory.size()));

  model::PersistenceDiagram diagram;
  diagram.id              = util::NewId();
  diagram.run_id          = run_id;
  diagram.embedding_model = embedding_model;
  diagram.started_at      = util::Now();

  Intervals intervals;
  try {
    intervals = engine_->Compute(trajectory, max_dimension_);
  } catch (const util::HomologyError& e) {
    span.RecordException(e.what());
    TRAJECTORY_LOG_WARN("persistence diagram not produced", {observability::StringField("run_id", run_id),
                                                             observability::StringField("embedding_model", embedding_model),
                                                             observability::IntField("points", static_cast<std::int64_t>(trajectory.size())),
                                                             observability::StringField("error", e.what())});
    return std::nullopt;
  }

  for (int dimension = 0; dimension <= max_dimension_; ++dimension) {
    model::DimensionDiagram entry;
    entry.dimension = dimension;

    auto it = intervals.find(dimension);
    if (it != intervals.end()) {
      entry.generators = std::move(it->second);
    }
    entry.entropy = PersistenceEntropy(entry.generators);
    diagram.dimensions.push_back(std::move(entry));
  }
  diagram.completed_at = util::Now();

  observability::Metrics::Instance().ObserveDiagramDurationMs(diagram.duration() * 1000.0);
  TRAJECTORY_LOG_DEBUG("persistence diagram built", {observability::StringField("run_id", run_id),
                                                     observability::StringField("embedding_model", embedding_model),
                                                     observability::IntField("points", static_cast<std::int64_t>(trajectory.size()))});
  return diagram;
}

} // namespace trajectory::analysis
