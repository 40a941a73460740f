#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/analysis/homology.hpp"
#include "internal/analysis/persistence_diagram_builder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/run_stream.hpp"
#include "internal/engine/trajectory_stepper.hpp"
#include "internal/model/embedding.hpp"
#include "internal/model/experiment.hpp"
#include "internal/model/persistence_diagram.hpp"
#include "internal/pool/model_pools.hpp"
#include "internal/registry/model_registry.hpp"

namespace trajectory::engine {

struct OrchestratorOptions {
  std::uint32_t             max_concurrent_runs = 4;
  std::chrono::milliseconds step_timeout{0}; // 0 = no timeout; a timed-out call still occupies its worker
  int                       max_homology_dimension = 1;
};

struct EmbeddingFailure {
  std::string invocation_id;
  std::string embedding_model;
  std::string message;
};

/*
  Everything one run produced. run.state, run.stop_reason and run.error
  carry the outcome.
*/
struct RunReport {
  model::Run                             run;
  std::vector<model::Embedding>          embeddings;
  std::vector<EmbeddingFailure>          embedding_errors;
  std::vector<model::PersistenceDiagram> diagrams;
};

struct ExperimentReport {
  std::string            experiment_id;
  std::vector<RunReport> runs; // expansion order

  std::size_t Count(model::RunState state) const;
};

/*
  Orchestrator

  Runs are independent and execute concurrently, at most
  max_concurrent_runs at a time. Steps inside one run are strictly
  sequential. Every completed text invocation fans out one embedding task
  per embedding model right away, so embeddings overlap with later steps.
  Once the run is terminal all of its embeddings are joined, and for a
  Completed run one persistence diagram per embedding model is built.

  Failures are reported, never retried:
  - generation failure: run ends Failed, recorded invocations are kept
  - embedding failure: that embedding is missing (a gap in the trajectory)
  - homology failure: that diagram is absent
  - storage failure: the run stops and ends Failed with the invocations
    produced so far; its stored row is moved to Failed when possible

  The repository is optional. When present every artifact is persisted
  as soon as it exists; repository access is serialized.
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<const registry::ModelRegistry> registry,
               std::shared_ptr<pool::ModelPools>              pools,
               std::shared_ptr<const analysis::HomologyEngine> homology,
               std::shared_ptr<db::Repository>                repository,
               OrchestratorOptions                            options = {});

  // Throws util::InvalidConfig for invalid configs or unknown model names.
  ExperimentReport RunExperiment(const model::ExperimentConfig& config);

  RunReport ExecuteRun(model::Run run, const std::vector<std::string>& embedding_models);

  // Unpersisted incremental view of a single run.
  std::unique_ptr<RunStream> StreamRun(model::Run run);

  // Recomputes and replaces the stored diagrams of a Completed run. With no
  // models given, every embedding model that has embeddings for the run.
  std::vector<model::PersistenceDiagram> RebuildDiagrams(const std::string& run_id, std::vector<std::string> embedding_models = {});

  const OrchestratorOptions& options() const {
    return options_;
  }

 private:
  void ValidateModels(const model::ExperimentConfig& config) const;

  template <typename Fn>
  void Persist(Fn&& fn);

  // Marks a run whose artifacts could not be stored as Failed, keeping the
  // invocations the driver produced, and records that outcome if it can.
  RunReport AbandonRun(RunReport report, const std::string& error);

  std::shared_ptr<const registry::ModelRegistry> registry_;
  std::shared_ptr<pool::ModelPools>              pools_;
  std::shared_ptr<db::Repository>                repository_;
  OrchestratorOptions                            options_;

  std::shared_ptr<const TrajectoryStepper> stepper_;
  analysis::PersistenceDiagramBuilder      builder_;

  std::mutex repository_mutex_;
};

} // namespace trajectory::engine
