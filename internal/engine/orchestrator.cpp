#include "internal/engine/orchestrator.hpp"

#include <algorithm>
#include <future>
#include <optional>
#include <set>

#include "internal/analysis/embedding_collector.hpp"
#include "internal/engine/run_driver.hpp"
#include "internal/engine/run_scheduler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace trajectory::engine {

namespace {

struct PendingEmbedding {
  std::string                        invocation_id;
  std::string                        embedding_model;
  std::future<pool::EmbeddingResult> result;
};

} // namespace

std::size_t ExperimentReport::Count(model::RunState state) const {
  return static_cast<std::size_t>(std::count_if(runs.begin(), runs.end(), [state](const RunReport& r) { return r.run.state == state; }));
}

Orchestrator::Orchestrator(std::shared_ptr<const registry::ModelRegistry>  registry,
                           std::shared_ptr<pool::ModelPools>               pools,
                           std::shared_ptr<const analysis::HomologyEngine> homology,
                           std::shared_ptr<db::Repository>                 repository,
                           OrchestratorOptions                             options)
    : registry_(std::move(registry)),
      pools_(std::move(pools)),
      repository_(std::move(repository)),
      options_(options),
      stepper_(std::make_shared<TrajectoryStepper>(registry_, pools_, options_.step_timeout)),
      builder_(std::move(homology), options_.max_homology_dimension) {
}

template <typename Fn>
void Orchestrator::Persist(Fn&& fn) {
  if (!repository_) {
    return;
  }
  std::lock_guard lock(repository_mutex_);
  db::InTransaction(*repository_, std::forward<Fn>(fn));
}

void Orchestrator::ValidateModels(const model::ExperimentConfig& config) const {
  for (const auto& network : config.networks) {
    for (const auto& name : network) {
      if (!registry_->HasGenerator(name)) {
        throw util::InvalidConfig("unknown generative model: " + name);
      }
    }
  }
  for (const auto& name : config.embedding_models) {
    if (!registry_->HasEmbedder(name)) {
      throw util::InvalidConfig("unknown embedding model: " + name);
    }
  }
}

ExperimentReport Orchestrator::RunExperiment(const model::ExperimentConfig& config) {
  config.Validate();
  ValidateModels(config);

  auto runs = config.Expand();

  ExperimentReport report;
  report.experiment_id = runs.front().experiment_id;
  report.runs.resize(runs.size());

  TRAJECTORY_LOG_INFO("experiment started", {observability::StringField("experiment_id", report.experiment_id),
                                             observability::IntField("runs", static_cast<std::int64_t>(runs.size())),
                                             observability::IntField("max_concurrent_runs", options_.max_concurrent_runs)});

  observability::SpanScope span("experiment");
  span.SetAttribute("experiment_id", report.experiment_id);
  span.SetAttribute("runs", static_cast<std::int64_t>(runs.size()));
  const auto parent = observability::CurrentTraceParent();

  RunScheduler scheduler(options_.max_concurrent_runs);
  scheduler.Start();
  for (std::size_t i = 0; i < runs.size(); ++i) {
    scheduler.Submit([this, &runs, &report, &config, &parent, i] {
      observability::SpanScope  run_span("run", parent);
      observability::LogContext log_context({observability::StringField("experiment_id", report.experiment_id)});
      run_span.SetAttribute("run_id", runs[i].id);
      try {
        report.runs[i] = ExecuteRun(runs[i], config.embedding_models);
      } catch (const std::exception& e) {
        TRAJECTORY_LOG_ERROR("run aborted", {observability::StringField("run_id", runs[i].id), observability::StringField("error", e.what())});
        report.runs[i].run       = runs[i];
        report.runs[i].run.state = model::RunState::kFailed;
        report.runs[i].run.error = e.what();
      }
    });
  }
  scheduler.Stop();

  TRAJECTORY_LOG_INFO("experiment finished", {observability::StringField("experiment_id", report.experiment_id),
                                              observability::IntField("completed", static_cast<std::int64_t>(report.Count(model::RunState::kCompleted))),
                                              observability::IntField("failed", static_cast<std::int64_t>(report.Count(model::RunState::kFailed)))});
  return report;
}

std::unique_ptr<RunStream> Orchestrator::StreamRun(model::Run run) {
  return std::make_unique<RunStream>(RunDriver(std::move(run), stepper_));
}

RunReport Orchestrator::ExecuteRun(model::Run run, const std::vector<std::string>& embedding_models) {
  RunDriver driver(std::move(run), stepper_);
  Persist([&](db::Transaction& tx) { db::ThrowIfError(repository_->InsertRun(tx, driver.run()), "insert run"); });

  RunReport                     report;
  std::vector<PendingEmbedding> pending;

  RunStream                  stream(std::move(driver));
  std::optional<std::string> storage_error;
  try {
    while (auto invocation = stream.Next()) {
      Persist([&](db::Transaction& tx) { db::ThrowIfError(repository_->InsertInvocation(tx, *invocation), "insert invocation"); });

      if (invocation->modality != model::Modality::kText) {
        continue;
      }
      for (const auto& embedding_model : embedding_models) {
        try {
          pending.push_back({invocation->id, embedding_model, pools_->Embed(embedding_model, *invocation->output)});
        } catch (const std::exception& e) {
          report.embedding_errors.push_back({invocation->id, embedding_model, util::EmbeddingError(e.what(), invocation->id, embedding_model).what()});
        }
      }
    }
  } catch (const std::exception& e) {
    storage_error = e.what();
    stream.Cancel();
  }

  auto outcome = stream.Finish();
  report.run   = std::move(outcome.run);
  if (!storage_error) {
    try {
      Persist([&](db::Transaction& tx) { db::ThrowIfError(repository_->UpdateRunOutcome(tx, report.run), "update run outcome"); });
    } catch (const std::exception& e) {
      storage_error = e.what();
    }
  }
  if (storage_error) {
    // Pending embeddings are dropped; their futures never block on destruction.
    return AbandonRun(std::move(report), *storage_error);
  }

  // Barrier: the whole trajectory must be embedded before diagrams exist.
  for (auto& item : pending) {
    model::Embedding embedding;
    try {
      auto result               = item.result.get();
      embedding.id              = util::NewId();
      embedding.invocation_id   = item.invocation_id;
      embedding.embedding_model = item.embedding_model;
      embedding.vector          = std::move(result.vector);
      embedding.started_at      = result.started_at;
      embedding.completed_at    = result.completed_at;
    } catch (const std::exception& e) {
      util::EmbeddingError error(e.what(), item.invocation_id, item.embedding_model);
      TRAJECTORY_LOG_WARN("embedding failed", {observability::StringField("run_id", report.run.id),
                                               observability::StringField("invocation_id", item.invocation_id),
                                               observability::StringField("embedding_model", item.embedding_model),
                                               observability::StringField("error", e.what())});
      report.embedding_errors.push_back({item.invocation_id, item.embedding_model, error.what()});
      continue;
    }

    Persist([&](db::Transaction& tx) { db::ThrowIfError(repository_->InsertEmbedding(tx, embedding), "insert embedding"); });
    report.embeddings.push_back(std::move(embedding));
  }

  if (report.run.state == model::RunState::kCompleted) {
    for (const auto& embedding_model : embedding_models) {
      auto points  = analysis::CollectTrajectory(report.run, report.embeddings, embedding_model);
      auto diagram = builder_.Build(report.run.id, embedding_model, points);
      if (!diagram) {
        continue;
      }
      Persist([&](db::Transaction& tx) { db::ThrowIfError(repository_->UpsertPersistenceDiagram(tx, *diagram), "upsert persistence diagram"); });
      report.diagrams.push_back(std::move(*diagram));
    }
  }

  TRAJECTORY_LOG_INFO("run finished", {observability::StringField("run_id", report.run.id),
                                       observability::StringField("state", model::ToString(report.run.state)),
                                       observability::IntField("invocations", static_cast<std::int64_t>(report.run.invocations.size())),
                                       observability::IntField("embeddings", static_cast<std::int64_t>(report.embeddings.size())),
                                       observability::IntField("diagrams", static_cast<std::int64_t>(report.diagrams.size()))});
  return report;
}

RunReport Orchestrator::AbandonRun(RunReport report, const std::string& error) {
  auto& run = report.run;
  TRAJECTORY_LOG_ERROR("run storage failed", {observability::StringField("run_id", run.id),
                                              observability::StringField("driver_state", model::ToString(run.state)),
                                              observability::StringField("stop_reason", run.stop_reason ? model::ToString(*run.stop_reason) : "none"),
                                              observability::IntField("invocations", static_cast<std::int64_t>(run.invocations.size())),
                                              observability::StringField("error", error)});

  run.state = model::RunState::kFailed;
  run.stop_reason.reset();
  run.error = "storage failed: " + error;

  try {
    Persist([&](db::Transaction& tx) { db::ThrowIfError(repository_->UpdateRunOutcome(tx, run), "update run outcome"); });
  } catch (const std::exception& e) {
    TRAJECTORY_LOG_WARN("failed run outcome not stored", {observability::StringField("run_id", run.id), observability::StringField("error", e.what())});
  }
  return report;
}

std::vector<model::PersistenceDiagram> Orchestrator::RebuildDiagrams(const std::string& run_id, std::vector<std::string> embedding_models) {
  if (!repository_) {
    throw util::InvalidState("rebuild diagrams: no repository configured");
  }

  std::optional<model::Run>     run;
  std::vector<model::Embedding> embeddings;
  Persist([&](db::Transaction& tx) {
    run = repository_->GetRun(tx, run_id);
    if (run) {
      embeddings = repository_->ListEmbeddings(tx, run_id);
    }
  });

  if (!run) {
    throw util::NotFound("rebuild diagrams: run not found: " + run_id);
  }
  if (run->state != model::RunState::kCompleted) {
    throw util::InvalidState("rebuild diagrams: run " + run_id + " is " + std::string(model::ToString(run->state)));
  }

  if (embedding_models.empty()) {
    std::set<std::string> models;
    for (const auto& embedding : embeddings) models.insert(embedding.embedding_model);
    embedding_models.assign(models.begin(), models.end());
  }

  std::vector<model::PersistenceDiagram> diagrams;
  for (const auto& embedding_model : embedding_models) {
    auto diagram = builder_.Build(run_id, embedding_model, analysis::CollectTrajectory(*run, embeddings, embedding_model));
    if (!diagram) {
      continue;
    }
    Persist([&](db::Transaction& tx) { db::ThrowIfError(repository_->UpsertPersistenceDiagram(tx, *diagram), "upsert persistence diagram"); });
    diagrams.push_back(std::move(*diagram));
  }

  TRAJECTORY_LOG_INFO("diagrams rebuilt", {observability::StringField("run_id", run_id),
                                           observability::IntField("diagrams", static_cast<std::int64_t>(diagrams.size()))});
  return diagrams;
}

} // namespace trajectory::engine
