#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/analysis/vietoris_rips.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/models/dummy_models.hpp"
#include "internal/pool/model_pools.hpp"
#include "internal/util/errors.hpp"

namespace {

using trajectory::engine::ExperimentReport;
using trajectory::engine::Orchestrator;
using trajectory::engine::RunReport;
using trajectory::model::Content;
using trajectory::model::ExperimentConfig;
using trajectory::model::Modality;
using trajectory::model::RunState;
using trajectory::model::StopReason;
using trajectory::registry::EmbedderDescriptor;
using trajectory::registry::EmbeddingModel;
using trajectory::registry::GenerativeModel;
using trajectory::registry::GeneratorDescriptor;
using trajectory::registry::ModelRegistry;

// Appends a character per step and fails once the text reaches 8 bytes.
class GrowingModel : public GenerativeModel {
 public:
  Content Generate(const Content& input, std::int64_t) override {
    const auto& text = std::get<std::string>(input);
    if (text.size() >= 8) {
      throw std::runtime_error("context window exceeded");
    }
    return text + "+";
  }
};

class BrokenEmbedder : public EmbeddingModel {
 public:
  std::vector<float> Embed(const Content&) override {
    throw std::runtime_error("embedding service unavailable");
  }
};

std::shared_ptr<ModelRegistry> TestRegistry() {
  auto registry = std::make_shared<ModelRegistry>();
  trajectory::models::RegisterBuiltinModels(*registry);
  registry->Register(GeneratorDescriptor{"Growing", Modality::kText, 1, [] { return std::make_unique<GrowingModel>(); }});
  registry->Register(EmbedderDescriptor{"Broken", 0, 1, [] { return std::make_unique<BrokenEmbedder>(); }});
  return registry;
}

// Memory repository that rejects chosen writes with IOError.
class FailingRepository : public trajectory::db::Repository {
 public:
  std::optional<std::uint32_t> fail_invocation_at;
  bool                         fail_completed_outcome = false;

  std::unique_ptr<trajectory::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  trajectory::db::Result InsertRun(trajectory::db::Transaction& tx, const trajectory::model::Run& run) override {
    return inner_.InsertRun(tx, run);
  }
  trajectory::db::Result UpdateRunOutcome(trajectory::db::Transaction& tx, const trajectory::model::Run& run) override {
    if (fail_completed_outcome && run.state == RunState::kCompleted) {
      return trajectory::db::Result::Err(trajectory::db::ErrorCode::IOError, "disk full");
    }
    return inner_.UpdateRunOutcome(tx, run);
  }
  std::optional<trajectory::model::Run> GetRun(trajectory::db::Transaction& tx, const std::string& id) override {
    return inner_.GetRun(tx, id);
  }
  std::vector<trajectory::model::Run> ListRuns(trajectory::db::Transaction& tx) override {
    return inner_.ListRuns(tx);
  }
  trajectory::db::Result InsertInvocation(trajectory::db::Transaction& tx, const trajectory::model::Invocation& invocation) override {
    if (fail_invocation_at == invocation.sequence_number) {
      return trajectory::db::Result::Err(trajectory::db::ErrorCode::IOError, "disk full");
    }
    return inner_.InsertInvocation(tx, invocation);
  }
  std::vector<trajectory::model::Invocation> ListInvocations(trajectory::db::Transaction& tx, const std::string& run_id) override {
    return inner_.ListInvocations(tx, run_id);
  }
  std::uint64_t CountInvocations(trajectory::db::Transaction& tx, const std::string& run_id) override {
    return inner_.CountInvocations(tx, run_id);
  }
  trajectory::db::Result InsertEmbedding(trajectory::db::Transaction& tx, const trajectory::model::Embedding& embedding) override {
    return inner_.InsertEmbedding(tx, embedding);
  }
  std::vector<trajectory::model::Embedding> ListEmbeddings(trajectory::db::Transaction& tx, const std::string& run_id) override {
    return inner_.ListEmbeddings(tx, run_id);
  }
  trajectory::db::Result UpsertPersistenceDiagram(trajectory::db::Transaction& tx, const trajectory::model::PersistenceDiagram& diagram) override {
    return inner_.UpsertPersistenceDiagram(tx, diagram);
  }
  std::vector<trajectory::model::PersistenceDiagram> ListPersistenceDiagrams(trajectory::db::Transaction& tx, const std::string& run_id) override {
    return inner_.ListPersistenceDiagrams(tx, run_id);
  }

 private:
  trajectory::db::memory::MemoryRepository inner_;
};

std::filesystem::path FreshDatabasePath() {
  const auto dir = std::filesystem::temp_directory_path() / "trajectory_orchestrator_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir / "trajectory.db";
}

trajectory::runtime::config::RuntimeConfig SqliteConfig(const std::filesystem::path& path) {
  return trajectory::config::ConfigLoader::LoadFromYamlString("database:\n  sqlite:\n    path: \"" + path.string() + "\"\n"
                                                              "orchestrator:\n  max_concurrent_runs: 2\n"
                                                              "analysis:\n  max_homology_dimension: 1\n");
}

std::size_t TextInvocations(const RunReport& report) {
  std::size_t count = 0;
  for (const auto& invocation : report.run.invocations) {
    if (invocation.modality == Modality::kText) ++count;
  }
  return count;
}

void VerifyExperimentPersistsEverything(trajectory::factory::Application& app) {
  ExperimentConfig config;
  config.networks         = {{"DummyT2T"}, {"DummyT2I", "DummyI2T"}};
  config.seeds            = {1, 2};
  config.prompts          = {"one two three", "a field of grass"};
  config.embedding_models = {"Dummy", "Dummy2", "Broken"};
  config.run_length       = 12;

  ExperimentReport report = app.orchestrator->RunExperiment(config);

  assert(report.runs.size() == 8);
  assert(report.Count(RunState::kCompleted) == 8);
  assert(!report.experiment_id.empty());

  // expansion order: network-major, then seed, then prompt
  assert(report.runs[0].run.initial_prompt == "one two three");
  assert(report.runs[0].run.seed == 1);
  assert(report.runs[3].run.seed == 2);
  assert(report.runs[4].run.network.size() == 2);

  // DummyT2T alternates between the prompt and its reversal
  assert(report.runs[0].run.stop_reason == StopReason::Duplicate(2));
  assert(report.runs[0].run.invocations.size() == 3);

  auto tx = app.repository->Begin();
  for (const auto& run_report : report.runs) {
    const auto& run = run_report.run;
    assert(run.experiment_id == report.experiment_id);
    assert(run.stop_reason.has_value());
    assert(trajectory::model::IsComplete(run));

    const auto text = TextInvocations(run_report);
    assert(run_report.embeddings.size() == text * 2);
    assert(run_report.embedding_errors.size() == text);
    for (const auto& failure : run_report.embedding_errors) {
      assert(failure.embedding_model == "Broken");
      assert(failure.message.find("embedding service unavailable") != std::string::npos);
    }

    // one diagram per working embedding model; Broken has nothing to build from
    std::set<std::string> diagram_models;
    for (const auto& diagram : run_report.diagrams) diagram_models.insert(diagram.embedding_model);
    assert((diagram_models == std::set<std::string>{"Dummy", "Dummy2"}));

    auto stored = app.repository->GetRun(*tx, run.id);
    assert(stored.has_value());
    assert(stored->state == RunState::kCompleted);
    assert(stored->stop_reason == run.stop_reason);
    assert(stored->invocations.size() == run.invocations.size());
    assert(app.repository->ListEmbeddings(*tx, run.id).size() == run_report.embeddings.size());
    assert(app.repository->ListPersistenceDiagrams(*tx, run.id).size() == 2);
  }
  assert(app.repository->ListRuns(*tx).size() == 8);
  tx->Commit();
}

std::string VerifyFailedRunKeepsHistory(trajectory::factory::Application& app) {
  ExperimentConfig config;
  config.networks         = {{"Growing"}};
  config.seeds            = {0};
  config.prompts          = {"abc"};
  config.embedding_models = {"Dummy"};
  config.run_length       = 20;

  auto  report = app.orchestrator->RunExperiment(config);
  auto& failed = report.runs.at(0);

  assert(report.Count(RunState::kFailed) == 1);
  assert(failed.run.state == RunState::kFailed);
  assert(failed.run.error.has_value());
  assert(failed.run.error->find("context window exceeded") != std::string::npos);
  assert(!failed.run.stop_reason.has_value());
  // "abc" grows to 8 bytes in five steps, the sixth fails
  assert(failed.run.invocations.size() == 5);

  // embeddings of the produced invocations survive; no diagram for a failed run
  assert(failed.embeddings.size() == 5);
  assert(failed.diagrams.empty());

  auto tx     = app.repository->Begin();
  auto stored = app.repository->GetRun(*tx, failed.run.id);
  assert(stored.has_value());
  assert(stored->state == RunState::kFailed);
  assert(stored->error == failed.run.error);
  assert(app.repository->CountInvocations(*tx, failed.run.id) == 5);
  assert(app.repository->ListEmbeddings(*tx, failed.run.id).size() == 5);
  assert(app.repository->ListPersistenceDiagrams(*tx, failed.run.id).empty());
  tx->Commit();

  return failed.run.id;
}

void VerifyRebuildDiagrams(trajectory::factory::Application& app, const std::string& failed_run_id) {
  std::string completed_run_id;
  {
    auto tx = app.repository->Begin();
    for (const auto& run : app.repository->ListRuns(*tx)) {
      if (run.state == RunState::kCompleted) {
        completed_run_id = run.id;
        break;
      }
    }
    tx->Commit();
  }
  assert(!completed_run_id.empty());

  auto rebuilt = app.orchestrator->RebuildDiagrams(completed_run_id);
  assert(rebuilt.size() == 2);

  auto only_dummy = app.orchestrator->RebuildDiagrams(completed_run_id, {"Dummy"});
  assert(only_dummy.size() == 1);

  {
    // upsert replaces, never duplicates
    auto tx       = app.repository->Begin();
    auto diagrams = app.repository->ListPersistenceDiagrams(*tx, completed_run_id);
    assert(diagrams.size() == 2);
    assert(diagrams[0].embedding_model == "Dummy");
    assert(diagrams[0].id == only_dummy[0].id);
    tx->Commit();
  }

  bool threw = false;
  try {
    (void)app.orchestrator->RebuildDiagrams(failed_run_id);
  } catch (const trajectory::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)app.orchestrator->RebuildDiagrams("no-such-run");
  } catch (const trajectory::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void VerifyUnknownModelsAreRejected(trajectory::factory::Application& app) {
  ExperimentConfig config;
  config.networks         = {{"DummyT2T", "StableDiffusion"}};
  config.seeds            = {0};
  config.prompts          = {"x"};
  config.embedding_models = {"Dummy"};
  config.run_length       = 3;

  bool threw = false;
  try {
    (void)app.orchestrator->RunExperiment(config);
  } catch (const trajectory::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);

  config.networks         = {{"DummyT2T"}};
  config.embedding_models = {"NoSuchEmbedder"};
  threw                   = false;
  try {
    (void)app.orchestrator->RunExperiment(config);
  } catch (const trajectory::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void VerifyRestartKeepsResults(const std::filesystem::path& path) {
  auto repository = trajectory::factory::BuildRepository(SqliteConfig(path));
  auto tx         = repository->Begin();
  auto runs       = repository->ListRuns(*tx);
  assert(runs.size() == 9);

  std::size_t with_diagrams = 0;
  for (const auto& run : runs) {
    if (!repository->ListPersistenceDiagrams(*tx, run.id).empty()) ++with_diagrams;
  }
  assert(with_diagrams == 8);
  tx->Commit();
}

void VerifyStreamWithoutRepository() {
  auto registry = TestRegistry();
  auto pools    = std::make_shared<trajectory::pool::ModelPools>(registry);
  auto homology = std::make_shared<trajectory::analysis::VietorisRipsHomology>();

  Orchestrator orchestrator(registry, pools, homology, nullptr);

  trajectory::model::Run run;
  run.id             = "streamed";
  run.experiment_id  = "adhoc";
  run.network        = {"DummyT2T"};
  run.initial_prompt = "left right";
  run.max_length     = 10;

  auto                       stream = orchestrator.StreamRun(run);
  std::vector<std::string>   outputs;
  while (auto invocation = stream->Next()) {
    outputs.push_back(std::get<std::string>(*invocation->output));
  }
  assert((outputs == std::vector<std::string>{"right left", "left right", "right left"}));
  assert(stream->Finish().state == RunState::kCompleted);

  // without storage runs still execute and build diagrams in memory
  auto report = orchestrator.ExecuteRun(run, {"Dummy2"});
  assert(report.run.state == RunState::kCompleted);
  assert(report.embeddings.size() == 3);
  assert(report.diagrams.size() == 1);

  bool threw = false;
  try {
    (void)orchestrator.RebuildDiagrams("streamed");
  } catch (const trajectory::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void VerifyMemoryBackedExperiment() {
  auto registry   = TestRegistry();
  auto pools      = std::make_shared<trajectory::pool::ModelPools>(registry);
  auto repository = std::make_shared<trajectory::db::memory::MemoryRepository>();

  trajectory::engine::OrchestratorOptions options;
  options.max_concurrent_runs    = 3;
  options.max_homology_dimension = 0;
  Orchestrator orchestrator(registry, pools, std::make_shared<trajectory::analysis::VietorisRipsHomology>(), repository, options);

  ExperimentConfig config;
  config.networks         = {{"DummyT2I", "DummyI2T"}};
  config.seeds            = {1, 2, 3, 4, 5};
  config.prompts          = {"a red balloon"};
  config.embedding_models = {"Dummy2"};
  config.run_length       = 30;

  auto report = orchestrator.RunExperiment(config);
  assert(report.Count(RunState::kCompleted) == 5);
  for (const auto& run_report : report.runs) {
    // image invocations are never embedded
    assert(run_report.embeddings.size() == TextInvocations(run_report));
    for (const auto& diagram : run_report.diagrams) {
      assert(diagram.dimensions.size() == 1);
    }
  }
}

void VerifyStorageFailureEndsRunFailed() {
  auto registry   = TestRegistry();
  auto pools      = std::make_shared<trajectory::pool::ModelPools>(registry);
  auto repository = std::make_shared<FailingRepository>();
  repository->fail_invocation_at = 2;
  Orchestrator orchestrator(registry, pools, std::make_shared<trajectory::analysis::VietorisRipsHomology>(), repository);

  ExperimentConfig config;
  config.networks         = {{"DummyT2T"}};
  config.seeds            = {0};
  config.prompts          = {"one two three"};
  config.embedding_models = {"Dummy"};
  config.run_length       = 10;

  // DummyT2T repeats at sequence 2, the write that fails
  auto  report = orchestrator.RunExperiment(config);
  auto& failed = report.runs.at(0);
  assert(failed.run.state == RunState::kFailed);
  assert(!failed.run.stop_reason.has_value());
  assert(failed.run.error.has_value());
  assert(failed.run.error->find("disk full") != std::string::npos);
  assert(failed.run.invocations.size() == 3);
  assert(failed.diagrams.empty());

  {
    auto tx     = repository->Begin();
    auto stored = repository->GetRun(*tx, failed.run.id);
    assert(stored.has_value());
    assert(stored->state == RunState::kFailed);
    assert(stored->error == failed.run.error);
    assert(repository->CountInvocations(*tx, failed.run.id) == 2);
    tx->Commit();
  }

  // a completed run whose outcome cannot be written is stored as Failed
  repository->fail_invocation_at.reset();
  repository->fail_completed_outcome = true;
  auto  second  = orchestrator.RunExperiment(config);
  auto& outcome = second.runs.at(0);
  assert(outcome.run.state == RunState::kFailed);
  assert(outcome.run.invocations.size() == 3);

  auto tx     = repository->Begin();
  auto stored = repository->GetRun(*tx, outcome.run.id);
  assert(stored.has_value());
  assert(stored->state == RunState::kFailed);
  assert(repository->CountInvocations(*tx, outcome.run.id) == 3);
  tx->Commit();
}

} // namespace

int main() {
  const auto path = FreshDatabasePath();
  {
    auto app = trajectory::factory::Build(SqliteConfig(path), TestRegistry());
    assert(app.orchestrator->options().max_concurrent_runs == 2);

    VerifyExperimentPersistsEverything(app);
    const auto failed_run_id = VerifyFailedRunKeepsHistory(app);
    VerifyRebuildDiagrams(app, failed_run_id);
    VerifyUnknownModelsAreRejected(app);
  }
  VerifyRestartKeepsResults(path);
  VerifyStreamWithoutRepository();
  VerifyMemoryBackedExperiment();
  VerifyStorageFailureEndsRunFailed();

  std::filesystem::remove_all(path.parent_path());
  std::cout << "trajectory_integration_orchestrator: pass\n";
  return 0;
}
