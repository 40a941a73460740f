#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "internal/analysis/embedding_collector.hpp"
#include "internal/analysis/semantic_drift.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/hashing/jpeg_encoder.hpp"
#include "internal/models/dummy_models.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

using trajectory::runtime::config::RuntimeConfig;

namespace {

constexpr int kExportJpegQuality = 90;

void Usage() {
  std::cout << "Usage:\n"
            << "  trajectory-tracer run-experiment <config.yaml>\n"
            << "  trajectory-tracer list-runs <config.yaml> [--verbose]\n"
            << "  trajectory-tracer list-models\n"
            << "  trajectory-tracer rebuild-diagrams <config.yaml> <run_id|all>\n"
            << "  trajectory-tracer drift <config.yaml> <run_id> <embedding_model>\n"
            << "  trajectory-tracer export-images <config.yaml> <run_id|all> <output_dir>\n";
}

RuntimeConfig LoadAndInitialize(const std::string& path) {
  auto config = trajectory::config::ConfigLoader::LoadFromYaml(path);

  trajectory::observability::InitializeLogging(config);
  trajectory::observability::InitializeTracing(config);
  trajectory::observability::InitializeMetrics(config);
  return config;
}

void Shutdown() {
  trajectory::observability::ShutdownMetrics();
  trajectory::observability::ShutdownTracing();
  trajectory::observability::ShutdownLogging();
}

std::string Describe(const trajectory::model::Content& content) {
  if (const auto* text = std::get_if<std::string>(&content)) {
    return text->size() > 60 ? "\"" + text->substr(0, 57) + "...\"" : "\"" + *text + "\"";
  }
  const auto& image = std::get<trajectory::model::Image>(content);
  return "<image " + std::to_string(image.width) + "x" + std::to_string(image.height) + ">";
}

std::string Outcome(const trajectory::model::Run& run) {
  std::string outcome(trajectory::model::ToString(run.state));
  if (run.stop_reason) outcome += " (" + trajectory::model::ToString(*run.stop_reason) + ")";
  if (run.error) outcome += ": " + *run.error;
  return outcome;
}

std::string JoinNetwork(const trajectory::model::Network& network) {
  std::string joined;
  for (const auto& model : network) {
    if (!joined.empty()) joined += " -> ";
    joined += model;
  }
  return joined;
}

// Run ids named on the command line, or every stored run for "all".
std::vector<trajectory::model::Run> SelectRuns(trajectory::db::Repository& repository, const std::string& selector) {
  return trajectory::db::InTransaction(repository, [&](trajectory::db::Transaction& tx) {
    std::vector<trajectory::model::Run> runs;
    if (selector == "all") {
      for (const auto& header : repository.ListRuns(tx)) {
        if (auto run = repository.GetRun(tx, header.id)) runs.push_back(std::move(*run));
      }
    } else {
      auto run = repository.GetRun(tx, selector);
      if (!run) throw trajectory::util::NotFound("run not found: " + selector);
      runs.push_back(std::move(*run));
    }
    return runs;
  });
}

int RunExperiment(const std::string& config_path) {
  auto config     = LoadAndInitialize(config_path);
  auto experiment = trajectory::config::ConfigLoader::ToExperiment(config);
  auto app        = trajectory::factory::Build(config);

  auto report = app.orchestrator->RunExperiment(experiment);

  std::cout << "experiment " << report.experiment_id << "\n";
  for (const auto& run_report : report.runs) {
    const auto& run = run_report.run;
    std::cout << "  " << run.id << "  " << Outcome(run) << "  invocations=" << run.invocations.size()
              << " embeddings=" << run_report.embeddings.size() << " embedding_errors=" << run_report.embedding_errors.size()
              << " diagrams=" << run_report.diagrams.size() << "\n";
  }
  std::cout << "completed=" << report.Count(trajectory::model::RunState::kCompleted)
            << " failed=" << report.Count(trajectory::model::RunState::kFailed) << "\n";
  return 0;
}

int ListRuns(const std::string& config_path, bool verbose) {
  auto config     = LoadAndInitialize(config_path);
  auto repository = trajectory::factory::BuildRepository(config);

  auto runs = SelectRuns(*repository, "all");
  for (const auto& run : runs) {
    std::cout << run.id << "  [" << JoinNetwork(run.network) << "]  seed=" << run.seed << "  " << Outcome(run)
              << "  invocations=" << run.invocations.size() << "\n";
    if (!verbose) continue;

    if (auto created = trajectory::util::IdCreatedAt(run.id)) {
      std::cout << "  created: " << trajectory::util::FormatUtc(*created) << "\n";
    }
    std::cout << "  prompt: \"" << run.initial_prompt << "\"\n";
    for (const auto& invocation : run.invocations) {
      std::cout << "  " << std::setw(4) << invocation.sequence_number << "  " << invocation.model << "  "
                << (invocation.output ? Describe(*invocation.output) : std::string("<none>")) << "  " << std::fixed
                << std::setprecision(3) << invocation.duration() << "s\n";
    }
  }
  std::cout << runs.size() << " run(s)\n";
  return 0;
}

int ListModels() {
  trajectory::registry::ModelRegistry registry;
  trajectory::models::RegisterBuiltinModels(registry);

  std::cout << "generative models:\n";
  for (const auto& name : registry.GeneratorNames()) {
    std::cout << "  " << name << "  -> " << trajectory::model::ToString(registry.OutputModality(name)) << "\n";
  }
  std::cout << "embedding models:\n";
  for (const auto& name : registry.EmbedderNames()) {
    std::cout << "  " << name << "  dim=" << registry.Embedder(name).dimension << "\n";
  }
  return 0;
}

int RebuildDiagrams(const std::string& config_path, const std::string& selector) {
  auto config = LoadAndInitialize(config_path);
  auto app    = trajectory::factory::Build(config);

  std::size_t rebuilt = 0;
  for (const auto& run : SelectRuns(*app.repository, selector)) {
    if (run.state != trajectory::model::RunState::kCompleted) {
      if (selector != "all") throw trajectory::util::InvalidState("run " + run.id + " is not completed");
      continue;
    }
    for (const auto& diagram : app.orchestrator->RebuildDiagrams(run.id)) {
      std::cout << run.id << "  " << diagram.embedding_model;
      for (const auto& dimension : diagram.dimensions) {
        std::cout << "  H" << dimension.dimension << "=" << dimension.generators.size();
        if (dimension.entropy) std::cout << " (entropy " << std::setprecision(4) << *dimension.entropy << ")";
      }
      std::cout << "\n";
      ++rebuilt;
    }
  }
  std::cout << rebuilt << " diagram(s) rebuilt\n";
  return 0;
}

int Drift(const std::string& config_path, const std::string& run_id, const std::string& embedding_model) {
  auto config     = LoadAndInitialize(config_path);
  auto repository = trajectory::factory::BuildRepository(config);

  auto points = trajectory::db::InTransaction(*repository, [&](trajectory::db::Transaction& tx) {
    auto run = repository->GetRun(tx, run_id);
    if (!run) throw trajectory::util::NotFound("run not found: " + run_id);
    return trajectory::analysis::CollectTrajectory(*run, repository->ListEmbeddings(tx, run_id), embedding_model);
  });
  auto drift  = trajectory::analysis::SemanticDrift(points);
  for (std::size_t i = 0; i < drift.size(); ++i) {
    std::cout << std::setw(4) << i << "  " << std::fixed << std::setprecision(6) << drift[i] << "\n";
  }
  return 0;
}

int ExportImages(const std::string& config_path, const std::string& selector, const std::string& output_dir) {
  auto config     = LoadAndInitialize(config_path);
  auto repository = trajectory::factory::BuildRepository(config);

  std::filesystem::create_directories(output_dir);

  std::size_t exported = 0;
  for (const auto& run : SelectRuns(*repository, selector)) {
    for (const auto& invocation : run.invocations) {
      if (!invocation.output) continue;
      const auto* image = std::get_if<trajectory::model::Image>(&*invocation.output);
      if (!image) continue;

      const auto    bytes = trajectory::hashing::EncodeJpeg(*image, kExportJpegQuality);
      const auto    path  = std::filesystem::path(output_dir) / (invocation.id + ".jpg");
      std::ofstream out(path, std::ios::binary);
      out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
      if (!out) throw std::runtime_error("failed to write " + path.string());
      ++exported;
    }
  }
  std::cout << exported << " image(s) written to " << output_dir << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[1];

  try {
    int rc = -1;
    if (cmd == "run-experiment" && argc == 3) {
      rc = RunExperiment(argv[2]);
    } else if (cmd == "list-runs" && (argc == 3 || (argc == 4 && std::string(argv[3]) == "--verbose"))) {
      rc = ListRuns(argv[2], argc == 4);
    } else if (cmd == "list-models" && argc == 2) {
      rc = ListModels();
    } else if (cmd == "rebuild-diagrams" && argc == 4) {
      rc = RebuildDiagrams(argv[2], argv[3]);
    } else if (cmd == "drift" && argc == 5) {
      rc = Drift(argv[2], argv[3], argv[4]);
    } else if (cmd == "export-images" && argc == 5) {
      rc = ExportImages(argv[2], argv[3], argv[4]);
    } else {
      Usage();
      return 1;
    }
    Shutdown();
    return rc;
  } catch (const trajectory::util::InvalidConfig& e) {
    std::cerr << "invalid config: " << e.what() << "\n";
    Shutdown();
    return 2;
  } catch (const std::exception& e) {
    TRAJECTORY_LOG_ERROR("Fatal error", {trajectory::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }
}
