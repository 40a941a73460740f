#include "factory.hpp"

#include <memory>
#include <string>
#include <unordered_map>

#include "internal/analysis/vietoris_rips.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/models/dummy_models.hpp"
#include "internal/observability/logging.hpp"

namespace trajectory::factory {

std::shared_ptr<db::Repository> BuildRepository(const trajectory::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite   = database.sqlite();

    db::sqlite::SqliteOptions options;
    options.path = sqlite.path();
    if (sqlite.has_wal_mode()) {
      options.wal_mode = sqlite.wal_mode();
    }
    if (sqlite.has_busy_timeout_ms()) {
      options.busy_timeout_ms = sqlite.busy_timeout_ms();
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    db::sqlite::BootstrapSchema(sqlite_db);

    TRAJECTORY_LOG_INFO("repository opened", {observability::StringField("backend", "sqlite"),
                                              observability::StringField("path", sqlite_db->Path()),
                                              observability::BoolField("wal_mode", sqlite_db->options().wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  TRAJECTORY_LOG_INFO("repository opened", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

engine::OrchestratorOptions ToOrchestratorOptions(const trajectory::runtime::config::RuntimeConfig& config) {
  engine::OrchestratorOptions options;

  const auto& orchestrator = config.orchestrator();
  if (orchestrator.max_concurrent_runs() > 0) {
    options.max_concurrent_runs = orchestrator.max_concurrent_runs();
  }
  options.step_timeout = std::chrono::milliseconds(orchestrator.step_timeout_ms());

  const auto& analysis = config.analysis();
  if (analysis.has_max_homology_dimension()) {
    options.max_homology_dimension = static_cast<int>(analysis.max_homology_dimension());
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const trajectory::runtime::config::RuntimeConfig& config, std::shared_ptr<registry::ModelRegistry> registry) {
  Application app;

  // ------------------------------------------------------------------
  // Models
  // ------------------------------------------------------------------
  if (!registry) {
    registry = std::make_shared<registry::ModelRegistry>();
    models::RegisterBuiltinModels(*registry);
  }
  app.registry = registry;

  std::unordered_map<std::string, std::uint32_t> capacities;
  for (const auto& [model, pool] : config.orchestrator().pools()) {
    capacities.emplace(model, pool.capacity());
  }
  app.pools = std::make_shared<pool::ModelPools>(app.registry, std::move(capacities));

  // ------------------------------------------------------------------
  // Storage + analysis
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.homology   = std::make_shared<analysis::VietorisRipsHomology>(config.analysis().max_points());

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  app.orchestrator = std::make_shared<engine::Orchestrator>(app.registry, app.pools, app.homology, app.repository, ToOrchestratorOptions(config));

  return app;
}

} // namespace trajectory::factory
