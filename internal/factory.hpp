#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/analysis/homology.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/orchestrator.hpp"
#include "internal/pool/model_pools.hpp"
#include "internal/registry/model_registry.hpp"

namespace trajectory::factory {

/*
  Application

  Owns all long-lived components used by one process. Pools are shut down
  when the last reference goes away.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<const registry::ModelRegistry> registry;
  std::shared_ptr<pool::ModelPools>              pools;
  std::shared_ptr<const analysis::HomologyEngine> homology;
  std::shared_ptr<engine::Orchestrator>          orchestrator;
};

/*
  Build

  Constructs the whole engine from runtime config. Without an explicit
  registry the built-in models are registered.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const trajectory::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<registry::ModelRegistry>          registry = nullptr);

// Storage only, for commands that never generate.
std::shared_ptr<db::Repository> BuildRepository(const trajectory::runtime::config::RuntimeConfig& config);

engine::OrchestratorOptions ToOrchestratorOptions(const trajectory::runtime::config::RuntimeConfig& config);

} // namespace trajectory::factory
