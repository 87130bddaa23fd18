#pragma once

#include "engine/update_orchestrator.hpp"
#include "util/config.hpp"

#include <memory>

namespace pkgrepo {

struct Engine {
    EngineServices services;
    std::unique_ptr<UpdateOrchestrator> orchestrator;
};

// Wires storage, locking, metadata, signing and routing from configuration.
// A null store builds the one named in cfg.storage.
Result BuildEngine(const config::EngineConfig& cfg,
                   std::shared_ptr<IObjectStore> store,
                   std::shared_ptr<const IClock> clock,
                   Engine& out);

} // namespace pkgrepo
