#pragma once

#include <vector>
#include "StateLedger.hpp"
#include "../scene/SceneHost.hpp"

// State of one export run. Lives on the stack of ExportOrchestrator::run.
struct ExportContext {
    SceneHost &host;
    StateLedger ledger;
    std::vector<SceneObject*> selection;
    std::vector<SceneObject*> roots;

    ExportContext(SceneHost &host) : host(host), ledger(), selection(), roots() {}
};
