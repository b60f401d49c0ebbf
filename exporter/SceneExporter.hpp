#pragma once

#include "ExportParameters.hpp"
#include "../scene/SceneHost.hpp"

// Export primitive writing the scene's current selection to a file.
// Failures are reported by throwing std::exception.
class SceneExporter {
public:
    SceneExporter() = default;
    virtual ~SceneExporter() = default;

    virtual void exportScene(SceneHost &host, const ExportParameters &parameters) = 0;
};
