#pragma once

#include <string>
#include "ExportContext.hpp"
#include "ExportResult.hpp"
#include "ExportSettings.hpp"
#include "SceneExporter.hpp"
#include "../events/EventManager.hpp"

#define EXPORT_CHECKPOINT_MESSAGE "Prepare FBX export"

// Runs one export: prepares the scene inside a checkpoint (visibility,
// geometry ownership, modifier bake, transform rebase), writes one or more
// files through the export primitive and reverts the scene.
class ExportOrchestrator {
public:
    ExportOrchestrator(SceneHost &host, SceneExporter &exporter, EventManager * events = NULL);

    // Export primitive failures come back as NotSaved. Failures while preparing
    // the scene roll the checkpoint back and are rethrown.
    ExportResult run(const ExportSettings &settings);

    // <directory of filepath>/<objectName>.fbx
    static std::string individualFilePath(const std::string &filepath, const std::string &objectName);

    static ExportParameters makeParameters(const ExportSettings &settings, const std::string &filepath, bool useSelection);

private:
    void prepare(ExportContext &context, const ExportSettings &settings);
    ExportResult write(ExportContext &context, const ExportSettings &settings);
    void restoreSelection(ExportContext &context);
    void publish(const std::shared_ptr<Event> &event);

    SceneHost &host;
    SceneExporter &exporter;
    EventManager * events;
};
