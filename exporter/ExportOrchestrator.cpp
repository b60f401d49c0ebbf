#include "ExportOrchestrator.hpp"
#include "GeometryOwnershipResolver.hpp"
#include "ModifierBaker.hpp"
#include "TransformRebaser.hpp"
#include "VisibilityNormalizer.hpp"
#include "../events/ExportEvents.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

ExportOrchestrator::ExportOrchestrator(SceneHost &host, SceneExporter &exporter, EventManager * events)
    : host(host), exporter(exporter), events(events) {

}

std::string ExportOrchestrator::individualFilePath(const std::string &filepath, const std::string &objectName) {
    std::filesystem::path directory = std::filesystem::path(filepath).parent_path();
    return (directory / (objectName + FBX_FILE_EXTENSION)).string();
}

ExportParameters ExportOrchestrator::makeParameters(const ExportSettings &settings, const std::string &filepath, bool useSelection) {
    ExportParameters parameters = settings.writer;
    parameters.filepath = filepath;
    parameters.useSelection = useSelection;
    parameters.useActiveCollection = settings.activeCollectionOnly;
    return parameters;
}

void ExportOrchestrator::publish(const std::shared_ptr<Event> &event) {
    if (events != NULL) {
        events->publish(event);
    }
}

ExportResult ExportOrchestrator::run(const ExportSettings &settings) {
    auto startTime = std::chrono::steady_clock::now();
    publish(make_event<ExportStartedEvent>(settings.filepath));

    ExportContext context(host);
    context.roots = TransformRebaser::findRoots(host);

    host.pushCheckpoint(EXPORT_CHECKPOINT_MESSAGE);
    context.ledger.begin();

    ExportResult result;
    try {
        prepare(context, settings);
        result = write(context, settings);
        restoreSelection(context);
    } catch (const std::exception &e) {
        std::cerr << "ExportOrchestrator::run: preparing the scene failed: " << e.what() << std::endl;
        host.rollbackCheckpoint();
        publish(make_event<ExportFinishedEvent>(ExportResult::notSaved(e.what())));
        throw;
    }

    // a failed write never leaves the prepared scene behind
    if (!result.isSaved() || settings.revertSceneAfterExport) {
        host.rollbackCheckpoint();
    }

    auto endTime = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(endTime - startTime).count();
    if (result.isSaved()) {
        std::cout << "ExportOrchestrator::run('" << settings.filepath << "') Ok! " << std::to_string(elapsed) << "s" << std::endl;
    }
    publish(make_event<ExportFinishedEvent>(result));
    return result;
}

void ExportOrchestrator::prepare(ExportContext &context, const ExportSettings &settings) {
    context.selection = host.getSelectedObjects();
    host.setObjectMode();

    VisibilityNormalizer normalizer(context.ledger);
    int flags = normalizer.normalizeCollections(host.getViewLayerRoot());
    flags += normalizer.normalizeObjects(host);
    std::cout << "\tVisibilityNormalizer Ok! flags=" << flags << std::endl;

    GeometryOwnershipResolver resolver(host, context.ledger);
    resolver.resolve();

    ModifierBaker baker(host);
    baker.bake();

    TransformRebaser rebaser(host, settings.fixAxisRotation, settings.moveToOrigin);
    rebaser.setCallback([this](SceneObject &object, int depth) {
        publish(make_event<ObjectRebasedEvent>(object.getName(), depth, object.getLocalTransform()));
    });
    rebaser.rebase(context.roots);

    context.ledger.restoreSharedGeometry(host);
    host.updateTransforms();
    context.ledger.restoreVisibility();
}

ExportResult ExportOrchestrator::write(ExportContext &context, const ExportSettings &settings) {
    std::vector<std::string> files;
    try {
        if (settings.exportIndividualFiles) {
            for (SceneObject * object : context.selection) {
                host.deselectAll();
                host.select(*object);
                std::string path = individualFilePath(settings.filepath, object->getName());
                exporter.exportScene(host, makeParameters(settings, path, true));
                files.push_back(path);
            }
        } else {
            host.deselectAll();
            for (SceneObject * object : context.selection) {
                host.select(*object);
            }
            exporter.exportScene(host, makeParameters(settings, settings.filepath, settings.selectedObjectsOnly));
            files.push_back(settings.filepath);
        }
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "File not saved." << std::endl;
        return ExportResult::notSaved(e.what());
    }
    std::cout << "FBX file saved." << std::endl;
    return ExportResult::saved(files);
}

void ExportOrchestrator::restoreSelection(ExportContext &context) {
    host.deselectAll();
    for (SceneObject * object : context.selection) {
        host.select(*object);
    }
}
