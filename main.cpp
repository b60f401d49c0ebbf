#include "events/EventManager.hpp"
#include "events/ExportEvents.hpp"
#include "exporter/ExportOrchestrator.hpp"
#include "exporter/SceneArchiveExporter.hpp"
#include "scene/Scene.hpp"
#include "utils/DemoSceneLoader.hpp"

#include <string>
#include <iostream>

class ConsoleEventLogger : public IEventHandler {
public:
    void onEvent(const EventPtr &event) override {
        if (std::dynamic_pointer_cast<ObjectRebasedEvent>(event)) {
            std::cout << "\t" << event->describe() << std::endl;
        } else {
            std::cout << "[" << event->name() << "] " << event->describe() << std::endl;
        }
    }
};

static void printUsage(const char * program) {
    std::cerr << "usage: " << program
              << " [--active-collection] [--all-objects] [--move-to-origin]"
              << " [--individual] [--fix-rotation] [--keep-changes] <output.fbx>" << std::endl;
}

int main(int argc, char ** argv) {
    ExportSettings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--active-collection") {
            settings.activeCollectionOnly = true;
        } else if (arg == "--all-objects") {
            settings.selectedObjectsOnly = false;
        } else if (arg == "--move-to-origin") {
            settings.moveToOrigin = true;
        } else if (arg == "--individual") {
            settings.exportIndividualFiles = true;
        } else if (arg == "--fix-rotation") {
            settings.fixAxisRotation = true;
        } else if (arg == "--keep-changes") {
            settings.revertSceneAfterExport = false;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else if (settings.filepath.empty()) {
            settings.filepath = arg;
        } else {
            std::cerr << "Only one output file can be given" << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }
    if (settings.filepath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    Scene scene;
    DemoSceneLoader loader;
    loader.loadScene(scene);

    EventManager eventManager;
    ConsoleEventLogger logger;
    eventManager.subscribe(&logger);

    SceneArchiveExporter exporter;
    ExportOrchestrator orchestrator(scene, exporter, &eventManager);
    ExportResult result;
    try {
        result = orchestrator.run(settings);
    } catch (const std::exception &e) {
        std::cerr << "Export failed: " << e.what() << std::endl;
        eventManager.unsubscribe(&logger);
        return 1;
    }
    eventManager.unsubscribe(&logger);

    for (const std::string &file : result.getFiles()) {
        std::cout << "\t" << file << std::endl;
    }
    std::cout << result.toString() << std::endl;
    return result.isSaved() ? 0 : 1;
}
