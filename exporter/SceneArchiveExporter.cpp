#include "SceneArchiveExporter.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

void SceneArchiveExporter::collectLinked(const CollectionNode &node, std::vector<const Collection*> &collections) {
    collections.push_back(node.getCollection());
    for (const auto &child : node.getChildren()) {
        collectLinked(*child, collections);
    }
}

std::vector<SceneObject*> SceneArchiveExporter::collectObjects(SceneHost &host, const ExportParameters &parameters) {
    std::vector<SceneObject*> selected;
    if (parameters.useSelection) {
        selected = host.getSelectedObjects();
    }
    std::vector<const Collection*> activeCollections;
    if (parameters.useActiveCollection) {
        CollectionNode * active = host.getActiveCollection();
        if (active != NULL) {
            collectLinked(*active, activeCollections);
        }
    }

    std::vector<SceneObject*> result;
    for (SceneObject * object : host.getObjects()) {
        if (!parameters.acceptsType(object->getType())) {
            continue;
        }
        if (parameters.useSelection && std::find(selected.begin(), selected.end(), object) == selected.end()) {
            continue;
        }
        if (parameters.useActiveCollection) {
            bool linked = false;
            for (const Collection * collection : activeCollections) {
                if (collection->contains(object)) {
                    linked = true;
                    break;
                }
            }
            if (!linked) {
                continue;
            }
        }
        result.push_back(object);
    }
    return result;
}

SceneArchive SceneArchiveExporter::buildArchive(SceneHost &host, const ExportParameters &parameters) {
    std::vector<SceneObject*> exported = collectObjects(host, parameters);

    SceneArchive archive;
    archive.useMeshModifiers = parameters.useMeshModifiers;
    archive.addLeafBones = parameters.addLeafBones;
    archive.useArmatureDeformOnly = parameters.useArmatureDeformOnly;
    archive.meshSmoothType = parameters.meshSmoothType;
    archive.applyScaleOptions = parameters.applyScaleOptions;

    for (SceneObject * object : exported) {
        ArchivedObject entry;
        entry.name = object->getName();
        entry.type = object->getType();
        SceneObject * parent = object->getParent();
        if (parent != NULL && std::find(exported.begin(), exported.end(), parent) != exported.end()) {
            entry.parentName = parent->getName();
        }
        entry.worldTransform = object->getWorldTransform();
        if (object->getType() == ObjectType::Mesh && object->getGeometry()) {
            entry.geometry = object->getGeometry()->geometry;
            if (parameters.useMeshModifiers) {
                for (const Modifier &modifier : object->getModifiers()) {
                    if (modifier.showViewport) {
                        modifier.evaluate(entry.geometry);
                    }
                }
            }
        }
        archive.objects.push_back(entry);
    }
    return archive;
}

void SceneArchiveExporter::exportScene(SceneHost &host, const ExportParameters &parameters) {
    if (parameters.filepath.empty()) {
        throw std::runtime_error("No output file given");
    }
    auto startTime = std::chrono::steady_clock::now();
    SceneArchive archive = buildArchive(host, parameters);
    archive.save(parameters.filepath);
    auto endTime = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(endTime - startTime).count();
    std::cout << "SceneArchiveExporter::exportScene('" << parameters.filepath << "') Ok! objects="
              << archive.objects.size() << ", " << std::to_string(elapsed) << "s" << std::endl;
}
