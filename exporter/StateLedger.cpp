#include "StateLedger.hpp"
#include <iostream>
#include <stdexcept>

void StateLedger::begin() {
    if (!empty()) {
        throw std::logic_error("StateLedger::begin() called while a previous export run is still pending restoration");
    }
}

bool StateLedger::empty() const {
    return size() == 0;
}

size_t StateLedger::size() const {
    return sharedGeometry.size() + hiddenObjects.size() + disabledObjects.size()
        + hiddenCollections.size() + disabledCollections.size();
}

void StateLedger::recordSharedGeometry(const std::string &objectName, const GeometryDataPtr &data) {
    sharedGeometry[objectName] = data;
}

void StateLedger::recordHiddenObject(SceneObject * object) {
    hiddenObjects.push_back(object);
}

void StateLedger::recordDisabledObject(SceneObject * object) {
    disabledObjects.push_back(object);
}

void StateLedger::recordHiddenCollection(CollectionNode * node) {
    hiddenCollections.push_back(node);
}

void StateLedger::recordDisabledCollection(CollectionNode * node) {
    disabledCollections.push_back(node);
}

void StateLedger::restoreSharedGeometry(SceneHost &host) {
    for (const auto &entry : sharedGeometry) {
        SceneObject * object = host.findObject(entry.first);
        if (object == NULL) {
            std::cerr << "StateLedger: object '" << entry.first << "' vanished, shared data '" << entry.second->name << "' not restored" << std::endl;
            continue;
        }
        object->setGeometry(entry.second);
    }
    sharedGeometry.clear();
}

void StateLedger::restoreVisibility() {
    for (SceneObject * object : hiddenObjects) {
        object->setHidden(true);
    }
    for (SceneObject * object : disabledObjects) {
        object->setDisabled(true);
    }
    for (CollectionNode * node : hiddenCollections) {
        node->setHideViewport(true);
    }
    for (CollectionNode * node : disabledCollections) {
        node->getCollection()->hideViewport = true;
    }
    hiddenObjects.clear();
    disabledObjects.clear();
    hiddenCollections.clear();
    disabledCollections.clear();
}
