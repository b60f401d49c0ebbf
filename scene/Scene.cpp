#include "Scene.hpp"
#include "SceneSnapshot.hpp"
#include "../math/Math.hpp"
#include "../math/Transformation.hpp"
#include <glm/matrix.hpp>
#include <cstdio>
#include <iostream>
#include <stdexcept>

Scene::Scene()
    : objects(), objectIndex(), collections(), viewLayerRoot(), activeCollection(NULL),
      geometryNameCounters(), checkpoints(), editMode(false) {
    collections.push_back(std::make_unique<Collection>("Scene Collection"));
    viewLayerRoot = std::make_unique<CollectionNode>(collections.back().get());
    activeCollection = viewLayerRoot.get();
}

Scene::~Scene() = default;

SceneObject &Scene::createObject(const std::string &name, ObjectType type) {
    return createObject(name, type, *viewLayerRoot);
}

SceneObject &Scene::createObject(const std::string &name, ObjectType type, CollectionNode &node) {
    if (objectIndex.find(name) != objectIndex.end()) {
        throw std::runtime_error("Object name already in use: " + name);
    }
    objects.push_back(std::make_unique<SceneObject>(name, type));
    SceneObject * object = objects.back().get();
    objectIndex[name] = object;
    node.getCollection()->link(object);
    return *object;
}

CollectionNode &Scene::createCollection(const std::string &name, CollectionNode &parent) {
    if (viewLayerRoot->find(name) != NULL) {
        throw std::runtime_error("Collection name already in use: " + name);
    }
    collections.push_back(std::make_unique<Collection>(name));
    return parent.addChild(collections.back().get());
}

GeometryDataPtr Scene::createGeometry(const std::string &name, const Geometry &geometry) {
    return std::make_shared<GeometryData>(name, geometry);
}

void Scene::setParent(SceneObject &child, SceneObject &parent, bool keepWorld) {
    glm::mat4 parentWorld = parent.evaluateWorldTransform();
    child.setParent(&parent);
    if (keepWorld) {
        if (!Math::isInvertible(parentWorld)) {
            throw std::runtime_error("Cannot parent '" + child.getName() + "' to '" + parent.getName() + "': singular parent transform");
        }
        child.setParentInverse(glm::inverse(parentWorld));
    } else {
        child.setParentInverse(glm::mat4(1.0f));
    }
}

void Scene::setActiveCollection(CollectionNode &node) {
    activeCollection = &node;
}

std::vector<SceneObject*> Scene::getObjects() {
    std::vector<SceneObject*> result;
    result.reserve(objects.size());
    for (auto &object : objects) {
        result.push_back(object.get());
    }
    return result;
}

SceneObject * Scene::findObject(const std::string &name) {
    auto it = objectIndex.find(name);
    return it == objectIndex.end() ? NULL : it->second;
}

CollectionNode &Scene::getViewLayerRoot() {
    return *viewLayerRoot;
}

CollectionNode * Scene::getActiveCollection() {
    return activeCollection;
}

bool Scene::containsObject(const CollectionNode &node, const SceneObject &object, bool requireVisible) const {
    if (node.isExcluded()) {
        return false;
    }
    if (requireVisible && (node.isHideViewport() || node.getCollection()->hideViewport)) {
        return false;
    }
    if (node.getCollection()->contains(&object)) {
        return true;
    }
    for (const auto &child : node.getChildren()) {
        if (containsObject(*child, object, requireVisible)) {
            return true;
        }
    }
    return false;
}

bool Scene::isInViewLayer(const SceneObject &object) const {
    return containsObject(*viewLayerRoot, object, false);
}

bool Scene::isVisible(const SceneObject &object) const {
    if (object.isHidden() || object.isDisabled()) {
        return false;
    }
    return containsObject(*viewLayerRoot, object, true);
}

std::vector<SceneObject*> Scene::getSelectedObjects() {
    std::vector<SceneObject*> result;
    for (auto &object : objects) {
        if (object->isSelected() && isVisible(*object)) {
            result.push_back(object.get());
        }
    }
    return result;
}

void Scene::deselectAll() {
    for (auto &object : objects) {
        object->setSelected(false);
    }
}

void Scene::select(SceneObject &object) {
    if (!isVisible(object)) {
        throw std::runtime_error("Object '" + object.getName() + "' can't be selected because it is not visible in the viewport");
    }
    object.setSelected(true);
}

void Scene::setObjectMode() {
    editMode = false;
}

int Scene::countGeometryUsers(const GeometryData &data) const {
    int users = 0;
    for (const auto &object : objects) {
        if (object->getGeometry().get() == &data) {
            ++users;
        }
    }
    return users;
}

std::string Scene::makeGeometryName(const std::string &base) {
    std::string stem = base;
    size_t dot = base.rfind('.');
    if (dot != std::string::npos && base.size() - dot == 4 && base.find_first_not_of("0123456789", dot + 1) == std::string::npos) {
        stem = base.substr(0, dot);
    }
    int counter = ++geometryNameCounters[stem];
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), ".%03d", counter);
    return stem + suffix;
}

GeometryDataPtr Scene::copyGeometry(const GeometryData &data) {
    return data.copy(makeGeometryName(data.name));
}

std::vector<glm::mat4> Scene::getChildWorlds(const SceneObject &object) const {
    std::vector<glm::mat4> worlds;
    for (SceneObject * child : object.getChildren()) {
        worlds.push_back(child->evaluateWorldTransform());
    }
    return worlds;
}

void Scene::keepChildrenInPlace(SceneObject &object, const std::vector<glm::mat4> &childWorlds) {
    const std::vector<SceneObject*> &children = object.getChildren();
    if (children.empty()) return;

    glm::mat4 parentWorld = object.evaluateWorldTransform();
    if (!Math::isInvertible(parentWorld)) {
        throw std::runtime_error("Cannot keep children of '" + object.getName() + "' in place: singular transform");
    }
    glm::mat4 inverse = glm::inverse(parentWorld);
    for (size_t i = 0; i < children.size(); ++i) {
        children[i]->setLocalTransform(childWorlds[i]);
        children[i]->setParentInverse(inverse);
    }
}

void Scene::applyTransform(SceneObject &object, bool rotation, bool scale) {
    if (!isVisible(object)) {
        throw std::runtime_error("Cannot apply transform to '" + object.getName() + "': object is not visible in the viewport");
    }
    const GeometryDataPtr &data = object.getGeometry();
    if (data && countGeometryUsers(*data) > 1) {
        throw std::runtime_error("Cannot apply to a multi user: Object \"" + object.getName() + "\", Data \"" + data->name + "\"");
    }
    if (!rotation && !scale) return;

    std::vector<glm::mat4> childWorlds = getChildWorlds(object);
    Transformation transformation(object.getLocalTransform());
    glm::mat3 rotationMatrix = transformation.getRotationMatrix();
    glm::mat3 scaleMatrix = transformation.getScaleMatrix();

    glm::mat3 applied(1.0f);
    glm::mat4 kept = Math::translation(transformation.translate);
    if (rotation && scale) {
        applied = rotationMatrix * scaleMatrix;
    } else if (rotation) {
        applied = rotationMatrix;
        kept = kept * glm::mat4(scaleMatrix);
    } else {
        applied = scaleMatrix;
        kept = kept * glm::mat4(rotationMatrix);
    }

    if (data) {
        data->geometry.transform(applied);
    }
    object.setLocalTransform(kept);
    keepChildrenInPlace(object, childWorlds);
}

void Scene::setLocalTransformSkipChildren(SceneObject &object, const glm::mat4 &local) {
    std::vector<glm::mat4> childWorlds = getChildWorlds(object);
    object.setLocalTransform(local);
    keepChildrenInPlace(object, childWorlds);
}

bool Scene::canConvertToMesh() const {
    for (const auto &object : objects) {
        if (object->isSelected() && isVisible(*object) && isGeometryBearing(object->getType()) && object->getGeometry()) {
            return true;
        }
    }
    return false;
}

void Scene::convertToMesh() {
    if (!canConvertToMesh()) {
        throw std::runtime_error("Convert to mesh: no convertible object selected");
    }
    for (SceneObject * object : getSelectedObjects()) {
        if (!isGeometryBearing(object->getType()) || !object->getGeometry()) {
            continue;
        }
        GeometryDataPtr data = object->getGeometry();
        if (countGeometryUsers(*data) > 1) {
            data = copyGeometry(*data);
            object->setGeometry(data);
        }
        for (const Modifier &modifier : object->getModifiers()) {
            if (modifier.showViewport) {
                modifier.evaluate(data->geometry);
            }
        }
        object->getModifiers().clear();
        object->setType(ObjectType::Mesh);
    }
}

void Scene::updateRecursive(SceneObject &object, const glm::mat4 &parentWorld) {
    glm::mat4 world = object.getParent() == NULL
        ? object.getLocalTransform()
        : parentWorld * object.getParentInverse() * object.getLocalTransform();
    object.setWorldTransform(world);
    for (SceneObject * child : object.getChildren()) {
        updateRecursive(*child, world);
    }
}

void Scene::updateTransforms() {
    for (auto &object : objects) {
        if (object->getParent() == NULL) {
            updateRecursive(*object, glm::mat4(1.0f));
        }
    }
}

void Scene::pushCheckpoint(const std::string &message) {
    checkpoints.emplace_back(message, SceneSnapshot::capture(*this));
}

void Scene::rollbackCheckpoint() {
    if (checkpoints.empty()) {
        throw std::runtime_error("No checkpoint to roll back to");
    }
    std::string message = checkpoints.back().first;
    SceneSnapshot::restore(*this, checkpoints.back().second);
    checkpoints.pop_back();
    std::cout << "Scene::rollbackCheckpoint('" << message << "') Ok!" << std::endl;
}
