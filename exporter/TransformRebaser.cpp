#include "TransformRebaser.hpp"
#include "../math/Math.hpp"
#include <iostream>
#include <stdexcept>

TransformRebaser::TransformRebaser(SceneHost &host, bool fixAxisRotation, bool moveRootsToOrigin)
    : host(host), fixAxisRotation(fixAxisRotation), moveRootsToOrigin(moveRootsToOrigin), callback(), processed(0) {

}

std::vector<SceneObject*> TransformRebaser::findRoots(SceneHost &host) {
    std::vector<SceneObject*> roots;
    for (SceneObject * object : host.getObjects()) {
        if (object->getParent() == NULL && isExportable(object->getType())) {
            roots.push_back(object);
        }
    }
    return roots;
}

void TransformRebaser::rebase(const std::vector<SceneObject*> &roots) {
    for (SceneObject * root : roots) {
        rebase(*root, 0);
    }
    std::cout << "TransformRebaser::rebase Ok! roots=" << roots.size() << ", processed=" << processed << std::endl;
}

void TransformRebaser::resetParentInverse(SceneObject &object) {
    SceneObject * parent = object.getParent();
    if (parent != NULL) {
        glm::mat4 parentWorld = parent->evaluateWorldTransform();
        if (!Math::isInvertible(parentWorld)) {
            throw std::runtime_error("Cannot reset parent inverse of '" + object.getName() + "': singular parent transform");
        }
        glm::mat4 world = object.evaluateWorldTransform();
        object.setLocalTransform(glm::inverse(parentWorld) * world);
    }
    object.setParentInverse(glm::mat4(1.0f));
}

void TransformRebaser::rebase(SceneObject &object, int depth) {
    if (host.isInViewLayer(object)) {
        if (fixAxisRotation) {
            host.applyTransform(object, true, true);
            resetParentInverse(object);

            glm::mat4 original = object.getLocalTransform();
            object.setLocalTransform(Math::rotationX(-90.0f));
            host.applyTransform(object, true, false);
            object.setLocalTransform(original * Math::rotationX(90.0f));
        }
        if (moveRootsToOrigin && depth == 0) {
            host.setLocalTransformSkipChildren(object, Math::withTranslation(object.getLocalTransform(), glm::vec3(0.0f)));
        }
        ++processed;
        if (callback) {
            callback(object, depth);
        }
    }

    // copy: a callback may reparent
    std::vector<SceneObject*> children = object.getChildren();
    for (SceneObject * child : children) {
        rebase(*child, depth + 1);
    }
}
