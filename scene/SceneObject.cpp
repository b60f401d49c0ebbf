#include "SceneObject.hpp"
#include <algorithm>

SceneObject::SceneObject(const std::string &name, ObjectType type)
    : name(name), type(type),
      localTransform(1.0f), parentInverse(1.0f), worldTransform(1.0f),
      parent(NULL), children(), geometry(), modifiers(),
      hidden(false), disabled(false), selected(false) {}

glm::mat4 SceneObject::evaluateWorldTransform() const {
    if (parent == NULL) {
        return localTransform;
    }
    return parent->evaluateWorldTransform() * parentInverse * localTransform;
}

void SceneObject::setParent(SceneObject * newParent) {
    if (parent == newParent) return;
    if (parent != NULL) {
        std::vector<SceneObject*> &siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), this), siblings.end());
    }
    parent = newParent;
    if (parent != NULL) {
        parent->children.push_back(this);
    }
}

void SceneObject::addModifier(const Modifier &modifier) {
    modifiers.push_back(modifier);
}

bool SceneObject::hasModifier(ModifierType modifierType) const {
    for (const Modifier &modifier : modifiers) {
        if (modifier.type == modifierType) {
            return true;
        }
    }
    return false;
}

int SceneObject::countActiveModifiers() const {
    int count = 0;
    for (const Modifier &modifier : modifiers) {
        if (modifier.showViewport) {
            ++count;
        }
    }
    return count;
}
