#pragma once

#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "ObjectType.hpp"
#include "Modifier.hpp"
#include "GeometryData.hpp"

// Node of the object hierarchy. The owning scene keeps the forward edges alive;
// parent and children are plain back references.
//
// World transform: parent.world * parentInverse * local (local alone for roots).
class SceneObject {
public:
    SceneObject(const std::string &name, ObjectType type);
    ~SceneObject() = default;

    const std::string &getName() const { return name; }
    ObjectType getType() const { return type; }
    void setType(ObjectType value) { type = value; }

    const glm::mat4 &getLocalTransform() const { return localTransform; }
    void setLocalTransform(const glm::mat4 &m) { localTransform = m; }

    const glm::mat4 &getParentInverse() const { return parentInverse; }
    void setParentInverse(const glm::mat4 &m) { parentInverse = m; }

    // Value cached by the last scene update
    const glm::mat4 &getWorldTransform() const { return worldTransform; }
    void setWorldTransform(const glm::mat4 &m) { worldTransform = m; }

    // Computed from the current local transforms up the parent chain
    glm::mat4 evaluateWorldTransform() const;

    SceneObject * getParent() const { return parent; }
    const std::vector<SceneObject*> &getChildren() const { return children; }
    void setParent(SceneObject * newParent);

    const GeometryDataPtr &getGeometry() const { return geometry; }
    void setGeometry(const GeometryDataPtr &data) { geometry = data; }

    bool isHidden() const { return hidden; }
    void setHidden(bool value) { hidden = value; }

    bool isDisabled() const { return disabled; }
    void setDisabled(bool value) { disabled = value; }

    bool isSelected() const { return selected; }
    void setSelected(bool value) { selected = value; }

    std::vector<Modifier> &getModifiers() { return modifiers; }
    const std::vector<Modifier> &getModifiers() const { return modifiers; }
    void addModifier(const Modifier &modifier);
    bool hasModifier(ModifierType modifierType) const;
    int countActiveModifiers() const;

private:
    std::string name;
    ObjectType type;
    glm::mat4 localTransform;
    glm::mat4 parentInverse;
    glm::mat4 worldTransform;
    SceneObject * parent;
    std::vector<SceneObject*> children;
    GeometryDataPtr geometry;
    std::vector<Modifier> modifiers;
    bool hidden;
    bool disabled;
    bool selected;
};
