#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <tsl/robin_map.h>
#include "SceneHost.hpp"
#include "Collection.hpp"
#include "CollectionNode.hpp"

class SceneSnapshot;

// In-memory scene: owns objects, collections, the view-layer tree and the
// checkpoint stack.
class Scene : public SceneHost {
    friend class SceneSnapshot;

public:
    Scene();
    ~Scene() override;

    // Construction
    SceneObject &createObject(const std::string &name, ObjectType type);
    SceneObject &createObject(const std::string &name, ObjectType type, CollectionNode &node);
    CollectionNode &createCollection(const std::string &name, CollectionNode &parent);
    GeometryDataPtr createGeometry(const std::string &name, const Geometry &geometry);

    // Links child to parent. With keepWorld the parent-inverse is set so the
    // child does not move, otherwise it is reset to identity.
    void setParent(SceneObject &child, SceneObject &parent, bool keepWorld);
    void setActiveCollection(CollectionNode &node);
    const std::vector<std::pair<std::string, std::string>> &getCheckpoints() const { return checkpoints; }

    // SceneHost
    std::vector<SceneObject*> getObjects() override;
    SceneObject * findObject(const std::string &name) override;
    CollectionNode &getViewLayerRoot() override;
    CollectionNode * getActiveCollection() override;
    bool isInViewLayer(const SceneObject &object) const override;
    bool isVisible(const SceneObject &object) const override;

    std::vector<SceneObject*> getSelectedObjects() override;
    void deselectAll() override;
    void select(SceneObject &object) override;
    void setObjectMode() override;

    int countGeometryUsers(const GeometryData &data) const override;
    GeometryDataPtr copyGeometry(const GeometryData &data) override;
    void applyTransform(SceneObject &object, bool rotation, bool scale) override;
    void setLocalTransformSkipChildren(SceneObject &object, const glm::mat4 &local) override;
    bool canConvertToMesh() const override;
    void convertToMesh() override;
    void updateTransforms() override;

    void pushCheckpoint(const std::string &message) override;
    void rollbackCheckpoint() override;

    bool isEditMode() const { return editMode; }
    void setEditMode(bool value) { editMode = value; }

private:
    bool containsObject(const CollectionNode &node, const SceneObject &object, bool requireVisible) const;
    void keepChildrenInPlace(SceneObject &object, const std::vector<glm::mat4> &childWorlds);
    std::vector<glm::mat4> getChildWorlds(const SceneObject &object) const;
    void updateRecursive(SceneObject &object, const glm::mat4 &parentWorld);
    std::string makeGeometryName(const std::string &base);

    std::vector<std::unique_ptr<SceneObject>> objects;
    tsl::robin_map<std::string, SceneObject*> objectIndex;
    std::vector<std::unique_ptr<Collection>> collections;
    std::unique_ptr<CollectionNode> viewLayerRoot;
    CollectionNode * activeCollection;
    tsl::robin_map<std::string, int> geometryNameCounters;
    std::vector<std::pair<std::string, std::string>> checkpoints;
    bool editMode;
};
