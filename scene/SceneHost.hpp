#pragma once

#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "SceneObject.hpp"
#include "CollectionNode.hpp"
#include "GeometryData.hpp"

// Scene management operations the export preparation consumes. Objects,
// collections and geometry stay owned by the implementation; callers mutate
// transforms, visibility flags and geometry references through SceneObject and
// CollectionNode directly and use this interface for everything with host-side
// bookkeeping.
class SceneHost {
public:
    SceneHost() = default;
    virtual ~SceneHost() = default;

    // Enumeration
    virtual std::vector<SceneObject*> getObjects() = 0;
    virtual SceneObject * findObject(const std::string &name) = 0;
    virtual CollectionNode &getViewLayerRoot() = 0;
    virtual CollectionNode * getActiveCollection() = 0;

    // True when the object is linked to a collection of a non-excluded branch
    virtual bool isInViewLayer(const SceneObject &object) const = 0;

    // True when the object can be selected and edited in the viewport
    virtual bool isVisible(const SceneObject &object) const = 0;

    // Selection and interaction mode
    virtual std::vector<SceneObject*> getSelectedObjects() = 0;
    virtual void deselectAll() = 0;
    virtual void select(SceneObject &object) = 0;
    virtual void setObjectMode() = 0;

    // Geometry
    virtual int countGeometryUsers(const GeometryData &data) const = 0;
    virtual GeometryDataPtr copyGeometry(const GeometryData &data) = 0;

    // Folds the rotation and/or scale of the object's local transform into its
    // geometry. Children keep their world pose.
    virtual void applyTransform(SceneObject &object, bool rotation, bool scale) = 0;

    // Assigns a local transform while children keep their world pose
    virtual void setLocalTransformSkipChildren(SceneObject &object, const glm::mat4 &local) = 0;

    virtual bool canConvertToMesh() const = 0;
    virtual void convertToMesh() = 0;

    // Recomputes the cached world transforms from the local transforms
    virtual void updateTransforms() = 0;

    // Session checkpoints
    virtual void pushCheckpoint(const std::string &message) = 0;
    virtual void rollbackCheckpoint() = 0;
};
