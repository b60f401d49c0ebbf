#pragma once

#include <functional>
#include <vector>
#include "../scene/SceneHost.hpp"

// Called once for every object the rebaser processed
using RebaseCallback = std::function<void(SceneObject &object, int depth)>;

// Rewrites object hierarchies so the exported file needs no axis correction:
// rotation and scale move into the geometry, parent-inverse matrices are folded
// into the local transforms and, optionally, a -90 degree X rotation is baked in
// while the object keeps its pose. Roots can be moved to the world origin.
class TransformRebaser {
public:
    TransformRebaser(SceneHost &host, bool fixAxisRotation, bool moveRootsToOrigin);

    void setCallback(const RebaseCallback &value) { callback = value; }

    // Parentless objects of exportable kinds, in scene order
    static std::vector<SceneObject*> findRoots(SceneHost &host);

    void rebase(const std::vector<SceneObject*> &roots);

    // Processes object (when it is in the view layer) then all of its children at depth + 1
    void rebase(SceneObject &object, int depth);

    // Folds the parent-inverse matrix into the local transform
    void resetParentInverse(SceneObject &object);

    int getProcessedCount() const { return processed; }

private:
    SceneHost &host;
    bool fixAxisRotation;
    bool moveRootsToOrigin;
    RebaseCallback callback;
    int processed;
};
