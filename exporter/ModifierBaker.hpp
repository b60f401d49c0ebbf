#pragma once

#include "../scene/SceneHost.hpp"

// Converts every in-view object without an armature deformer to a mesh so its
// procedural modifiers are folded into the geometry before rebasing.
class ModifierBaker {
public:
    ModifierBaker(SceneHost &host);

    // Returns true when the conversion ran
    bool bake();

private:
    SceneHost &host;
};
