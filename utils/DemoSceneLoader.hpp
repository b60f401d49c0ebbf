#pragma once

#include "../scene/Scene.hpp"

// Builds the scene the fbxprep command line runs on: a small rig, two props
// sharing one mesh, a mirrored pillar, a curve, and content in hidden and
// excluded collections.
class DemoSceneLoader {
public:
    DemoSceneLoader() = default;
    ~DemoSceneLoader() = default;

    void loadScene(Scene &scene);
};
