#pragma once

#include <string>
#include "../math/Geometry.hpp"

enum class ModifierType {
    Armature,
    Mirror,
    Displace,
    Other
};

const char* toString(ModifierType type);

// One entry of an object's procedural modifier stack
struct Modifier {
    std::string name;
    ModifierType type;
    bool showViewport;
    float strength;

    Modifier();
    Modifier(const std::string &name, ModifierType type, bool showViewport = true, float strength = 0.0f);

    // Folds this modifier's effect into the geometry. Armature deformation is pose
    // dependent and has no baked effect here.
    void evaluate(Geometry &geometry) const;
};
