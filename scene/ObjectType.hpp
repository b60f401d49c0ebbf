#pragma once

#include <string>

enum class ObjectType {
    Empty,
    Mesh,
    Armature,
    Curve,
    Surface,
    Font,
    Meta,
    Other,
    ObjectType_COUNT
};

const char* toString(ObjectType type);

// Object kinds that carry mesh-like geometry and can be turned into a mesh
bool isGeometryBearing(ObjectType type);

// Object kinds the FBX writer handles; parentless objects of these kinds are hierarchy roots
bool isExportable(ObjectType type);
