#include "ObjectType.hpp"

const char* toString(ObjectType type) {
    switch (type) {
        case ObjectType::Empty: return "EMPTY";
        case ObjectType::Mesh: return "MESH";
        case ObjectType::Armature: return "ARMATURE";
        case ObjectType::Curve: return "CURVE";
        case ObjectType::Surface: return "SURFACE";
        case ObjectType::Font: return "FONT";
        case ObjectType::Meta: return "META";
        case ObjectType::Other: return "OTHER";
        default: return "UNKNOWN";
    }
}

bool isGeometryBearing(ObjectType type) {
    switch (type) {
        case ObjectType::Mesh:
        case ObjectType::Curve:
        case ObjectType::Surface:
        case ObjectType::Font:
        case ObjectType::Meta:
            return true;
        default:
            return false;
    }
}

bool isExportable(ObjectType type) {
    return type == ObjectType::Empty || type == ObjectType::Mesh || type == ObjectType::Armature || type == ObjectType::Other;
}
