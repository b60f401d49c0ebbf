#include "Modifier.hpp"

const char* toString(ModifierType type) {
    switch (type) {
        case ModifierType::Armature: return "ARMATURE";
        case ModifierType::Mirror: return "MIRROR";
        case ModifierType::Displace: return "DISPLACE";
        case ModifierType::Other: return "OTHER";
        default: return "UNKNOWN";
    }
}

Modifier::Modifier()
    : name(), type(ModifierType::Other), showViewport(true), strength(0.0f) {}

Modifier::Modifier(const std::string &name, ModifierType type, bool showViewport, float strength)
    : name(name), type(type), showViewport(showViewport), strength(strength) {}

void Modifier::evaluate(Geometry &geometry) const {
    switch (type) {
        case ModifierType::Mirror:
            geometry.mirror(0);
            break;
        case ModifierType::Displace:
            geometry.displace(strength);
            break;
        default:
            break;
    }
}
