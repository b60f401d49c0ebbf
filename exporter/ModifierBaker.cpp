#include "ModifierBaker.hpp"
#include <iostream>

ModifierBaker::ModifierBaker(SceneHost &host) : host(host) {

}

bool ModifierBaker::bake() {
    host.deselectAll();
    int selected = 0;
    for (SceneObject * object : host.getObjects()) {
        if (!host.isInViewLayer(*object) || object->hasModifier(ModifierType::Armature)) {
            continue;
        }
        if (!host.isVisible(*object)) {
            std::cerr << "ModifierBaker: '" << object->getName() << "' is not visible, skipped" << std::endl;
            continue;
        }
        host.select(*object);
        ++selected;
    }
    if (!host.canConvertToMesh()) {
        std::cout << "ModifierBaker::bake nothing to convert, selected=" << selected << std::endl;
        return false;
    }
    host.convertToMesh();
    std::cout << "ModifierBaker::bake Ok! selected=" << selected << std::endl;
    return true;
}
