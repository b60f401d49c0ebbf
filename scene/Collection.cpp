#include "Collection.hpp"
#include <algorithm>

void Collection::link(SceneObject * object) {
    if (!contains(object)) {
        objects.push_back(object);
    }
}

bool Collection::contains(const SceneObject * object) const {
    return std::find(objects.begin(), objects.end(), object) != objects.end();
}
