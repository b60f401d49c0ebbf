#pragma once

#include <string>
#include <vector>

class SceneObject;

// Grouping of objects. hideViewport disables the collection in every view layer.
struct Collection {
    std::string name;
    bool hideViewport;
    std::vector<SceneObject*> objects;

    Collection(const std::string &name) : name(name), hideViewport(false), objects() {}

    void link(SceneObject * object);
    bool contains(const SceneObject * object) const;
};
