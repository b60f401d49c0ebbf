#pragma once

#include <istream>
#include <ostream>
#include <string>

class Scene;
class CollectionNode;

// Binary image of the complete mutable scene state: object transforms, flags,
// selection, types, modifier stacks, geometry (with sharing), collections and
// view-layer flags. Checkpoints store it gzip compressed.
class SceneSnapshot {
public:
    static std::string serialize(const Scene &scene);
    static void deserialize(Scene &scene, std::istream &input);

    static std::string capture(const Scene &scene);
    static void restore(Scene &scene, const std::string &compressed);

private:
    static void writeNode(std::ostream &output, const CollectionNode &node);
    static void readNode(std::istream &input, CollectionNode &node);
};
