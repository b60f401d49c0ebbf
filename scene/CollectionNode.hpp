#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Collection.hpp"

// View-layer node wrapping a collection. Carries its own exclude and hide flags,
// independent of the wrapped collection's hideViewport.
class CollectionNode {
public:
    CollectionNode(Collection * collection);
    ~CollectionNode() = default;

    Collection * getCollection() const { return collection; }
    const std::string &getName() const { return collection->name; }

    bool isExcluded() const { return excluded; }
    void setExcluded(bool value) { excluded = value; }

    bool isHideViewport() const { return hideViewport; }
    void setHideViewport(bool value) { hideViewport = value; }

    CollectionNode &addChild(Collection * child);
    const std::vector<std::unique_ptr<CollectionNode>> &getChildren() const { return children; }

    // Depth-first lookup by collection name, this node included
    CollectionNode * find(const std::string &name);

private:
    Collection * collection;
    bool excluded;
    bool hideViewport;
    std::vector<std::unique_ptr<CollectionNode>> children;
};
