#include "CollectionNode.hpp"

CollectionNode::CollectionNode(Collection * collection)
    : collection(collection), excluded(false), hideViewport(false), children() {}

CollectionNode &CollectionNode::addChild(Collection * child) {
    children.push_back(std::make_unique<CollectionNode>(child));
    return *children.back();
}

CollectionNode * CollectionNode::find(const std::string &name) {
    if (collection->name == name) {
        return this;
    }
    for (auto &child : children) {
        CollectionNode * found = child->find(name);
        if (found != NULL) {
            return found;
        }
    }
    return NULL;
}
