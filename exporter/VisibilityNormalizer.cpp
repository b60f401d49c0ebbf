#include "VisibilityNormalizer.hpp"

VisibilityNormalizer::VisibilityNormalizer(StateLedger &ledger) : ledger(ledger) {

}

int VisibilityNormalizer::normalizeCollections(CollectionNode &node) {
    if (node.isExcluded()) {
        return 0;
    }
    int count = 0;
    for (const std::unique_ptr<CollectionNode> &child : node.getChildren()) {
        if (child->isExcluded()) {
            continue;
        }
        if (child->isHideViewport()) {
            child->setHideViewport(false);
            ledger.recordHiddenCollection(child.get());
            ++count;
        }
        Collection * collection = child->getCollection();
        if (collection->hideViewport) {
            collection->hideViewport = false;
            ledger.recordDisabledCollection(child.get());
            ++count;
        }
        count += normalizeCollections(*child);
    }
    return count;
}

int VisibilityNormalizer::normalizeObjects(SceneHost &host) {
    int count = 0;
    for (SceneObject * object : host.getObjects()) {
        if (!host.isInViewLayer(*object)) {
            continue;
        }
        if (object->isHidden()) {
            object->setHidden(false);
            ledger.recordHiddenObject(object);
            ++count;
        }
        if (object->isDisabled()) {
            object->setDisabled(false);
            ledger.recordDisabledObject(object);
            ++count;
        }
    }
    return count;
}
