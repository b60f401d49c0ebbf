#pragma once

#include "StateLedger.hpp"
#include "../scene/SceneHost.hpp"

// Forces every non-excluded collection and every in-view object visible,
// recording each flag it flips in the ledger.
class VisibilityNormalizer {
public:
    VisibilityNormalizer(StateLedger &ledger);

    // Walks the view-layer tree from node. Excluded branches are left untouched
    // and not descended. Returns the number of flags cleared.
    int normalizeCollections(CollectionNode &node);

    // Clears hidden / disabled on objects reachable through the view layer
    int normalizeObjects(SceneHost &host);

private:
    StateLedger &ledger;
};
