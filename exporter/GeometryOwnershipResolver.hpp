#pragma once

#include "StateLedger.hpp"
#include "../scene/SceneHost.hpp"

// Gives every geometry-bearing object that shares its geometry block a private
// copy, so transforms can be applied per object. Objects whose sharers carry no
// active modifier are recorded for relinking to the shared block afterwards.
class GeometryOwnershipResolver {
public:
    GeometryOwnershipResolver(SceneHost &host, StateLedger &ledger);

    // Returns the number of copies made
    int resolve();

    // Sum of viewport-active modifiers over all objects referencing data
    int countActiveModifiers(const GeometryData &data);

private:
    SceneHost &host;
    StateLedger &ledger;
};
