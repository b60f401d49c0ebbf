#include "GeometryOwnershipResolver.hpp"
#include <iostream>

GeometryOwnershipResolver::GeometryOwnershipResolver(SceneHost &host, StateLedger &ledger)
    : host(host), ledger(ledger) {

}

int GeometryOwnershipResolver::countActiveModifiers(const GeometryData &data) {
    int count = 0;
    for (SceneObject * user : host.getObjects()) {
        if (user->getGeometry().get() == &data) {
            count += user->countActiveModifiers();
        }
    }
    return count;
}

int GeometryOwnershipResolver::resolve() {
    int copies = 0;
    for (SceneObject * object : host.getObjects()) {
        GeometryDataPtr data = object->getGeometry();
        if (!data) {
            continue;
        }
        // users are recounted per object: the last sharer ends up alone on the
        // original block and is left untouched
        if (host.countGeometryUsers(*data) <= 1) {
            continue;
        }
        // every kind gets its own copy, only mesh-like kinds are relinked afterwards
        if (isGeometryBearing(object->getType()) && countActiveModifiers(*data) == 0) {
            ledger.recordSharedGeometry(object->getName(), data);
        }
        object->setGeometry(host.copyGeometry(*data));
        ++copies;
    }
    std::cout << "GeometryOwnershipResolver::resolve Ok! copies=" << copies
              << ", restorable=" << ledger.getSharedGeometry().size() << std::endl;
    return copies;
}
