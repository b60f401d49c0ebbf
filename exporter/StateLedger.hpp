#pragma once

#include <string>
#include <vector>
#include <tsl/robin_map.h>
#include "../scene/SceneHost.hpp"

// Record of every flag and geometry binding one export run changed, so the run
// can put them back. Entries are only added for values the run actually
// changed; restoring drains the ledger.
class StateLedger {
public:
    StateLedger() = default;
    ~StateLedger() = default;

    // Starts a new run. A ledger still holding entries belongs to an unfinished
    // run and refuses to start another one.
    void begin();
    bool empty() const;
    size_t size() const;

    void recordSharedGeometry(const std::string &objectName, const GeometryDataPtr &data);
    void recordHiddenObject(SceneObject * object);
    void recordDisabledObject(SceneObject * object);
    void recordHiddenCollection(CollectionNode * node);
    void recordDisabledCollection(CollectionNode * node);

    // Relinks every recorded object to the geometry block it shared before the run
    void restoreSharedGeometry(SceneHost &host);

    // Puts back every hidden / disabled flag forced off during the run
    void restoreVisibility();

    const tsl::robin_map<std::string, GeometryDataPtr> &getSharedGeometry() const { return sharedGeometry; }
    const std::vector<SceneObject*> &getHiddenObjects() const { return hiddenObjects; }
    const std::vector<SceneObject*> &getDisabledObjects() const { return disabledObjects; }
    const std::vector<CollectionNode*> &getHiddenCollections() const { return hiddenCollections; }
    const std::vector<CollectionNode*> &getDisabledCollections() const { return disabledCollections; }

private:
    tsl::robin_map<std::string, GeometryDataPtr> sharedGeometry;
    std::vector<SceneObject*> hiddenObjects;
    std::vector<SceneObject*> disabledObjects;
    std::vector<CollectionNode*> hiddenCollections;
    std::vector<CollectionNode*> disabledCollections;
};
