#pragma once

#include <vector>
#include "SceneExporter.hpp"
#include "SceneArchive.hpp"

// Export primitive writing a SceneArchive. Used wherever no FBX writer is linked.
class SceneArchiveExporter : public SceneExporter {
public:
    SceneArchiveExporter() = default;

    void exportScene(SceneHost &host, const ExportParameters &parameters) override;

    // Objects passing the selection, active collection and type filters, in scene order
    static std::vector<SceneObject*> collectObjects(SceneHost &host, const ExportParameters &parameters);

    static SceneArchive buildArchive(SceneHost &host, const ExportParameters &parameters);

private:
    static void collectLinked(const CollectionNode &node, std::vector<const Collection*> &collections);
};
