#pragma once

#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "ExportParameters.hpp"
#include "../math/Geometry.hpp"
#include "../scene/ObjectType.hpp"

#define ARCHIVE_MAGIC 0x50584246u
#define ARCHIVE_VERSION 1u

struct ArchivedObject {
    std::string name;
    ObjectType type;
    std::string parentName;
    glm::mat4 worldTransform;
    Geometry geometry;
};

// gzip-compressed binary file holding the exported objects with their world
// transforms and evaluated geometry
class SceneArchive {
public:
    bool useMeshModifiers;
    bool addLeafBones;
    bool useArmatureDeformOnly;
    MeshSmoothType meshSmoothType;
    ApplyScaleOptions applyScaleOptions;
    std::vector<ArchivedObject> objects;

    SceneArchive();

    const ArchivedObject * find(const std::string &name) const;

    // Creates the containing directory when missing. Throws std::runtime_error
    // when the file cannot be written.
    void save(const std::string &filePath) const;
    static SceneArchive load(const std::string &filePath);
};
