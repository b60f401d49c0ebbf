#pragma once

#include <algorithm>
#include <string>
#include <vector>
#include "../scene/ObjectType.hpp"

enum class MeshSmoothType { Off, Face, Edge };

enum class ApplyScaleOptions { FbxScaleNone, FbxScaleUnits, FbxScaleCustom, FbxScaleAll };

// Options handed to the export primitive for one output file
struct ExportParameters {
    std::string filepath;
    bool useSelection = true;
    bool useActiveCollection = false;
    std::vector<ObjectType> objectTypes = { ObjectType::Empty, ObjectType::Armature, ObjectType::Mesh, ObjectType::Other };
    ApplyScaleOptions applyScaleOptions = ApplyScaleOptions::FbxScaleUnits;
    bool useMeshModifiers = true;
    bool addLeafBones = false;
    bool useArmatureDeformOnly = true;
    MeshSmoothType meshSmoothType = MeshSmoothType::Edge;

    bool acceptsType(ObjectType type) const {
        return std::find(objectTypes.begin(), objectTypes.end(), type) != objectTypes.end();
    }
};
