#pragma once

#include <string>
#include "ExportParameters.hpp"

#define FBX_FILE_EXTENSION ".fbx"

// User options of one export run plus the writer options the tool pins
class ExportSettings {
public:
    ExportSettings() { resetToDefaults(); }

    void resetToDefaults() {
        filepath.clear();
        activeCollectionOnly = false;
        selectedObjectsOnly = true;
        moveToOrigin = false;
        exportIndividualFiles = false;
        fixAxisRotation = false;
        revertSceneAfterExport = true;
        writer = ExportParameters();
    }

    std::string filepath;

    // Export objects of the active collection (and its children) only
    bool activeCollectionOnly = false;

    // Export selected objects only. Individual files always use the selection.
    bool selectedObjectsOnly = true;

    // Move root objects to (0, 0, 0)
    bool moveToOrigin = false;

    // One file per selected object, named after the object, in the directory of filepath
    bool exportIndividualFiles = false;

    // Bake a -90 degree X rotation into the geometry for Y-up targets
    bool fixAxisRotation = false;

    // Roll the scene back to its pre-export state once the file is written.
    // When off the preparation checkpoint stays on the stack for the caller.
    bool revertSceneAfterExport = true;

    // Writer options; filepath, useSelection and useActiveCollection are filled per file
    ExportParameters writer;
};
