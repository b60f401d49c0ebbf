#include "SceneArchive.hpp"
#include "../math/Math.hpp"
#include "../utils/BinaryStream.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

SceneArchive::SceneArchive()
    : useMeshModifiers(true), addLeafBones(false), useArmatureDeformOnly(true),
      meshSmoothType(MeshSmoothType::Edge), applyScaleOptions(ApplyScaleOptions::FbxScaleUnits), objects() {

}

const ArchivedObject * SceneArchive::find(const std::string &name) const {
    for (const ArchivedObject &object : objects) {
        if (object.name == name) {
            return &object;
        }
    }
    return NULL;
}

void SceneArchive::save(const std::string &filePath) const {
    std::stringstream data;
    writeUInt32(data, ARCHIVE_MAGIC);
    writeUInt32(data, ARCHIVE_VERSION);
    uint32_t flags = (useMeshModifiers ? 1u : 0u) | (addLeafBones ? 2u : 0u) | (useArmatureDeformOnly ? 4u : 0u);
    writeUInt32(data, flags);
    writeInt32(data, static_cast<int32_t>(meshSmoothType));
    writeInt32(data, static_cast<int32_t>(applyScaleOptions));

    writeUInt32(data, static_cast<uint32_t>(objects.size()));
    for (const ArchivedObject &object : objects) {
        writeString(data, object.name);
        writeInt32(data, static_cast<int32_t>(object.type));
        writeString(data, object.parentName);
        writeMatrix(data, object.worldTransform);
        writeUInt64(data, object.geometry.vertices.size());
        for (const Vertex &vertex : object.geometry.vertices) {
            writeVec3(data, vertex.position);
            writeVec3(data, vertex.normal);
        }
        writeUInt64(data, object.geometry.indices.size());
        for (uint index : object.geometry.indices) {
            writeUInt32(data, index);
        }
    }

    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        ensureFolderExists(path.parent_path().string());
    }
    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot open '" + filePath + "' for writing");
    }
    gzipCompress(data, file);
    file.close();
    if (!file) {
        throw std::runtime_error("Failed writing '" + filePath + "'");
    }
}

SceneArchive SceneArchive::load(const std::string &filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open '" + filePath + "'");
    }
    std::stringstream data = gzipDecompress(file);

    SceneArchive archive;
    if (readUInt32(data) != ARCHIVE_MAGIC) {
        throw std::runtime_error("'" + filePath + "' is not a scene archive");
    }
    uint32_t version = readUInt32(data);
    if (version != ARCHIVE_VERSION) {
        throw std::runtime_error("Unsupported scene archive version " + std::to_string(version));
    }
    uint32_t flags = readUInt32(data);
    archive.useMeshModifiers = (flags & 1u) != 0;
    archive.addLeafBones = (flags & 2u) != 0;
    archive.useArmatureDeformOnly = (flags & 4u) != 0;
    archive.meshSmoothType = static_cast<MeshSmoothType>(readInt32(data));
    archive.applyScaleOptions = static_cast<ApplyScaleOptions>(readInt32(data));

    uint32_t objectCount = readUInt32(data);
    for (uint32_t i = 0; i < objectCount; ++i) {
        ArchivedObject object;
        object.name = readString(data);
        object.type = static_cast<ObjectType>(readInt32(data));
        object.parentName = readString(data);
        object.worldTransform = readMatrix(data);
        uint64_t vertexCount = readUInt64(data);
        for (uint64_t j = 0; j < vertexCount; ++j) {
            Vertex vertex;
            vertex.position = readVec3(data);
            vertex.normal = readVec3(data);
            object.geometry.vertices.push_back(vertex);
        }
        uint64_t indexCount = readUInt64(data);
        for (uint64_t j = 0; j < indexCount; ++j) {
            object.geometry.indices.push_back(readUInt32(data));
        }
        archive.objects.push_back(object);
    }
    std::cout << "SceneArchive::load('" << filePath << "') Ok! objects=" << objectCount << std::endl;
    return archive;
}
