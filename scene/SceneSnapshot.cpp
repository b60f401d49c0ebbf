#include "SceneSnapshot.hpp"
#include "Scene.hpp"
#include "../math/Math.hpp"
#include "../utils/BinaryStream.hpp"
#include <algorithm>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

#define SNAPSHOT_MAGIC 0x50414E53u
#define SNAPSHOT_VERSION 2u

namespace {

    struct ObjectRecord {
        SceneObject * object;
        ObjectType type;
        glm::mat4 local;
        glm::mat4 parentInverse;
        glm::mat4 world;
        int32_t geometryIndex;
        bool hidden;
        bool disabled;
        bool selected;
        std::vector<Modifier> modifiers;
        std::vector<SceneObject*> children;
    };

}

void SceneSnapshot::writeNode(std::ostream &output, const CollectionNode &node) {
    writeString(output, node.getName());
    writeBool(output, node.isExcluded());
    writeBool(output, node.isHideViewport());
    writeUInt32(output, static_cast<uint32_t>(node.getChildren().size()));
    for (const auto &child : node.getChildren()) {
        writeNode(output, *child);
    }
}

void SceneSnapshot::readNode(std::istream &input, CollectionNode &node) {
    std::string name = readString(input);
    if (name != node.getName()) {
        throw std::runtime_error("Scene snapshot does not match the view layer: expected '" + node.getName() + "', found '" + name + "'");
    }
    node.setExcluded(readBool(input));
    node.setHideViewport(readBool(input));
    uint32_t childCount = readUInt32(input);
    if (childCount != node.getChildren().size()) {
        throw std::runtime_error("Scene snapshot does not match the children of '" + name + "'");
    }
    for (const auto &child : node.getChildren()) {
        readNode(input, *child);
    }
}

std::string SceneSnapshot::serialize(const Scene &scene) {
    std::ostringstream output(std::ios::binary);
    writeUInt32(output, SNAPSHOT_MAGIC);
    writeUInt32(output, SNAPSHOT_VERSION);
    writeString(output, scene.activeCollection != NULL ? scene.activeCollection->getName() : std::string());

    writeUInt32(output, static_cast<uint32_t>(scene.collections.size()));
    for (const auto &collection : scene.collections) {
        writeString(output, collection->name);
        writeBool(output, collection->hideViewport);
        writeUInt32(output, static_cast<uint32_t>(collection->objects.size()));
        for (const SceneObject * object : collection->objects) {
            writeString(output, object->getName());
        }
    }

    writeNode(output, *scene.viewLayerRoot);

    // Geometry table, one entry per distinct block so sharing survives a restore
    std::vector<const GeometryData*> blocks;
    tsl::robin_map<const GeometryData*, int32_t> blockIndex;
    for (const auto &object : scene.objects) {
        const GeometryData * data = object->getGeometry().get();
        if (data != NULL && blockIndex.find(data) == blockIndex.end()) {
            blockIndex[data] = static_cast<int32_t>(blocks.size());
            blocks.push_back(data);
        }
    }
    writeUInt32(output, static_cast<uint32_t>(blocks.size()));
    for (const GeometryData * data : blocks) {
        writeString(output, data->name);
        const Geometry &geometry = data->geometry;
        writeUInt64(output, geometry.vertices.size());
        for (const Vertex &vertex : geometry.vertices) {
            writeVec3(output, vertex.position);
            writeVec3(output, vertex.normal);
        }
        writeUInt64(output, geometry.indices.size());
        for (uint index : geometry.indices) {
            writeUInt32(output, index);
        }
    }

    writeUInt32(output, static_cast<uint32_t>(scene.objects.size()));
    for (const auto &object : scene.objects) {
        writeString(output, object->getName());
        writeInt32(output, static_cast<int32_t>(object->getType()));
        writeMatrix(output, object->getLocalTransform());
        writeMatrix(output, object->getParentInverse());
        writeMatrix(output, object->getWorldTransform());
        const GeometryData * data = object->getGeometry().get();
        writeInt32(output, data != NULL ? blockIndex[data] : -1);
        writeBool(output, object->isHidden());
        writeBool(output, object->isDisabled());
        writeBool(output, object->isSelected());
        writeUInt32(output, static_cast<uint32_t>(object->getModifiers().size()));
        for (const Modifier &modifier : object->getModifiers()) {
            writeString(output, modifier.name);
            writeInt32(output, static_cast<int32_t>(modifier.type));
            writeBool(output, modifier.showViewport);
            writeFloat(output, modifier.strength);
        }
        writeUInt32(output, static_cast<uint32_t>(object->getChildren().size()));
        for (const SceneObject * child : object->getChildren()) {
            writeString(output, child->getName());
        }
    }
    writeBool(output, scene.editMode);

    std::vector<std::pair<std::string, int>> counters(scene.geometryNameCounters.begin(), scene.geometryNameCounters.end());
    std::sort(counters.begin(), counters.end());
    writeUInt32(output, static_cast<uint32_t>(counters.size()));
    for (const auto &entry : counters) {
        writeString(output, entry.first);
        writeInt32(output, entry.second);
    }
    return output.str();
}

void SceneSnapshot::deserialize(Scene &scene, std::istream &input) {
    if (readUInt32(input) != SNAPSHOT_MAGIC) {
        throw std::runtime_error("Not a scene snapshot");
    }
    uint32_t version = readUInt32(input);
    if (version != SNAPSHOT_VERSION) {
        throw std::runtime_error("Unsupported scene snapshot version " + std::to_string(version));
    }

    auto requireObject = [&scene](const std::string &name) {
        SceneObject * object = scene.findObject(name);
        if (object == NULL) {
            throw std::runtime_error("Scene snapshot references unknown object '" + name + "'");
        }
        return object;
    };

    std::string activeName = readString(input);

    uint32_t collectionCount = readUInt32(input);
    for (uint32_t i = 0; i < collectionCount; ++i) {
        std::string name = readString(input);
        Collection * collection = NULL;
        for (auto &candidate : scene.collections) {
            if (candidate->name == name) {
                collection = candidate.get();
                break;
            }
        }
        if (collection == NULL) {
            throw std::runtime_error("Scene snapshot references unknown collection '" + name + "'");
        }
        collection->hideViewport = readBool(input);
        uint32_t objectCount = readUInt32(input);
        collection->objects.clear();
        for (uint32_t j = 0; j < objectCount; ++j) {
            collection->objects.push_back(requireObject(readString(input)));
        }
    }

    readNode(input, *scene.viewLayerRoot);
    CollectionNode * active = scene.viewLayerRoot->find(activeName);
    scene.activeCollection = active != NULL ? active : scene.viewLayerRoot.get();

    uint32_t blockCount = readUInt32(input);
    std::vector<GeometryDataPtr> blocks;
    blocks.reserve(blockCount);
    for (uint32_t i = 0; i < blockCount; ++i) {
        std::string name = readString(input);
        Geometry geometry;
        uint64_t vertexCount = readUInt64(input);
        for (uint64_t j = 0; j < vertexCount; ++j) {
            Vertex vertex;
            vertex.position = readVec3(input);
            vertex.normal = readVec3(input);
            geometry.vertices.push_back(vertex);
            geometry.compactMap.try_emplace(vertex, j);
        }
        uint64_t indexCount = readUInt64(input);
        for (uint64_t j = 0; j < indexCount; ++j) {
            geometry.indices.push_back(readUInt32(input));
        }
        blocks.push_back(std::make_shared<GeometryData>(name, geometry));
    }

    uint32_t objectCount = readUInt32(input);
    if (objectCount != scene.objects.size()) {
        throw std::runtime_error("Scene snapshot object count does not match the scene");
    }
    std::vector<ObjectRecord> records(objectCount);
    for (ObjectRecord &record : records) {
        record.object = requireObject(readString(input));
        int32_t type = readInt32(input);
        if (type < 0 || type >= static_cast<int32_t>(ObjectType::ObjectType_COUNT)) {
            throw std::runtime_error("Scene snapshot object type out of range");
        }
        record.type = static_cast<ObjectType>(type);
        record.local = readMatrix(input);
        record.parentInverse = readMatrix(input);
        record.world = readMatrix(input);
        record.geometryIndex = readInt32(input);
        if (record.geometryIndex >= static_cast<int32_t>(blocks.size())) {
            throw std::runtime_error("Scene snapshot geometry index out of range");
        }
        record.hidden = readBool(input);
        record.disabled = readBool(input);
        record.selected = readBool(input);
        uint32_t modifierCount = readUInt32(input);
        for (uint32_t j = 0; j < modifierCount; ++j) {
            Modifier modifier;
            modifier.name = readString(input);
            int32_t modifierType = readInt32(input);
            if (modifierType < 0 || modifierType > static_cast<int32_t>(ModifierType::Other)) {
                throw std::runtime_error("Scene snapshot modifier type out of range");
            }
            modifier.type = static_cast<ModifierType>(modifierType);
            modifier.showViewport = readBool(input);
            modifier.strength = readFloat(input);
            record.modifiers.push_back(modifier);
        }
        uint32_t childCount = readUInt32(input);
        for (uint32_t j = 0; j < childCount; ++j) {
            record.children.push_back(requireObject(readString(input)));
        }
    }
    bool editMode = readBool(input);

    tsl::robin_map<std::string, int> counters;
    uint32_t counterCount = readUInt32(input);
    for (uint32_t i = 0; i < counterCount; ++i) {
        std::string stem = readString(input);
        counters[stem] = readInt32(input);
    }

    // Everything is read; only now touch the objects
    scene.editMode = editMode;
    scene.geometryNameCounters = counters;
    for (ObjectRecord &record : records) {
        record.object->setParent(NULL);
    }
    for (ObjectRecord &record : records) {
        SceneObject * object = record.object;
        object->setType(record.type);
        object->setLocalTransform(record.local);
        object->setParentInverse(record.parentInverse);
        object->setWorldTransform(record.world);
        object->setGeometry(record.geometryIndex >= 0 ? blocks[record.geometryIndex] : GeometryDataPtr());
        object->setHidden(record.hidden);
        object->setDisabled(record.disabled);
        object->setSelected(record.selected);
        object->getModifiers() = record.modifiers;
        for (SceneObject * child : record.children) {
            child->setParent(object);
        }
    }
}

std::string SceneSnapshot::capture(const Scene &scene) {
    std::istringstream raw(serialize(scene), std::ios::binary);
    std::ostringstream compressed(std::ios::binary);
    gzipCompress(raw, compressed);
    return compressed.str();
}

void SceneSnapshot::restore(Scene &scene, const std::string &compressed) {
    std::istringstream input(compressed, std::ios::binary);
    std::stringstream raw = gzipDecompress(input);
    deserialize(scene, raw);
}
