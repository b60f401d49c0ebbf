#pragma once

#include <string>
#include <glm/glm.hpp>
#include "Event.hpp"
#include "../exporter/ExportResult.hpp"

// Published before the scene is touched
class ExportStartedEvent : public Event {
public:
    std::string filepath;

    ExportStartedEvent(const std::string &filepath) : filepath(filepath) {}

    std::string name() const override { return "ExportStartedEvent"; }
    std::string describe() const override { return "export started: " + filepath; }
};

// Published for every object the transform rebaser processed
class ObjectRebasedEvent : public Event {
public:
    std::string objectName;
    int depth;
    glm::mat4 localTransform;

    ObjectRebasedEvent(const std::string &objectName, int depth, const glm::mat4 &localTransform)
        : objectName(objectName), depth(depth), localTransform(localTransform) {}

    std::string name() const override { return "ObjectRebasedEvent"; }
    std::string describe() const override {
        return std::string(depth * 2, ' ') + "rebased '" + objectName + "' depth=" + std::to_string(depth);
    }
};

// Published once the export attempt is over
class ExportFinishedEvent : public Event {
public:
    ExportResult result;

    ExportFinishedEvent(const ExportResult &result) : result(result) {}

    std::string name() const override { return "ExportFinishedEvent"; }
    std::string describe() const override { return result.toString(); }
};
