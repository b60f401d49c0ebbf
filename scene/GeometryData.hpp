#pragma once

#include <memory>
#include <string>
#include "../math/Geometry.hpp"

// Geometry block referenced by one or more scene objects. The block lives as long
// as one object (or a pending restore) still references it.
class GeometryData {
public:
    std::string name;
    Geometry geometry;

    GeometryData(const std::string &name, const Geometry &geometry);
    ~GeometryData() = default;

    std::shared_ptr<GeometryData> copy(const std::string &copyName) const;
};

using GeometryDataPtr = std::shared_ptr<GeometryData>;
