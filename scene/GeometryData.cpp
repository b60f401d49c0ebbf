#include "GeometryData.hpp"

GeometryData::GeometryData(const std::string &name, const Geometry &geometry)
    : name(name), geometry(geometry) {}

std::shared_ptr<GeometryData> GeometryData::copy(const std::string &copyName) const {
    return std::make_shared<GeometryData>(copyName, geometry);
}
