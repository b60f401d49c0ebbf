#ifndef BOX_GEOMETRY_HPP
#define BOX_GEOMETRY_HPP

#include "Geometry.hpp"

// Axis aligned box made of 12 triangles with flat per-face normals
class BoxGeometry : public Geometry {
public:
    BoxGeometry(glm::vec3 min, glm::vec3 max);
};

#endif
