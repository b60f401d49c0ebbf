#include "Geometry.hpp"
#include <glm/glm.hpp>
#include <glm/matrix.hpp>
#include <cstddef>
#include <utility>

Geometry::Geometry() {
}

Geometry::~Geometry() {
}

void Geometry::addTriangle(const Vertex &v0, const Vertex &v1, const Vertex &v2) {
    // Winding order is kept as given by the caller (v0, v1, v2).
    addVertex(v0);
    addVertex(v1);
    addVertex(v2);
}

void Geometry::addVertex(const Vertex &vertex) {
    auto [it, inserted] = compactMap.try_emplace(vertex, vertices.size());
    size_t idx = it->second;

    if (inserted) {
        vertices.push_back(vertex);
    }
    indices.push_back(idx);
}

glm::vec3 Geometry::getNormal(const Vertex &a, const Vertex &b, const Vertex &c) {
    glm::vec3 v1 = b.position - a.position;
    glm::vec3 v2 = c.position - a.position;
    return glm::normalize(glm::cross(v1, v2));
}

void Geometry::transform(const glm::mat3 &linear) {
    float det = glm::determinant(linear);
    glm::mat3 normalMatrix = glm::abs(det) > 1e-12f ? glm::transpose(glm::inverse(linear)) : linear;

    for (Vertex &vertex : vertices) {
        vertex.position = linear * vertex.position;
        glm::vec3 n = normalMatrix * vertex.normal;
        float l2 = glm::dot(n, n);
        vertex.normal = l2 > 1e-12f ? glm::normalize(n) : vertex.normal;
    }
    if (det < 0.0f) {
        flipWinding();
    }
    rebuildCompactMap();
}

void Geometry::mirror(int axis) {
    size_t offset = vertices.size();
    size_t count = indices.size();

    for (size_t i = 0; i < offset; ++i) {
        Vertex v = vertices[i];
        v.position[axis] = -v.position[axis];
        v.normal[axis] = -v.normal[axis];
        vertices.push_back(v);
    }
    // Mirrored triangles keep facing outwards only with reversed winding
    for (size_t i = 0; i + 2 < count; i += 3) {
        indices.push_back(indices[i + 0] + offset);
        indices.push_back(indices[i + 2] + offset);
        indices.push_back(indices[i + 1] + offset);
    }
    rebuildCompactMap();
}

void Geometry::displace(float strength) {
    for (Vertex &vertex : vertices) {
        vertex.position += vertex.normal * strength;
    }
    rebuildCompactMap();
}

void Geometry::flipWinding() {
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        std::swap(indices[i + 1], indices[i + 2]);
    }
}

size_t Geometry::triangleCount() const {
    return indices.size() / 3;
}

bool Geometry::empty() const {
    return vertices.empty();
}

void Geometry::rebuildCompactMap() {
    compactMap.clear();
    for (size_t i = 0; i < vertices.size(); ++i) {
        compactMap.try_emplace(vertices[i], i);
    }
}
