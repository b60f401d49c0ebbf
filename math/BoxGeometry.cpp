#include "BoxGeometry.hpp"

BoxGeometry::BoxGeometry(glm::vec3 min, glm::vec3 max) : Geometry() {
    // Cube corners (right-handed system)
    glm::vec3 corners[8] = {
        {min.x, min.y, min.z}, // 0
        {max.x, min.y, min.z}, // 1
        {max.x, max.y, min.z}, // 2
        {min.x, max.y, min.z}, // 3
        {min.x, min.y, max.z}, // 4
        {max.x, min.y, max.z}, // 5
        {max.x, max.y, max.z}, // 6
        {min.x, max.y, max.z}  // 7
    };

    struct Face {
        int a, b, c, d;
        glm::vec3 n;
    };

    Face faces[6] = {
        {4, 5, 6, 7, { 0,  0,  1}},   // top (+Z)
        {1, 0, 3, 2, { 0,  0, -1}},   // bottom (-Z)
        {0, 4, 7, 3, {-1,  0,  0}},   // left (-X)
        {5, 1, 2, 6, { 1,  0,  0}},   // right (+X)
        {3, 7, 6, 2, { 0,  1,  0}},   // back (+Y)
        {0, 1, 5, 4, { 0, -1,  0}}    // front (-Y)
    };

    for (auto &f : faces) {
        addTriangle(Vertex(corners[f.a], f.n), Vertex(corners[f.b], f.n), Vertex(corners[f.c], f.n));
        addTriangle(Vertex(corners[f.a], f.n), Vertex(corners[f.c], f.n), Vertex(corners[f.d], f.n));
    }
}
