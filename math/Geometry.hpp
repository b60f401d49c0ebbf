#pragma once
#include "Vertex.hpp"
#include "VertexHasher.hpp"
#include <vector>
#include <sys/types.h>
#include <glm/glm.hpp>
#include <tsl/robin_map.h>

class Geometry
{

public:
    std::vector<Vertex> vertices;
    std::vector<uint> indices;
    tsl::robin_map<Vertex, size_t, VertexHasher> compactMap;

    Geometry();
    ~Geometry();

    void addVertex(const Vertex &vertex);
    void addTriangle(const Vertex &v0, const Vertex &v1, const Vertex &v2);
    static glm::vec3 getNormal(const Vertex &a, const Vertex &b, const Vertex &c);

    // Multiplies every position by the linear map and every normal by its inverse transpose.
    // Mirroring maps (negative determinant) also reverse the triangle winding.
    void transform(const glm::mat3 &linear);

    // Appends a copy mirrored across the given axis (0=X, 1=Y, 2=Z)
    void mirror(int axis);

    // Moves every vertex along its normal
    void displace(float strength);

    void flipWinding();
    size_t triangleCount() const;
    bool empty() const;

private:
    void rebuildCompactMap();
};
