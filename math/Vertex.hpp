#pragma once
#include <glm/glm.hpp>
#include <bit>
#include <cstdint>
#include <functional>

inline uint64_t murmurMix(uint64_t k) {
	k ^= k >> 33;
	k *= 0xff51afd7ed558ccdULL;
	k ^= k >> 33;
	k *= 0xc4ceb9fe1a85ec53ULL;
	k ^= k >> 33;
	return k;
}

inline uint64_t hashCombine(uint64_t h, uint64_t v) {
	return h ^ murmurMix(v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

inline uint64_t pack2(float a, float b) {
	struct Pair { float x; float y; };
	static_assert(sizeof(Pair) == sizeof(uint64_t));
	return std::bit_cast<uint64_t>(Pair{a, b});
}

// Mesh vertex as stored in geometry data blocks. Positions are in object space.
struct Vertex {
public:
    glm::vec3 position;
    glm::vec3 normal;

    Vertex() : position(glm::vec3(0.0f)), normal(glm::vec3(0.0f, 0.0f, 1.0f)) {}

    Vertex(glm::vec3 pos) : position(pos), normal(glm::vec3(0.0f, 0.0f, 1.0f)) {}

    Vertex(glm::vec3 pos, glm::vec3 normal) : position(pos), normal(normal) {}

    bool operator==(const Vertex& o) const {
        return std::bit_cast<uint64_t>(pack2(position.x, position.y)) == std::bit_cast<uint64_t>(pack2(o.position.x, o.position.y)) &&
               std::bit_cast<uint32_t>(position.z) == std::bit_cast<uint32_t>(o.position.z) &&

               std::bit_cast<uint64_t>(pack2(normal.x, normal.y)) == std::bit_cast<uint64_t>(pack2(o.normal.x, o.normal.y)) &&
               std::bit_cast<uint32_t>(normal.z) == std::bit_cast<uint32_t>(o.normal.z);
    }

    bool operator!=(const Vertex& other) const {
        return !(*this == other);
    }
};

namespace std {

template<> struct hash<glm::vec3> {
    uint64_t operator()(const glm::vec3& v) const noexcept {
        uint64_t h = 0;
        h = hashCombine(h, pack2(v.x, v.y));
        uint64_t zbits = std::bit_cast<uint32_t>(v.z);
        h = hashCombine(h, zbits);
        return h;
    }
};

} // namespace std
