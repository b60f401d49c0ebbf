#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <glm/glm.hpp>

// Little helpers for the native-endian binary formats written by this tool

inline void writeRaw(std::ostream &out, const void * data, size_t size) {
    out.write(reinterpret_cast<const char*>(data), size);
}

inline void writeUInt32(std::ostream &out, uint32_t v) { writeRaw(out, &v, sizeof(v)); }
inline void writeInt32(std::ostream &out, int32_t v) { writeRaw(out, &v, sizeof(v)); }
inline void writeUInt64(std::ostream &out, uint64_t v) { writeRaw(out, &v, sizeof(v)); }
inline void writeFloat(std::ostream &out, float v) { writeRaw(out, &v, sizeof(v)); }
inline void writeBool(std::ostream &out, bool v) { uint8_t b = v ? 1 : 0; writeRaw(out, &b, sizeof(b)); }
inline void writeVec3(std::ostream &out, const glm::vec3 &v) { writeRaw(out, &v[0], sizeof(float) * 3); }
inline void writeMatrix(std::ostream &out, const glm::mat4 &m) { writeRaw(out, &m[0][0], sizeof(float) * 16); }

inline void writeString(std::ostream &out, const std::string &s) {
    writeUInt32(out, static_cast<uint32_t>(s.size()));
    if (!s.empty()) writeRaw(out, s.data(), s.size());
}

// Throws std::runtime_error when the stream ends early
inline void readRaw(std::istream &in, void * data, size_t size) {
    in.read(reinterpret_cast<char*>(data), size);
    if (static_cast<size_t>(in.gcount()) != size) {
        throw std::runtime_error("Unexpected end of stream");
    }
}

inline uint32_t readUInt32(std::istream &in) { uint32_t v; readRaw(in, &v, sizeof(v)); return v; }
inline int32_t readInt32(std::istream &in) { int32_t v; readRaw(in, &v, sizeof(v)); return v; }
inline uint64_t readUInt64(std::istream &in) { uint64_t v; readRaw(in, &v, sizeof(v)); return v; }
inline float readFloat(std::istream &in) { float v; readRaw(in, &v, sizeof(v)); return v; }
inline bool readBool(std::istream &in) { uint8_t b; readRaw(in, &b, sizeof(b)); return b != 0; }
inline glm::vec3 readVec3(std::istream &in) { glm::vec3 v; readRaw(in, &v[0], sizeof(float) * 3); return v; }
inline glm::mat4 readMatrix(std::istream &in) { glm::mat4 m; readRaw(in, &m[0][0], sizeof(float) * 16); return m; }

inline std::string readString(std::istream &in) {
    uint32_t size = readUInt32(in);
    std::string s(size, '\0');
    if (size > 0) readRaw(in, s.data(), size);
    return s;
}
