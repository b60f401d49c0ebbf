#include "Math.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <zlib.h>
#include <cmath>
#include <vector>
#include <filesystem>
#include <stdexcept>

glm::mat4 Math::rotationX(float degrees) {
    return glm::rotate(glm::mat4(1.0f), glm::radians(degrees), glm::vec3(1.0f, 0.0f, 0.0f));
}

glm::mat4 Math::translation(glm::vec3 position) {
    return glm::translate(glm::mat4(1.0f), position);
}

glm::mat4 Math::withTranslation(const glm::mat4 &m, glm::vec3 position) {
    glm::mat4 result = m;
    result[3] = glm::vec4(position, 1.0f);
    return result;
}

glm::vec3 Math::getTranslation(const glm::mat4 &m) {
    return glm::vec3(m[3]);
}

bool Math::isInvertible(const glm::mat4 &m) {
    return std::fabs(glm::determinant(m)) > 1e-12f;
}

bool Math::nearlyEqual(float a, float b, float epsilon) {
    return std::fabs(a - b) <= epsilon;
}

bool Math::nearlyEqual(const glm::vec3 &a, const glm::vec3 &b, float epsilon) {
    return nearlyEqual(a.x, b.x, epsilon) && nearlyEqual(a.y, b.y, epsilon) && nearlyEqual(a.z, b.z, epsilon);
}

bool Math::nearlyEqual(const glm::mat4 &a, const glm::mat4 &b, float epsilon) {
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            if (!nearlyEqual(a[c][r], b[c][r], epsilon)) {
                return false;
            }
        }
    }
    return true;
}

void ensureFolderExists(const std::string& folder) {
    if (!folder.empty() && !std::filesystem::exists(folder)) {
        std::filesystem::create_directories(folder);
    }
}

std::stringstream gzipDecompress(std::istream& input) {
    if (!input) {
        throw std::runtime_error("Failed to read compressed input.");
    }

    z_stream strm = {};
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib for decompression.");
    }

    std::stringstream decompressedStream;
    std::vector<char> inBuffer(1024);
    std::vector<char> outBuffer(1024);

    int ret = 0;
    do {
        input.read(inBuffer.data(), inBuffer.size());
        strm.next_in = reinterpret_cast<Bytef*>(inBuffer.data());
        strm.avail_in = static_cast<uInt>(input.gcount());

        if (strm.avail_in == 0) {
            break;
        }

        do {
            strm.next_out = reinterpret_cast<Bytef*>(outBuffer.data());
            strm.avail_out = outBuffer.size();

            ret = inflate(&strm, Z_NO_FLUSH);

            if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
                inflateEnd(&strm);
                throw std::runtime_error("Decompression failed: inflate() error " + std::to_string(ret));
            }

            decompressedStream.write(outBuffer.data(), outBuffer.size() - strm.avail_out);
        } while (strm.avail_out == 0);

    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("Decompression finished unexpectedly. inflate() error " + std::to_string(ret));
    }

    return decompressedStream;
}

void gzipCompress(std::istream& inputStream, std::ostream& output) {
    if (!output) {
        throw std::runtime_error("Failed to open compressed output.");
    }

    z_stream strm = {};
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib for compression.");
    }

    std::vector<char> inBuffer(1024);
    std::vector<char> outBuffer(1024);

    int ret;
    do {
        inputStream.read(inBuffer.data(), inBuffer.size());
        strm.next_in = reinterpret_cast<Bytef*>(inBuffer.data());
        strm.avail_in = inputStream.gcount();

        int flush = inputStream.eof() ? Z_FINISH : Z_NO_FLUSH;

        do {
            strm.next_out = reinterpret_cast<Bytef*>(outBuffer.data());
            strm.avail_out = outBuffer.size();

            ret = deflate(&strm, flush);

            if (ret < 0 && ret != Z_BUF_ERROR) {
                deflateEnd(&strm);
                throw std::runtime_error("Compression failed: deflate() error " + std::to_string(ret));
            }

            output.write(outBuffer.data(), outBuffer.size() - strm.avail_out);
        } while (strm.avail_out == 0);

    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);

    if (!output) {
        throw std::runtime_error("Failed to write compressed output.");
    }
}
