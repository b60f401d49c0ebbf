#pragma once
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/matrix.hpp>
#include <string>
#include <sstream>
#include <istream>
#include <ostream>

class Math {
public:
    static glm::mat4 rotationX(float degrees);
    static glm::mat4 translation(glm::vec3 position);
    static glm::mat4 withTranslation(const glm::mat4 &m, glm::vec3 position);
    static glm::vec3 getTranslation(const glm::mat4 &m);
    static bool isInvertible(const glm::mat4 &m);
    static bool nearlyEqual(float a, float b, float epsilon = 1e-4f);
    static bool nearlyEqual(const glm::vec3 &a, const glm::vec3 &b, float epsilon = 1e-4f);
    static bool nearlyEqual(const glm::mat4 &a, const glm::mat4 &b, float epsilon = 1e-4f);
};

void ensureFolderExists(const std::string& folder);
std::stringstream gzipDecompress(std::istream& input);
void gzipCompress(std::istream& inputStream, std::ostream& output);
