#pragma once
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>

// Location / rotation / scale triple of an affine matrix.
// Shear is not representable and is dropped by the decomposition.
class Transformation {
public:
    glm::vec3 scale;
    glm::vec3 translate;
    glm::quat quaternion;
    Transformation();
    Transformation(glm::vec3 scale, glm::vec3 translate, float yaw, float pitch, float roll);
    explicit Transformation(const glm::mat4 &matrix);

    glm::mat4 getMatrix() const;
    glm::mat3 getRotationMatrix() const;
    glm::mat3 getScaleMatrix() const;
    static glm::quat getRotation(float yaw, float pitch, float roll);
};
