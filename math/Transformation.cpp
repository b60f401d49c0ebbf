#include "Transformation.hpp"
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

Transformation::Transformation()
    : scale(1.0f, 1.0f, 1.0f), translate(0.0f, 0.0f, 0.0f), quaternion(1.0f, 0.0f, 0.0f, 0.0f)
{
}

Transformation::Transformation(glm::vec3 scale, glm::vec3 translate, float yaw, float pitch, float roll)
    : scale(scale), translate(translate), quaternion(getRotation(yaw, pitch, roll))
{
}

Transformation::Transformation(const glm::mat4 &matrix)
    : scale(1.0f, 1.0f, 1.0f), translate(matrix[3]), quaternion(1.0f, 0.0f, 0.0f, 0.0f)
{
    glm::mat3 linear(matrix);
    glm::mat3 rotation(1.0f);
    for (int i = 0; i < 3; ++i) {
        float length = glm::length(linear[i]);
        scale[i] = length;
        if (length > 1e-12f) {
            rotation[i] = linear[i] / length;
        }
    }
    // A mirroring matrix keeps a proper rotation by carrying the sign on X
    if (glm::determinant(linear) < 0.0f) {
        scale.x = -scale.x;
        rotation[0] = -rotation[0];
    }
    quaternion = glm::normalize(glm::quat_cast(rotation));
}

glm::mat4 Transformation::getMatrix() const
{
    glm::mat4 m = glm::translate(glm::mat4(1.0f), translate);
    m = m * glm::mat4_cast(quaternion);
    return glm::scale(m, scale);
}

glm::mat3 Transformation::getRotationMatrix() const
{
    return glm::mat3_cast(quaternion);
}

glm::mat3 Transformation::getScaleMatrix() const
{
    glm::mat3 s(1.0f);
    s[0][0] = scale.x;
    s[1][1] = scale.y;
    s[2][2] = scale.z;
    return s;
}

glm::quat Transformation::getRotation(float yaw, float pitch, float roll)
{
    // Build quaternions per axis (angles are in degrees in the interface)
    glm::quat qx = glm::angleAxis(glm::radians(pitch), glm::vec3(1.0f, 0.0f, 0.0f));
    glm::quat qy = glm::angleAxis(glm::radians(yaw),   glm::vec3(0.0f, 1.0f, 0.0f));
    glm::quat qz = glm::angleAxis(glm::radians(roll),  glm::vec3(0.0f, 0.0f, 1.0f));

    // Y * X * Z order (yaw, then pitch, then roll)
    return qy * qx * qz;
}
