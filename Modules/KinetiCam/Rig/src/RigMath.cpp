#include "KinetiCam/Rig/RigMath.h"

#include <cmath>

namespace KinetiCam {
namespace RigMath {

namespace {
    // Tilt (|view z.z|) above which the horizon is left alone
    constexpr float kStabilizeBypassTilt = 0.99f;
    // Tilt where leveling starts fading out
    constexpr float kStabilizeBlendStart = 0.8f;

    // Coasting energy thresholds
    constexpr float kMinPanSpeed = 0.001f;
    constexpr float kMinZoomSpeed = 0.001f;
    constexpr float kMinRotationSpeed = 0.0001f;
}

float rotationAngle(const glm::quat& q) {
    float vectorLength = std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z);
    return 2.0f * std::atan2(vectorLength, std::abs(q.w));
}

glm::vec3 viewAxisZ(const glm::quat& q) {
    return q * glm::vec3(0.0f, 0.0f, 1.0f);
}

bool isAxisAligned(const glm::quat& q, float threshold) {
    glm::vec3 z = viewAxisZ(q);
    return std::abs(z.x) > threshold || std::abs(z.y) > threshold || std::abs(z.z) > threshold;
}

glm::quat stabilizeHorizon(const glm::quat& q) {
    glm::mat3 basis = glm::mat3_cast(q);
    glm::vec3 viewZ = basis[2];

    float tilt = std::abs(viewZ.z);
    if (tilt > kStabilizeBypassTilt) {
        return q;
    }

    glm::vec3 viewX = basis[0];
    glm::vec3 flatX(viewX.x, viewX.y, 0.0f);
    if (glm::dot(flatX, flatX) < 0.001f) {
        return q;
    }

    // Horizontal right axis perpendicular to the view axis, on the same side
    // as the current one
    glm::vec3 levelX(-viewZ.y, viewZ.x, 0.0f);
    float length = glm::length(levelX);
    if (length < 1e-6f) {
        return q;
    }
    levelX /= length;
    if (glm::dot(levelX, flatX) < 0.0f) {
        levelX = -levelX;
    }
    glm::vec3 levelY = glm::cross(viewZ, levelX);

    glm::quat level = glm::normalize(glm::quat_cast(glm::mat3(levelX, levelY, viewZ)));

    if (tilt > kStabilizeBlendStart) {
        float factor = (tilt - kStabilizeBlendStart) / (kStabilizeBypassTilt - kStabilizeBlendStart);
        return glm::normalize(glm::slerp(level, q, factor));
    }
    return level;
}

glm::quat eulerXYZ(float x, float y, float z) {
    // glm composes Rz * Ry * Rx
    return glm::quat(glm::vec3(x, y, z));
}

glm::quat trackRotation(const glm::vec3& direction, TrackAxis axis) {
    float length = glm::length(direction);
    if (length < 1e-6f) {
        return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    }

    glm::vec3 z = direction / length;
    if (axis == TrackAxis::NegativeZ) {
        z = -z;
    }

    glm::vec3 up(0.0f, 0.0f, 1.0f);
    glm::vec3 y = up - z * glm::dot(up, z);
    if (glm::dot(y, y) < 1e-8f) {
        // Looking straight up or down, use world +Y as up hint
        up = glm::vec3(0.0f, 1.0f, 0.0f);
        y = up - z * glm::dot(up, z);
    }
    y = glm::normalize(y);
    glm::vec3 x = glm::cross(y, z);

    return glm::normalize(glm::quat_cast(glm::mat3(x, y, z)));
}

MotionSample averageMotion(const MotionBuffer& buffer) {
    MotionSample result;
    if (buffer.empty()) {
        return result;
    }

    glm::vec3 panSum(0.0f);
    float zoomSum = 0.0f;
    glm::vec4 rotationSum(0.0f);
    const glm::quat& reference = buffer.oldest().rotation;

    for (const MotionSample& sample : buffer) {
        panSum += sample.pan;
        zoomSum += sample.zoom;

        // q and -q are the same rotation; keep the sum on one hemisphere
        glm::quat q = sample.rotation;
        if (glm::dot(q, reference) < 0.0f) {
            q = -q;
        }
        rotationSum += glm::vec4(q.w, q.x, q.y, q.z);
    }

    float count = static_cast<float>(buffer.size());
    result.pan = panSum / count;
    result.zoom = zoomSum / count;

    float length = glm::length(rotationSum);
    if (length > 1e-6f) {
        rotationSum /= length;
        result.rotation = glm::quat(rotationSum.x, rotationSum.y, rotationSum.z, rotationSum.w);
    }
    return result;
}

bool hasEnergy(const MotionSample& velocity) {
    return glm::length(velocity.pan) > kMinPanSpeed || std::abs(velocity.zoom) > kMinZoomSpeed ||
           rotationAngle(velocity.rotation) > kMinRotationSpeed;
}

} // namespace RigMath
} // namespace KinetiCam
