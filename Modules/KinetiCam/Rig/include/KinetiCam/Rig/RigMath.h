#pragma once

#include "KinetiCam/Rig/RollingBuffer.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace KinetiCam {

/**
 * @brief Per-tick pose change (or a velocity with the same shape)
 */
struct MotionSample {
    glm::vec3 pan{0.0f};                          // Focus point translation
    float zoom = 0.0f;                            // View distance change
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};  // Orientation change, unit
};

/// Short-horizon history of manual motion
using MotionBuffer = RollingBuffer<MotionSample, 3>;

namespace RigMath {

/**
 * @brief Rotation angle in radians along the shortest arc, in [0, pi]
 *
 * Uses atan2 so that q * conjugate(q) reports exactly zero.
 */
float rotationAngle(const glm::quat& q);

/**
 * @brief View-space Z axis (eye direction) in world space
 */
glm::vec3 viewAxisZ(const glm::quat& q);

/**
 * @brief True when the view axis lies along a world axis
 * @param threshold Minimum absolute component that counts as aligned
 */
bool isAxisAligned(const glm::quat& q, float threshold = 0.9999f);

/**
 * @brief Level the horizon of a view orientation
 *
 * The view axis is kept, the right axis is made horizontal. Between a tilt of
 * 0.8 and 0.99 the result fades back to the input; above 0.99 the input is
 * returned as is.
 */
glm::quat stabilizeHorizon(const glm::quat& q);

/**
 * @brief Quaternion for Euler angles applied in X, then Y, then Z order
 */
glm::quat eulerXYZ(float x, float y, float z);

enum class TrackAxis {
    PositiveZ,  // Local +Z points along the direction
    NegativeZ   // Local -Z points along the direction
};

/**
 * @brief Orientation whose track axis points along `direction`, local +Y as
 * close to world +Z as possible
 * @return Identity if `direction` is degenerate
 */
glm::quat trackRotation(const glm::vec3& direction, TrackAxis axis);

/**
 * @brief Mean of the buffered motion
 *
 * Translation and zoom are arithmetic means. Rotation sums the quaternion
 * components and re-normalizes; a near-zero sum yields identity.
 */
MotionSample averageMotion(const MotionBuffer& buffer);

/**
 * @brief Motion above the coasting thresholds
 */
bool hasEnergy(const MotionSample& velocity);

} // namespace RigMath

} // namespace KinetiCam
