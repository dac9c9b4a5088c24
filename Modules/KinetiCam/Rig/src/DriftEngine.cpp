#include "KinetiCam/Rig/DriftEngine.h"

#include "KinetiCam/Rig/RigMath.h"

#include <algorithm>
#include <cmath>

namespace KinetiCam {

SwayOffset swayOffset(double time, float strength) {
    const double t = time;
    const double s = strength;
    const double rs = s * 0.2;

    SwayOffset offset;
    offset.location = glm::vec3(
        static_cast<float>((std::sin(t * 1.2) + std::cos(t * 2.1) * 0.5) * s),
        static_cast<float>((std::cos(t * 1.4) + std::sin(t * 2.4) * 0.5) * s),
        static_cast<float>(std::sin(t * 0.5) * 0.5 * s));

    float pitch = static_cast<float>(std::sin(t * 0.8) * rs);
    float yaw = static_cast<float>(std::cos(t * 1.1) * rs);
    float roll = static_cast<float>(std::sin(t * 1.6) * rs * 0.5);
    offset.rotation = RigMath::eulerXYZ(pitch, yaw, roll);

    return offset;
}

bool DriftEngine::apply(ViewPose& pose, bool idle, float intensity, double now) {
    const float target = idle ? 1.0f : 0.0f;
    m_ramp += (target - m_ramp) * kRampRate;
    m_ramp = std::clamp(m_ramp, 0.0f, 1.0f);

    if (m_ramp <= kMinRamp || intensity <= 0.0f) {
        if (m_hasOffset) {
            clearOffsets();
        }
        return false;
    }

    SwayOffset current = swayOffset(now, intensity * kStrengthScale * m_ramp);

    glm::vec3 deltaLocation = current.location - m_lastOffset.location;
    pose.location += pose.rotation * deltaLocation;

    glm::quat deltaRotation = current.rotation * glm::conjugate(m_lastOffset.rotation);
    pose.rotation = glm::normalize(deltaRotation * pose.rotation);

    m_lastOffset = current;
    m_hasOffset = true;
    return true;
}

void DriftEngine::clearOffsets() {
    m_lastOffset = SwayOffset{};
    m_hasOffset = false;
}

} // namespace KinetiCam
