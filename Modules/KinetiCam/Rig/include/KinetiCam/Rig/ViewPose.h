#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstdint>

namespace KinetiCam {

/// Stable identifier the host assigns to a viewport
using ViewportId = uint32_t;

/**
 * @brief Camera pose of one viewport, owned by the host
 *
 * The camera orbits `location` at `distance`; the eye sits on the view's
 * local +Z axis. `rotation` is always a unit quaternion.
 */
struct ViewPose {
    glm::vec3 location{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    float distance = 10.0f;
    bool perspective = true;

    /**
     * @brief Eye position in world space
     */
    glm::vec3 eyePosition() const { return location + rotation * glm::vec3(0.0f, 0.0f, distance); }

    bool operator==(const ViewPose& other) const {
        return location == other.location && rotation == other.rotation && distance == other.distance &&
               perspective == other.perspective;
    }
    bool operator!=(const ViewPose& other) const { return !(*this == other); }
};

} // namespace KinetiCam
