#pragma once

#include "KinetiCam/Rig/ViewPose.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace KinetiCam {

/**
 * @brief Idle sway offset, in view space
 */
struct SwayOffset {
    glm::vec3 location{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

/**
 * @brief Deterministic sway waveform
 *
 * Sums sines and cosines of incommensurate frequencies so the motion does
 * not read as periodic.
 * @param time Seconds
 * @param strength Positional amplitude; rotation uses a fifth of it
 */
SwayOffset swayOffset(double time, float strength);

/**
 * @brief Idle sway with a smooth fade in and out
 *
 * Offsets are applied incrementally (this tick's offset minus last tick's), so
 * sway stacks on top of whatever else moved the camera during the tick.
 */
class DriftEngine {
  public:
    static constexpr float kRampRate = 0.01f;
    static constexpr float kMinRamp = 0.001f;
    static constexpr float kStrengthScale = 0.05f;

    /**
     * @brief Advance the fade and apply this tick's sway increment
     * @param pose Pose to modify in place
     * @param idle Whether sway should fade in (true) or out (false)
     * @param intensity Configured sway intensity
     * @param now Clock time in seconds
     * @return true if `pose` was modified
     */
    bool apply(ViewPose& pose, bool idle, float intensity, double now);

    /**
     * @brief Forget the offset applied so far
     */
    void clearOffsets();

    float ramp() const { return m_ramp; }
    const SwayOffset& lastOffset() const { return m_lastOffset; }

  private:
    float m_ramp = 0.0f;
    SwayOffset m_lastOffset;
    bool m_hasOffset = false;
};

} // namespace KinetiCam
