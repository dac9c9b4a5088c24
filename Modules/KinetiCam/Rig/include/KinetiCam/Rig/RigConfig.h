#pragma once

namespace KinetiCam {

/**
 * @brief Rig tuning, read by value on every tick
 */
struct RigConfig {
    // Auto-pilot
    bool autoPilotEnabled = true;     // Fly to the selection in edit mode
    bool breakOnManual = true;        // Manual navigation cancels auto-pilot
    float distanceMultiplier = 3.0f;  // Framing distance per selection radius
    float speed = 0.03f;              // Auto-pilot interpolation speed

    // Manual
    float friction = 0.12f;           // Coasting drag (lower = more slide)

    // Idle sway
    bool driftEnabled = true;
    float driftIntensity = 0.2f;

    // Ranges
    static constexpr float kMinDistanceMultiplier = 0.5f;
    static constexpr float kMaxDistanceMultiplier = 5.0f;
    static constexpr float kMinSpeed = 0.0f;
    static constexpr float kMaxSpeed = 3.0f;
    static constexpr float kMinFriction = 0.0f;
    static constexpr float kMaxFriction = 2.0f;
    static constexpr float kMinDriftIntensity = 0.0f;
    static constexpr float kMaxDriftIntensity = 1.0f;

    /**
     * @brief Copy with every value clamped to its range
     */
    RigConfig clamped() const;

    /**
     * @brief True when idle sway would actually move the camera
     */
    bool swayActive() const { return driftEnabled && driftIntensity > 0.001f; }
};

} // namespace KinetiCam
