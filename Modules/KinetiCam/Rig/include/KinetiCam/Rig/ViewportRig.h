#pragma once

#include "KinetiCam/Rig/DriftEngine.h"
#include "KinetiCam/Rig/HostInterfaces.h"
#include "KinetiCam/Rig/RigConfig.h"
#include "KinetiCam/Rig/RigMath.h"
#include "KinetiCam/Rig/SelectionScanner.h"
#include "KinetiCam/Rig/ViewPose.h"

#include <optional>

namespace KinetiCam {

/**
 * @brief Who is driving the camera
 */
enum class RigMode {
    Manual,  // User input, with coasting after a drag
    Auto     // Flying toward the selection
};

const char* rigModeName(RigMode mode);

/**
 * @brief Last pose the rig wrote (or first observed) and when
 */
struct PoseHistory {
    ViewPose pose;
    double time = 0.0;
};

/**
 * @brief Per-viewport motion state
 *
 * Drift fade and offsets live in DriftEngine, selection fingerprint and scan
 * throttle in SelectionScanner.
 */
struct RigState {
    RigMode mode = RigMode::Manual;
    std::optional<PoseHistory> history;

    MotionBuffer manualBuffer;
    MotionSample velocity;
    bool isCoasting = false;
    double coastingStartTime = 0.0;

    FocusTarget autoTarget;  // Read only in Auto mode

    bool shakeSuppressed = false;
    double lastMoveTime = 0.0;
};

/**
 * @brief Outcome of one tick
 */
struct TickResult {
    ViewPose pose;             // Pose to write back
    bool poseChanged = false;  // Pose differs from the input, redraw needed
    bool reset = false;        // Safety reset wiped the physics
    bool idle = false;         // Nothing will move until the user does
};

/**
 * @brief Camera rig of one viewport
 *
 * Fuses manual coasting, auto-pilot framing and idle sway. Call tick() at a
 * fixed rate with the pose the host currently shows; write the returned pose
 * back when it changed.
 */
class ViewportRig {
  public:
    static constexpr float kDeadzone = 0.0005f;
    static constexpr float kFlickRotationSpeed = 0.003f;  // Rotation that cancels coasting pan
    static constexpr double kStabilizeRampTime = 0.5;
    static constexpr float kMaxStabilizeBlend = 0.1f;
    static constexpr float kMinDistance = 0.01f;
    static constexpr double kSwayResumeDelay = 0.5;       // Idle time before sway returns

    explicit ViewportRig(ViewportId viewport = 0);

    /**
     * @brief Advance the rig by one tick
     * @param current Pose the host shows right now
     * @param config Settings for this tick
     * @param selection Selection collaborator, may be null
     * @param now Clock time in seconds
     */
    TickResult tick(const ViewPose& current, const RigConfig& config, const SelectionSource* selection,
                    double now);

    ViewportId viewport() const { return m_viewport; }
    RigMode mode() const { return m_state.mode; }
    const RigState& state() const { return m_state; }
    const DriftEngine& drift() const { return m_drift; }
    const SelectionScanner& scanner() const { return m_scanner; }

  private:
    void wipePhysics();
    void setMode(RigMode mode, const char* reason);
    void enterAuto(const FocusTarget& target);

    void updateAutoPilot(ViewPose& pose, const RigConfig& config) const;
    void updateManual(ViewPose& pose, const MotionSample& delta, bool isMoving, const RigConfig& config,
                      double now);
    void integrateCoasting(ViewPose& pose, const RigConfig& config, double now);

    ViewportId m_viewport;
    RigState m_state;
    DriftEngine m_drift;
    SelectionScanner m_scanner;
    bool m_safetyLatched = false;
};

} // namespace KinetiCam
