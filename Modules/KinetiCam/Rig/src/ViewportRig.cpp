#include "KinetiCam/Rig/ViewportRig.h"

#include "KinetiCam/Core/Logger.h"

#include <algorithm>
#include <cmath>

namespace KinetiCam {

namespace {
    // Break-on-manual tolerances grow with the sway intensity, so sway itself
    // never reads as a user fighting the auto-pilot
    constexpr float kBreakBaseLocation = 0.01f;
    constexpr float kBreakLocationPerDrift = 0.2f;
    constexpr float kBreakBaseRotation = 0.008f;
    constexpr float kBreakRotationPerDrift = 0.1f;

    constexpr float kBaseFriction = 0.98f;
    constexpr float kFrictionPerUnit = 0.08f;

    const glm::quat kIdentity(1.0f, 0.0f, 0.0f, 0.0f);
}

const char* rigModeName(RigMode mode) {
    switch (mode) {
    case RigMode::Manual:
        return "Manual";
    case RigMode::Auto:
        return "Auto";
    }
    return "Unknown";
}

ViewportRig::ViewportRig(ViewportId viewport) : m_viewport(viewport) {}

TickResult ViewportRig::tick(const ViewPose& current, const RigConfig& config, const SelectionSource* selection,
                             double now) {
    TickResult result;
    result.pose = current;

    // First observation: no delta to speak of
    if (!m_state.history) {
        m_state.history = PoseHistory{current, now};
    }
    const ViewPose last = m_state.history->pose;

    MotionSample delta;
    delta.pan = current.location - last.location;
    delta.zoom = current.distance - last.distance;
    delta.rotation = current.rotation * glm::conjugate(last.rotation);

    const float speedLocation = glm::length(delta.pan);
    const float speedZoom = std::abs(delta.zoom);
    const float speedRotation = RigMath::rotationAngle(delta.rotation);

    // Projection flips and axis-locked views jump the raw deltas
    const bool projectionFlipped = current.perspective != last.perspective;
    if (projectionFlipped || RigMath::isAxisAligned(current.rotation)) {
        if (!m_safetyLatched) {
            KC_LOG_DEBUG("Viewport {}: physics reset ({})", m_viewport,
                         projectionFlipped ? "projection changed" : "axis-aligned view");
        }
        m_safetyLatched = !projectionFlipped;
        wipePhysics();
        m_drift.clearOffsets();
        m_state.history = PoseHistory{current, now};
        result.reset = true;
        return result;
    }
    m_safetyLatched = false;

    if (std::optional<FocusTarget> target = m_scanner.poll(selection, current, config, now)) {
        enterAuto(*target);
    }

    const bool isMoving = speedLocation > kDeadzone || speedZoom > kDeadzone || speedRotation > kDeadzone;

    if (m_state.mode == RigMode::Auto && !config.autoPilotEnabled) {
        setMode(RigMode::Manual, "auto-pilot disabled");
    }

    if (m_state.mode == RigMode::Auto) {
        if (config.breakOnManual) {
            const float toleranceLocation = kBreakBaseLocation + config.driftIntensity * kBreakLocationPerDrift;
            const float toleranceRotation = kBreakBaseRotation + config.driftIntensity * kBreakRotationPerDrift;
            if (speedLocation > toleranceLocation || speedRotation > toleranceRotation) {
                setMode(RigMode::Manual, "manual override");
            }
        }
        if (m_state.mode == RigMode::Auto) {
            updateAutoPilot(result.pose, config);
        }
    }
    else {
        updateManual(result.pose, delta, isMoving, config, now);
    }

    // Sway comes back once the camera has been left alone for a moment
    if (m_state.shakeSuppressed && !isMoving && !m_state.isCoasting &&
        now - m_state.lastMoveTime >= kSwayResumeDelay) {
        m_state.shakeSuppressed = false;
    }

    const bool swayWanted =
        config.driftEnabled && !isMoving && !m_state.shakeSuppressed && m_state.mode == RigMode::Manual;
    m_drift.apply(result.pose, swayWanted, config.driftIntensity, now);

    result.poseChanged = result.pose != current;
    result.idle = m_state.mode == RigMode::Manual && !isMoving && !m_state.isCoasting && !config.swayActive() &&
                  m_drift.ramp() <= DriftEngine::kMinRamp;

    m_state.history = PoseHistory{result.pose, now};
    return result;
}

void ViewportRig::wipePhysics() {
    m_state.manualBuffer.clear();
    m_state.velocity = MotionSample{};
    m_state.isCoasting = false;
}

void ViewportRig::setMode(RigMode mode, const char* reason) {
    if (m_state.mode == mode) {
        return;
    }
    KC_LOG_DEBUG("Viewport {}: {} -> {} ({})", m_viewport, rigModeName(m_state.mode), rigModeName(mode), reason);
    m_state.mode = mode;
}

void ViewportRig::enterAuto(const FocusTarget& target) {
    setMode(RigMode::Auto, "selection changed");
    m_state.autoTarget = target;
    // Auto-pilot and coasting never run together
    wipePhysics();
}

void ViewportRig::updateAutoPilot(ViewPose& pose, const RigConfig& config) const {
    const float speed = config.speed / 10.0f;
    const FocusTarget& target = m_state.autoTarget;

    pose.location = glm::mix(pose.location, target.focus, speed);
    pose.distance += (target.distance - pose.distance) * speed;
    pose.rotation = RigMath::stabilizeHorizon(glm::normalize(glm::slerp(pose.rotation, target.rotation, speed)));
}

void ViewportRig::updateManual(ViewPose& pose, const MotionSample& delta, bool isMoving, const RigConfig& config,
                               double now) {
    if (isMoving) {
        m_state.isCoasting = false;
        m_state.shakeSuppressed = true;
        m_state.lastMoveTime = now;
        m_state.manualBuffer.push(delta);
    }
    else if (!m_state.isCoasting && !m_state.manualBuffer.empty()) {
        // Drag just ended: the last few deltas become the throw velocity
        m_state.velocity = RigMath::averageMotion(m_state.manualBuffer);
        if (RigMath::hasEnergy(m_state.velocity)) {
            m_state.isCoasting = true;
            m_state.coastingStartTime = now;
            m_state.shakeSuppressed = false;

            // A fast rotational flick should not also fling the camera sideways
            if (RigMath::rotationAngle(m_state.velocity.rotation) > kFlickRotationSpeed) {
                m_state.velocity.pan = glm::vec3(0.0f);
            }
            KC_LOG_DEBUG("Viewport {}: coasting (pan {:.4f}, zoom {:.4f}, rot {:.5f})", m_viewport,
                         glm::length(m_state.velocity.pan), m_state.velocity.zoom,
                         RigMath::rotationAngle(m_state.velocity.rotation));
        }
        m_state.manualBuffer.clear();
    }

    if (m_state.isCoasting) {
        integrateCoasting(pose, config, now);
    }
}

void ViewportRig::integrateCoasting(ViewPose& pose, const RigConfig& config, double now) {
    const float friction = std::max(0.0f, kBaseFriction - kFrictionPerUnit * config.friction);

    MotionSample& velocity = m_state.velocity;
    velocity.pan *= friction;
    velocity.zoom *= friction;
    velocity.rotation = glm::normalize(glm::slerp(velocity.rotation, kIdentity, 1.0f - friction));

    if (!RigMath::hasEnergy(velocity)) {
        m_state.isCoasting = false;
        KC_LOG_DEBUG("Viewport {}: coasting stopped after {:.2f}s", m_viewport, now - m_state.coastingStartTime);
        return;
    }

    pose.location += velocity.pan;

    float distance = pose.distance + velocity.zoom;
    if (distance < kMinDistance) {
        distance = kMinDistance;
        velocity.zoom = 0.0f;
    }
    pose.distance = distance;

    const glm::quat raw = glm::normalize(velocity.rotation * pose.rotation);
    const glm::quat level = RigMath::stabilizeHorizon(raw);

    // Pull the horizon in gently over the start of the coast
    const double elapsed = now - m_state.coastingStartTime;
    float blend = kMaxStabilizeBlend;
    if (elapsed < kStabilizeRampTime) {
        blend = static_cast<float>(std::max(0.0, elapsed) / kStabilizeRampTime) * kMaxStabilizeBlend;
    }
    pose.rotation = glm::normalize(glm::slerp(raw, level, blend));
}

} // namespace KinetiCam
