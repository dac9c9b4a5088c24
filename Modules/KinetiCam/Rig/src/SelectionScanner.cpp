#include "KinetiCam/Rig/SelectionScanner.h"

#include "KinetiCam/Core/Logger.h"
#include "KinetiCam/Rig/RigMath.h"

#include <algorithm>

namespace KinetiCam {

namespace {
    // Isometric-style tilt applied after looking along the selection normal
    constexpr float kNormalTiltPitch = 0.463647f;
    constexpr float kNormalTiltYaw = 0.785398f;
    // Smaller tilt when looking from the eye toward the centroid
    constexpr float kFallbackTilt = 0.349f;

    constexpr float kMinNormalLengthSq = 0.001f;
    constexpr float kMinDirectionLengthSq = 0.001f;
    constexpr float kFramingPadding = 0.5f;
}

std::optional<SelectionScan> scanSelection(const SelectionSnapshot& snapshot) {
    if (snapshot.elements.empty()) {
        return std::nullopt;
    }

    const glm::mat4& world = snapshot.worldTransform;

    glm::vec3 positionSum(0.0f);
    glm::vec3 normalSum(0.0f);
    uint64_t indexSum = 0;

    for (const SelectedElement& element : snapshot.elements) {
        positionSum += glm::vec3(world * glm::vec4(element.position, 1.0f));
        normalSum += element.normal;
        indexSum += element.index;
    }

    SelectionScan scan;
    scan.centroid = positionSum / static_cast<float>(snapshot.elements.size());
    for (const SelectedElement& element : snapshot.elements) {
        glm::vec3 p = glm::vec3(world * glm::vec4(element.position, 1.0f));
        scan.radius = std::max(scan.radius, glm::length(p - scan.centroid));
    }
    scan.fingerprint = static_cast<uint64_t>(snapshot.elements.size()) + indexSum;

    glm::vec3 worldNormal = glm::mat3(world) * normalSum;
    if (glm::dot(worldNormal, worldNormal) > kMinNormalLengthSq) {
        glm::quat base = RigMath::trackRotation(glm::normalize(worldNormal), RigMath::TrackAxis::PositiveZ);
        scan.normalRotation = base * RigMath::eulerXYZ(kNormalTiltPitch, kNormalTiltYaw, 0.0f);
    }

    return scan;
}

glm::quat fallbackRotation(const glm::vec3& centroid, const ViewPose& current) {
    glm::vec3 direction = centroid - current.eyePosition();
    if (glm::dot(direction, direction) <= kMinDirectionLengthSq) {
        return current.rotation;
    }
    glm::quat base = RigMath::trackRotation(direction, RigMath::TrackAxis::NegativeZ);
    return base * RigMath::eulerXYZ(kFallbackTilt, kFallbackTilt, 0.0f);
}

std::optional<FocusTarget> SelectionScanner::poll(const SelectionSource* source, const ViewPose& current,
                                                  const RigConfig& config, double now) {
    if (!config.autoPilotEnabled || source == nullptr || !source->isEditContext()) {
        return std::nullopt;
    }
    if (m_lastScanTime && now - *m_lastScanTime <= kScanInterval) {
        return std::nullopt;
    }
    m_lastScanTime = now;

    std::optional<SelectionSnapshot> snapshot = source->selection();
    if (!snapshot) {
        return std::nullopt;
    }

    std::optional<SelectionScan> scan = scanSelection(*snapshot);
    if (!scan || scan->fingerprint == m_lastFingerprint) {
        return std::nullopt;
    }
    m_lastFingerprint = scan->fingerprint;

    FocusTarget target;
    target.focus = scan->centroid;
    target.distance = (scan->radius + kFramingPadding) * config.distanceMultiplier;
    target.rotation = scan->normalRotation ? *scan->normalRotation : fallbackRotation(scan->centroid, current);

    KC_LOG_DEBUG("Selection changed: {} elements, fingerprint {}, radius {:.3f}",
                 snapshot->elements.size(), scan->fingerprint, scan->radius);
    return target;
}

void SelectionScanner::reset() {
    m_lastFingerprint = 0;
    m_lastScanTime.reset();
}

} // namespace KinetiCam
