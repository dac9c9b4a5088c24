#pragma once

#include "KinetiCam/Rig/HostInterfaces.h"
#include "KinetiCam/Rig/RigConfig.h"
#include "KinetiCam/Rig/ViewPose.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstdint>
#include <optional>

namespace KinetiCam {

/**
 * @brief Pose the auto-pilot flies toward
 */
struct FocusTarget {
    glm::vec3 focus{0.0f};
    float distance = 10.0f;
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

/**
 * @brief Geometry summary of a selection
 */
struct SelectionScan {
    glm::vec3 centroid{0.0f};                // World space
    float radius = 0.0f;                     // Max centroid distance
    uint64_t fingerprint = 0;                // count + sum of indices
    std::optional<glm::quat> normalRotation; // Set when the normal sum is usable
};

/**
 * @brief Summarize a selection snapshot
 * @return Nothing for an empty selection
 */
std::optional<SelectionScan> scanSelection(const SelectionSnapshot& snapshot);

/**
 * @brief Orientation looking from the current eye toward `centroid`
 *
 * Keeps `current.rotation` when the eye sits on the centroid.
 */
glm::quat fallbackRotation(const glm::vec3& centroid, const ViewPose& current);

/**
 * @brief Rate-limited selection polling with change detection
 *
 * Fingerprints can collide (e.g. indices {1,2} and {0,3}); such a change is
 * missed until the selection changes again.
 */
class SelectionScanner {
  public:
    static constexpr double kScanInterval = 0.1;

    /**
     * @brief Poll the selection source
     * @return A new target only when the selection fingerprint changed
     */
    std::optional<FocusTarget> poll(const SelectionSource* source, const ViewPose& current,
                                    const RigConfig& config, double now);

    uint64_t lastFingerprint() const { return m_lastFingerprint; }
    std::optional<double> lastScanTime() const { return m_lastScanTime; }

    void reset();

  private:
    uint64_t m_lastFingerprint = 0;
    std::optional<double> m_lastScanTime;
};

} // namespace KinetiCam
