#pragma once

#include "KinetiCam/Rig/ViewPose.h"

#include <glm/glm.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace KinetiCam {

/**
 * @brief Viewport side of the host: exposes and accepts camera poses
 */
class ViewportHost {
  public:
    virtual ~ViewportHost() = default;

    /**
     * @brief Viewports the session should drive this pass
     */
    virtual std::vector<ViewportId> activeViewports() const = 0;

    /**
     * @brief Current pose, or nothing if the viewport is gone
     */
    virtual std::optional<ViewPose> readPose(ViewportId viewport) const = 0;

    virtual void writePose(ViewportId viewport, const ViewPose& pose) = 0;

    virtual void requestRedraw(ViewportId viewport) = 0;
};

/**
 * @brief One selected element in object space
 */
struct SelectedElement {
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f};
    uint32_t index = 0;  // Stable per-element index
};

struct SelectionSnapshot {
    std::vector<SelectedElement> elements;
    glm::mat4 worldTransform{1.0f};
};

/**
 * @brief Selection side of the host
 */
class SelectionSource {
  public:
    virtual ~SelectionSource() = default;

    /**
     * @brief True while the host is in an element editing mode
     */
    virtual bool isEditContext() const = 0;

    /**
     * @brief Selected elements, or nothing outside edit mode or when empty
     */
    virtual std::optional<SelectionSnapshot> selection() const = 0;
};

/**
 * @brief Monotonic time source in seconds
 */
class Clock {
  public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::steady_clock
 */
class SteadyClock : public Clock {
  public:
    double now() const override;
};

} // namespace KinetiCam
