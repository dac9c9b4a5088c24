#pragma once

#include "KinetiCam/Rig/HostInterfaces.h"
#include "KinetiCam/Rig/RigConfig.h"
#include "KinetiCam/Rig/ViewportRig.h"

#include <cstddef>
#include <memory>
#include <unordered_map>

namespace KinetiCam {

/**
 * @brief Result of one pass over all viewports
 */
struct TickSummary {
    std::size_t ticked = 0;   // Viewports that produced a tick
    std::size_t skipped = 0;  // Viewports without a pose or whose tick failed
    std::size_t redraws = 0;  // Redraws requested
    double nextDelay = 0.0;   // Seconds until the next pass should run
};

/**
 * @brief One rig per viewport, keyed by viewport id
 *
 * Rigs are created the first time a viewport is reported and dropped when the
 * host stops reporting it. clear() discards every rig, so a new session always
 * starts from fresh state.
 */
class RigRegistry {
  public:
    static constexpr double kActiveDelay = 0.01;
    static constexpr double kIdleDelay = 0.1;

    /**
     * @brief Tick every active viewport of `host`
     *
     * `config` is clamped to its documented ranges before any rig sees it.
     */
    TickSummary tickAll(ViewportHost& host, const SelectionSource* selection, const RigConfig& config,
                        double now);

    ViewportRig* find(ViewportId viewport);
    const ViewportRig* find(ViewportId viewport) const;

    std::size_t size() const { return m_rigs.size(); }
    bool empty() const { return m_rigs.empty(); }

    void clear();

  private:
    ViewportRig& rigFor(ViewportId viewport);
    void dropStaleRigs(const std::vector<ViewportId>& active);

    std::unordered_map<ViewportId, std::unique_ptr<ViewportRig>> m_rigs;
};

} // namespace KinetiCam
