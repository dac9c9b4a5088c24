#include "KinetiCam/Rig/RigRegistry.h"

#include "KinetiCam/Core/Logger.h"

#include <algorithm>
#include <exception>

namespace KinetiCam {

TickSummary RigRegistry::tickAll(ViewportHost& host, const SelectionSource* selection, const RigConfig& config,
                                 double now) {
    TickSummary summary;
    bool allIdle = true;

    // Out-of-range friction would make coasting speed up
    const RigConfig safeConfig = config.clamped();

    const std::vector<ViewportId> active = host.activeViewports();
    dropStaleRigs(active);

    for (ViewportId viewport : active) {
        try {
            std::optional<ViewPose> pose = host.readPose(viewport);
            if (!pose) {
                ++summary.skipped;
                continue;
            }

            TickResult result = rigFor(viewport).tick(*pose, safeConfig, selection, now);
            ++summary.ticked;

            if (result.poseChanged) {
                host.writePose(viewport, result.pose);
                host.requestRedraw(viewport);
                ++summary.redraws;
            }
            allIdle = allIdle && result.idle;
        }
        catch (const std::exception& e) {
            KC_LOG_WARN("Viewport {}: tick skipped: {}", viewport, e.what());
            ++summary.skipped;
            allIdle = false;
        }
    }

    summary.nextDelay = allIdle ? kIdleDelay : kActiveDelay;
    return summary;
}

ViewportRig* RigRegistry::find(ViewportId viewport) {
    auto it = m_rigs.find(viewport);
    return it != m_rigs.end() ? it->second.get() : nullptr;
}

const ViewportRig* RigRegistry::find(ViewportId viewport) const {
    auto it = m_rigs.find(viewport);
    return it != m_rigs.end() ? it->second.get() : nullptr;
}

void RigRegistry::clear() {
    if (!m_rigs.empty()) {
        KC_LOG_DEBUG("Discarding {} viewport rigs", m_rigs.size());
    }
    m_rigs.clear();
}

ViewportRig& RigRegistry::rigFor(ViewportId viewport) {
    auto it = m_rigs.find(viewport);
    if (it == m_rigs.end()) {
        KC_LOG_DEBUG("Viewport {}: rig created", viewport);
        it = m_rigs.emplace(viewport, std::make_unique<ViewportRig>(viewport)).first;
    }
    return *it->second;
}

void RigRegistry::dropStaleRigs(const std::vector<ViewportId>& active) {
    for (auto it = m_rigs.begin(); it != m_rigs.end();) {
        if (std::find(active.begin(), active.end(), it->first) == active.end()) {
            KC_LOG_DEBUG("Viewport {}: rig dropped", it->first);
            it = m_rigs.erase(it);
        }
        else {
            ++it;
        }
    }
}

} // namespace KinetiCam
