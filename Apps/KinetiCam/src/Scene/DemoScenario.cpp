/*
 *  KinetiCam - Demo Scenario Implementation
 */

#include "DemoScenario.hpp"
#include "DemoViewport.hpp"
#include "Selection/SelectionSystem.hpp"
#include <KinetiCam/Core/Logger.h>
#include <KinetiCam/Rig/RigMath.h>

#include <glm/gtc/quaternion.hpp>

#include <optional>

namespace KinetiCam
{

namespace
{
    // Per-step user input
    constexpr float kDragOrbit = 0.02f;   // rad around world Z
    constexpr float kDragPan = 0.01f;
    constexpr float kFightPan = 0.05f;

    // Top face of the demo cube
    const std::vector<uint32_t> kTopFace = {4, 5, 6, 7};
}

DemoScenario::DemoScenario(DemoViewport& viewport, ViewportId viewportId, SelectionSystem& selection,
                           QObject* parent)
    : QObject(parent)
    , m_viewport(viewport)
    , m_viewportId(viewportId)
    , m_selection(selection)
{
    m_timer.setInterval(kStepMs);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &DemoScenario::step);
}

const char* DemoScenario::phaseName(Phase phase)
{
    switch (phase)
    {
        case Phase::Pending: return "pending";
        case Phase::Drag:    return "drag";
        case Phase::Coast:   return "coast";
        case Phase::Select:  return "select";
        case Phase::Fight:   return "fight";
        case Phase::Idle:    return "idle";
    }
    return "unknown";
}

void DemoScenario::start()
{
    m_phase = Phase::Pending;
    m_elapsed.start();
    m_timer.start();
    logPose("start");
}

void DemoScenario::stop()
{
    m_timer.stop();
    logPose("end");
}

void DemoScenario::step()
{
    const double t = m_elapsed.elapsed() / 1000.0;

    Phase wanted = Phase::Pending;
    if (t >= kIdleStart)
        wanted = Phase::Idle;
    else if (t >= kFightStart)
        wanted = Phase::Fight;
    else if (t >= kSelectStart)
        wanted = Phase::Select;
    else if (t >= kCoastStart)
        wanted = Phase::Coast;
    else if (t >= kDragStart)
        wanted = Phase::Drag;

    if (wanted != m_phase)
    {
        enterPhase(wanted);
    }

    std::optional<ViewPose> pose = m_viewport.readPose(m_viewportId);
    if (!pose)
        return;

    if (m_phase == Phase::Drag)
    {
        glm::quat orbit = glm::angleAxis(kDragOrbit, glm::vec3(0.0f, 0.0f, 1.0f));
        pose->rotation = glm::normalize(orbit * pose->rotation);
        pose->location += pose->rotation * glm::vec3(kDragPan, 0.0f, 0.0f);
        m_viewport.setPose(m_viewportId, *pose);
    }
    else if (m_phase == Phase::Fight)
    {
        pose->location += glm::vec3(kFightPan, 0.0f, 0.0f);
        m_viewport.setPose(m_viewportId, *pose);
    }
}

void DemoScenario::enterPhase(Phase phase)
{
    logPose(phaseName(m_phase));
    m_phase = phase;
    KC_LOG_INFO("Scenario phase: {}", phaseName(phase));

    if (phase == Phase::Select)
    {
        m_selection.setEditMode(true);
        m_selection.setSelection(kTopFace);
    }
    emit phaseChanged(phase);
}

void DemoScenario::logPose(const char* label) const
{
    std::optional<ViewPose> pose = m_viewport.readPose(m_viewportId);
    if (!pose)
        return;

    const glm::vec3 z = RigMath::viewAxisZ(pose->rotation);
    KC_LOG_INFO("[{}] location ({:.3f}, {:.3f}, {:.3f}) distance {:.3f} view axis ({:.3f}, {:.3f}, {:.3f})",
                label, pose->location.x, pose->location.y, pose->location.z, pose->distance, z.x, z.y, z.z);
}

} // namespace KinetiCam
