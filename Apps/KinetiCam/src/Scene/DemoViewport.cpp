/*
 *  KinetiCam - Demo Viewport Implementation
 */

#include "DemoViewport.hpp"
#include <KinetiCam/Core/Logger.h>

namespace KinetiCam
{

DemoViewport::DemoViewport(QObject* parent)
    : QObject(parent)
{
}

ViewportId DemoViewport::addViewport(const ViewPose& pose)
{
    ViewportId id = m_nextId++;
    m_viewports[id] = Entry{pose, 0};
    KC_LOG_DEBUG("Viewport {} opened", id);
    return id;
}

void DemoViewport::removeViewport(ViewportId viewport)
{
    if (m_viewports.erase(viewport) > 0)
    {
        KC_LOG_DEBUG("Viewport {} closed", viewport);
    }
}

void DemoViewport::setPose(ViewportId viewport, const ViewPose& pose)
{
    auto it = m_viewports.find(viewport);
    if (it == m_viewports.end())
    {
        KC_LOG_WARN("setPose on unknown viewport {}", viewport);
        return;
    }
    it->second.pose = pose;
}

int DemoViewport::redrawCount(ViewportId viewport) const
{
    auto it = m_viewports.find(viewport);
    return it != m_viewports.end() ? it->second.redraws : 0;
}

std::vector<ViewportId> DemoViewport::activeViewports() const
{
    std::vector<ViewportId> ids;
    ids.reserve(m_viewports.size());
    for (const auto& [id, entry] : m_viewports)
    {
        ids.push_back(id);
    }
    return ids;
}

std::optional<ViewPose> DemoViewport::readPose(ViewportId viewport) const
{
    auto it = m_viewports.find(viewport);
    if (it == m_viewports.end())
        return std::nullopt;
    return it->second.pose;
}

void DemoViewport::writePose(ViewportId viewport, const ViewPose& pose)
{
    auto it = m_viewports.find(viewport);
    if (it != m_viewports.end())
    {
        it->second.pose = pose;
    }
}

void DemoViewport::requestRedraw(ViewportId viewport)
{
    auto it = m_viewports.find(viewport);
    if (it == m_viewports.end())
        return;

    ++it->second.redraws;
    emit redrawRequested(viewport);
}

} // namespace KinetiCam
