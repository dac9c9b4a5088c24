/*
 *  KinetiCam - Demo Viewport
 *  In-memory viewport host for headless runs
 */

#pragma once

#include <KinetiCam/Rig/HostInterfaces.h>

#include <QObject>

#include <map>
#include <optional>
#include <vector>

namespace KinetiCam
{

/**
 * @brief Viewport host keeping camera poses in memory
 *
 * Stands in for a 3D view: setPose() is what user navigation would do,
 * writePose() is what the rig does.
 */
class DemoViewport : public QObject, public ViewportHost
{
    Q_OBJECT

public:
    explicit DemoViewport(QObject* parent = nullptr);
    ~DemoViewport() override = default;

    /**
     * @brief Open a viewport
     * @return Its id, never 0
     */
    ViewportId addViewport(const ViewPose& pose);

    void removeViewport(ViewportId viewport);

    /**
     * @brief Move the camera from outside the rig (user navigation)
     */
    void setPose(ViewportId viewport, const ViewPose& pose);

    /**
     * @brief Number of redraws requested for a viewport
     */
    int redrawCount(ViewportId viewport) const;

    // ViewportHost
    std::vector<ViewportId> activeViewports() const override;
    std::optional<ViewPose> readPose(ViewportId viewport) const override;
    void writePose(ViewportId viewport, const ViewPose& pose) override;
    void requestRedraw(ViewportId viewport) override;

signals:
    void redrawRequested(quint32 viewport);

private:
    struct Entry
    {
        ViewPose pose;
        int redraws = 0;
    };

    std::map<ViewportId, Entry> m_viewports;
    ViewportId m_nextId = 1;
};

} // namespace KinetiCam
