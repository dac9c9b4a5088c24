/*
 *  KinetiCam - Demo Scenario
 *  Scripted user input for headless runs
 */

#pragma once

#include <KinetiCam/Rig/ViewPose.h>

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

namespace KinetiCam
{

class DemoViewport;
class SelectionSystem;

/**
 * @brief Plays a fixed sequence of user actions against one viewport
 *
 * Drag (orbit + pan), release, select the top face in edit mode, fight the
 * auto-pilot with a pan, then leave the camera alone.
 */
class DemoScenario : public QObject
{
    Q_OBJECT

public:
    enum class Phase
    {
        Pending,
        Drag,
        Coast,
        Select,
        Fight,
        Idle
    };
    Q_ENUM(Phase)

    // Phase start times, seconds after start()
    static constexpr double kDragStart = 0.2;
    static constexpr double kCoastStart = 0.5;
    static constexpr double kSelectStart = 2.0;
    static constexpr double kFightStart = 4.0;
    static constexpr double kIdleStart = 4.3;

    static constexpr int kStepMs = 10;

    DemoScenario(DemoViewport& viewport, ViewportId viewportId, SelectionSystem& selection,
                 QObject* parent = nullptr);

    Phase phase() const { return m_phase; }

    static const char* phaseName(Phase phase);

public slots:
    void start();
    void stop();

signals:
    void phaseChanged(KinetiCam::DemoScenario::Phase phase);

private slots:
    void step();

private:
    void enterPhase(Phase phase);
    void logPose(const char* label) const;

    DemoViewport& m_viewport;
    ViewportId m_viewportId;
    SelectionSystem& m_selection;

    QTimer m_timer;
    QElapsedTimer m_elapsed;
    Phase m_phase = Phase::Pending;
};

} // namespace KinetiCam
