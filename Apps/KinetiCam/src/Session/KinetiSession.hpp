/*
 *  KinetiCam - Session
 *  Toggleable tick scheduler driving one rig per viewport
 */

#pragma once

#include <KinetiCam/Rig/HostInterfaces.h>
#include <KinetiCam/Rig/RigRegistry.h>

#include <QObject>
#include <QTimer>

#include <memory>

namespace KinetiCam
{

class SettingsStore;

/**
 * @brief Toggle session of the camera rigs
 *
 * While active, a single-shot timer runs a pass over all viewports and is
 * re-armed with the delay the pass recommends (10 ms while anything moves,
 * 100 ms when every viewport is idle). Every start() begins from fresh rigs.
 */
class KinetiSession : public QObject
{
    Q_OBJECT

public:
    /**
     * @param host Viewport host, must outlive the session
     * @param selection Selection source, may be null
     * @param settings Configuration source, read on every pass
     */
    KinetiSession(ViewportHost& host, const SelectionSource* selection, const SettingsStore& settings,
                  QObject* parent = nullptr);
    ~KinetiSession() override;

    KinetiSession(const KinetiSession&) = delete;
    KinetiSession& operator=(const KinetiSession&) = delete;

    bool isActive() const { return m_active; }

    /**
     * @brief Replace the time source (tests)
     */
    void setClock(std::unique_ptr<Clock> clock);

    const RigRegistry& registry() const { return m_registry; }

    /**
     * @brief Run one pass immediately, regardless of the timer
     */
    TickSummary tickOnce();

public slots:
    void start();
    void stop();
    void toggle();

signals:
    void activeChanged(bool active);

private slots:
    void onTimeout();

private:
    ViewportHost& m_host;
    const SelectionSource* m_selection;
    const SettingsStore& m_settings;

    std::unique_ptr<Clock> m_clock;
    RigRegistry m_registry;
    QTimer m_timer;
    bool m_active = false;
};

} // namespace KinetiCam
