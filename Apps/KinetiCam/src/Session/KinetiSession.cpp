/*
 *  KinetiCam - Session Implementation
 */

#include "KinetiSession.hpp"
#include "Core/SettingsStore.hpp"
#include <KinetiCam/Core/Logger.h>

#include <cmath>

namespace KinetiCam
{

KinetiSession::KinetiSession(ViewportHost& host, const SelectionSource* selection,
                             const SettingsStore& settings, QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_selection(selection)
    , m_settings(settings)
    , m_clock(std::make_unique<SteadyClock>())
{
    m_timer.setSingleShot(true);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &KinetiSession::onTimeout);
}

KinetiSession::~KinetiSession()
{
    m_timer.stop();
}

void KinetiSession::setClock(std::unique_ptr<Clock> clock)
{
    if (clock)
    {
        m_clock = std::move(clock);
    }
}

TickSummary KinetiSession::tickOnce()
{
    return m_registry.tickAll(m_host, m_selection, m_settings.config(), m_clock->now());
}

void KinetiSession::start()
{
    if (m_active)
        return;

    // No state survives across sessions
    m_registry.clear();
    m_active = true;
    m_timer.start(0);

    KC_LOG_INFO("Kineti-Cam engine started");
    emit activeChanged(true);
}

void KinetiSession::stop()
{
    if (!m_active)
        return;

    m_timer.stop();
    m_registry.clear();
    m_active = false;

    KC_LOG_INFO("Kineti-Cam engine stopped");
    emit activeChanged(false);
}

void KinetiSession::toggle()
{
    if (m_active)
        stop();
    else
        start();
}

void KinetiSession::onTimeout()
{
    if (!m_active)
        return;

    TickSummary summary = tickOnce();
    if (summary.skipped > 0)
    {
        KC_LOG_TRACE("Pass skipped {} of {} viewports", summary.skipped, summary.ticked + summary.skipped);
    }

    m_timer.start(static_cast<int>(std::lround(summary.nextDelay * 1000.0)));
}

} // namespace KinetiCam
