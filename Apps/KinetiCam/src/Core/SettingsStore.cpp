/*
 *  KinetiCam - Settings Store Implementation
 */

#include "SettingsStore.hpp"
#include <KinetiCam/Core/Logger.h>

#include <QCoreApplication>
#include <QVariant>

namespace KinetiCam
{

namespace
{
    const QString kGroup = QStringLiteral("Rig");

    const QString kAutoPilot = QStringLiteral("autoPilotEnabled");
    const QString kBreakOnManual = QStringLiteral("breakOnManual");
    const QString kDistanceMultiplier = QStringLiteral("distanceMultiplier");
    const QString kSpeed = QStringLiteral("speed");
    const QString kFriction = QStringLiteral("friction");
    const QString kDriftEnabled = QStringLiteral("driftEnabled");
    const QString kDriftIntensity = QStringLiteral("driftIntensity");

    void warnIfClamped(const char* key, float value, float clamped)
    {
        if (value != clamped)
        {
            KC_LOG_WARN("Setting {} = {} out of range, using {}", key, value, clamped);
        }
    }
}

SettingsStore::SettingsStore(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<QSettings>(QCoreApplication::organizationName(),
                                             QCoreApplication::applicationName()))
{
}

SettingsStore::SettingsStore(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
{
}

void SettingsStore::load()
{
    const RigConfig defaults;
    RigConfig loaded;

    m_settings->beginGroup(kGroup);
    loaded.autoPilotEnabled = readBool(kAutoPilot, defaults.autoPilotEnabled);
    loaded.breakOnManual = readBool(kBreakOnManual, defaults.breakOnManual);
    loaded.distanceMultiplier = readFloat(kDistanceMultiplier, defaults.distanceMultiplier);
    loaded.speed = readFloat(kSpeed, defaults.speed);
    loaded.friction = readFloat(kFriction, defaults.friction);
    loaded.driftEnabled = readBool(kDriftEnabled, defaults.driftEnabled);
    loaded.driftIntensity = readFloat(kDriftIntensity, defaults.driftIntensity);
    m_settings->endGroup();

    setConfig(loaded);
    KC_LOG_DEBUG("Settings loaded from {}", m_settings->fileName().toStdString());
}

bool SettingsStore::save()
{
    // Floats go out as doubles so INI files keep plain numbers
    m_settings->beginGroup(kGroup);
    m_settings->setValue(kAutoPilot, m_config.autoPilotEnabled);
    m_settings->setValue(kBreakOnManual, m_config.breakOnManual);
    m_settings->setValue(kDistanceMultiplier, static_cast<double>(m_config.distanceMultiplier));
    m_settings->setValue(kSpeed, static_cast<double>(m_config.speed));
    m_settings->setValue(kFriction, static_cast<double>(m_config.friction));
    m_settings->setValue(kDriftEnabled, m_config.driftEnabled);
    m_settings->setValue(kDriftIntensity, static_cast<double>(m_config.driftIntensity));
    m_settings->endGroup();

    m_settings->sync();
    if (m_settings->status() != QSettings::NoError)
    {
        KC_LOG_ERROR("Failed to write settings to {}", m_settings->fileName().toStdString());
        return false;
    }
    return true;
}

void SettingsStore::setConfig(const RigConfig& config)
{
    RigConfig clamped = config.clamped();
    warnIfClamped("distanceMultiplier", config.distanceMultiplier, clamped.distanceMultiplier);
    warnIfClamped("speed", config.speed, clamped.speed);
    warnIfClamped("friction", config.friction, clamped.friction);
    warnIfClamped("driftIntensity", config.driftIntensity, clamped.driftIntensity);

    m_config = clamped;
    emit configChanged();
}

bool SettingsStore::readBool(const QString& key, bool fallback) const
{
    QVariant value = m_settings->value(key);
    if (!value.isValid())
        return fallback;
    return value.toBool();
}

float SettingsStore::readFloat(const QString& key, float fallback) const
{
    QVariant value = m_settings->value(key);
    if (!value.isValid())
        return fallback;

    bool ok = false;
    float result = value.toFloat(&ok);
    if (!ok)
    {
        KC_LOG_WARN("Setting {} is not a number, using default {}", key.toStdString(), fallback);
        return fallback;
    }
    return result;
}

} // namespace KinetiCam
