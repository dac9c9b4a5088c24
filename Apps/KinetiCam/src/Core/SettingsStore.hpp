/*
 *  KinetiCam - Settings Store
 *  Rig configuration persisted with QSettings
 */

#pragma once

#include <KinetiCam/Rig/RigConfig.h>

#include <QObject>
#include <QSettings>
#include <QString>

#include <memory>

namespace KinetiCam
{

/**
 * @brief Single source of truth for the rig configuration
 *
 * Values live under the "Rig" group. The session reads config() by value on
 * every pass, so there is nothing to keep in sync.
 */
class SettingsStore : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Store backed by the platform default location (organization/application)
     */
    explicit SettingsStore(QObject* parent = nullptr);

    /**
     * @brief Store backed by an INI file
     */
    explicit SettingsStore(const QString& iniPath, QObject* parent = nullptr);

    ~SettingsStore() override = default;

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    /**
     * @brief Read the configuration, falling back to defaults per key
     */
    void load();

    /**
     * @brief Write every key and flush to storage
     * @return true if the backend reported no error
     */
    bool save();

    /**
     * @brief Current configuration (by value)
     */
    RigConfig config() const { return m_config; }

    /**
     * @brief Replace the configuration; values are clamped to their ranges
     */
    void setConfig(const RigConfig& config);

    /**
     * @brief Storage location, for diagnostics
     */
    QString fileName() const { return m_settings->fileName(); }

signals:
    void configChanged();

private:
    bool readBool(const QString& key, bool fallback) const;
    float readFloat(const QString& key, float fallback) const;

    std::unique_ptr<QSettings> m_settings;
    RigConfig m_config;
};

} // namespace KinetiCam
