/**
 * @file Logger.h
 * @brief Logging facility - spdlog based singleton logger
 *
 * Features:
 * - Levels trace, debug, info, warn, error, critical
 * - Console and rotating file output; the console shows info and up unless
 *   raised to debug for rig mode changes and coasting
 * - Log file named after app + date + process id
 * - Logs of the same app older than seven days removed at start-up
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace KinetiCam {

/**
 * @brief Logger singleton
 */
class Logger {
  public:
    /**
     * @brief Get the Logger instance
     */
    static Logger& instance();

    /**
     * @brief Initialize the logging system
     * @param appName Application name, used for the log file name
     * @param cleanPreviousLogs Remove week-old logs of the same application
     * @return true on success
     */
    bool initialize(const std::string& appName = "KinetiCam", bool cleanPreviousLogs = true);

    /**
     * @brief Shut the logging system down
     */
    void shutdown();

    std::filesystem::path getLogDirectory() const { return m_logDir; }
    std::filesystem::path getCurrentLogFile() const { return m_currentLogFile; }

    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Threshold of the console sink
     *
     * May be called before initialize(); the file sink always records trace.
     */
    void setConsoleLevel(spdlog::level::level_enum level);
    spdlog::level::level_enum consoleLevel() const { return m_consoleLevel; }

    /**
     * @brief Force pending records to disk
     */
    void flush();

    /**
     * @brief spdlog logger in use
     *
     * Falls back to spdlog's default logger until initialize() succeeded, so
     * library code may log before (or without) the application set up sinks.
     */
    std::shared_ptr<spdlog::logger> getLogger() const;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

  private:
    Logger() = default;
    ~Logger();

    std::filesystem::path getExecutableDir() const;

    /**
     * @brief Log file name, format AppName_YYYYMMDD_HHMMSS_PID.log
     */
    std::string generateLogFileName(const std::string& appName) const;

    void cleanPreviousLogs(const std::string& appName);

  private:
    std::shared_ptr<spdlog::logger> m_logger;
    spdlog::sink_ptr m_consoleSink;
    spdlog::level::level_enum m_consoleLevel = spdlog::level::info;
    std::filesystem::path m_logDir;
    std::filesystem::path m_currentLogFile;
    std::string m_appName;
    bool m_initialized = false;
};

} // namespace KinetiCam

// =============================================================================
// Logging macros
// =============================================================================

#define KC_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(KinetiCam::Logger::instance().getLogger(), __VA_ARGS__)
#define KC_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(KinetiCam::Logger::instance().getLogger(), __VA_ARGS__)
#define KC_LOG_INFO(...)     SPDLOG_LOGGER_INFO(KinetiCam::Logger::instance().getLogger(), __VA_ARGS__)
#define KC_LOG_WARN(...)     SPDLOG_LOGGER_WARN(KinetiCam::Logger::instance().getLogger(), __VA_ARGS__)
#define KC_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(KinetiCam::Logger::instance().getLogger(), __VA_ARGS__)
#define KC_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(KinetiCam::Logger::instance().getLogger(), __VA_ARGS__)
