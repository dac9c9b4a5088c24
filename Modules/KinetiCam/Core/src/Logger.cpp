/**
 * @file Logger.cpp
 * @brief Logging facility implementation
 */

#include "KinetiCam/Core/Logger.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#ifdef _WIN32
#include <Windows.h>
#else
#include <climits>
#include <unistd.h>
#endif

namespace KinetiCam {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

bool Logger::initialize(const std::string& appName, bool cleanPreviousLogs) {
    if (m_initialized) {
        return true;
    }

    try {
        m_appName = appName;

        m_logDir = getExecutableDir() / "logs";
        if (!std::filesystem::exists(m_logDir)) {
            std::filesystem::create_directories(m_logDir);
        }

        if (cleanPreviousLogs) {
            this->cleanPreviousLogs(appName);
        }

        m_currentLogFile = m_logDir / generateLogFileName(appName);

        std::vector<spdlog::sink_ptr> sinks;

        m_consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        m_consoleSink->set_level(m_consoleLevel);
        m_consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(m_consoleSink);

        // 10 MB per file, 3 backups
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            m_currentLogFile.string(),
            10 * 1024 * 1024,
            3
        );
        fileSink->set_level(spdlog::level::trace);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] [%t] %v");
        sinks.push_back(fileSink);

        m_logger = std::make_shared<spdlog::logger>(appName, sinks.begin(), sinks.end());
        m_logger->set_level(spdlog::level::trace);
        m_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(m_logger);

        m_initialized = true;

        SPDLOG_INFO("=== {} started ===", appName);
        SPDLOG_INFO("Log directory: {}", m_logDir.string());
        SPDLOG_INFO("Log file: {}", m_currentLogFile.filename().string());

        return true;
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
    catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    if (!m_initialized) {
        return;
    }

    if (m_logger) {
        SPDLOG_INFO("=== {} stopped ===", m_appName);
        m_logger->flush();
    }

    spdlog::shutdown();
    m_consoleSink.reset();
    m_logger.reset();
    m_initialized = false;
}

void Logger::setConsoleLevel(spdlog::level::level_enum level) {
    m_consoleLevel = level;
    if (m_consoleSink) {
        m_consoleSink->set_level(level);
    }
}

void Logger::flush() {
    if (m_logger) {
        m_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> Logger::getLogger() const {
    if (m_logger) {
        return m_logger;
    }
    return spdlog::default_logger();
}

std::filesystem::path Logger::getExecutableDir() const {
#ifdef _WIN32
    wchar_t path[MAX_PATH];
    GetModuleFileNameW(nullptr, path, MAX_PATH);
    return std::filesystem::path(path).parent_path();
#else
    char path[PATH_MAX];
    ssize_t count = readlink("/proc/self/exe", path, PATH_MAX);
    if (count <= 0) {
        return std::filesystem::current_path();
    }
    return std::filesystem::path(std::string(path, static_cast<size_t>(count))).parent_path();
#endif
}

std::string Logger::generateLogFileName(const std::string& appName) const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    std::ostringstream oss;
    oss << appName << "_"
        << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_"
#ifdef _WIN32
        << GetCurrentProcessId()
#else
        << getpid()
#endif
        << ".log";

    return oss.str();
}

void Logger::cleanPreviousLogs(const std::string& appName) {
    if (!std::filesystem::exists(m_logDir)) {
        return;
    }

    try {
        // Keep the last 7 days
        auto now = std::chrono::system_clock::now();
        auto sevenDaysAgo = now - std::chrono::hours(24 * 7);

        for (const auto& entry : std::filesystem::directory_iterator(m_logDir)) {
            if (!entry.is_regular_file()) continue;

            auto filename = entry.path().filename().string();
            if (filename.find(appName + "_") != 0) continue;
            if (entry.path().extension() != ".log") continue;

            auto fileTime = std::filesystem::last_write_time(entry);
            auto fileTimePoint = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                fileTime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now()
            );

            if (fileTimePoint < sevenDaysAgo) {
                std::filesystem::remove(entry.path());
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to clean previous logs: " << e.what() << std::endl;
    }
}

} // namespace KinetiCam
