/**
 * @file tg_logger.hpp
 * @brief Leveled logger shared by all engine components
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef TIERGUARD_TG_LOGGER_HPP
#define TIERGUARD_TG_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <optional>
#include <algorithm>

namespace tierguard {

// Use LOG_ prefix to avoid Windows macro conflicts (ERROR is defined in WinGDI.h)
enum class LogLevel { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

inline std::optional<LogLevel> logLevelFromString(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    if (s == "TRACE") return LogLevel::LOG_TRACE;
    if (s == "DEBUG") return LogLevel::LOG_DEBUG;
    if (s == "INFO") return LogLevel::LOG_INFO;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARNING;
    if (s == "ERROR") return LogLevel::LOG_ERROR;
    if (s == "FATAL") return LogLevel::LOG_FATAL;
    return std::nullopt;
}

/**
 * @class Logger
 * @brief Process-wide log sink
 *
 * Only the sink is shared; engine state never lives here. Output goes to a
 * timestamped file once initialize() succeeds and optionally to stdout.
 */
class Logger {
public:
    static Logger& instance() { static Logger l; return l; }

    bool initialize(const std::filesystem::path& dir, LogLevel level = LogLevel::LOG_INFO) {
        std::lock_guard<std::mutex> lock(mtx_);
        dir_ = dir; level_ = level;
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            std::cerr << "tierguard: cannot create log directory " << dir_ << ": " << ec.message() << "\n";
            return false;
        }
        openFile();
        init_ = file_.is_open();
        return init_;
    }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    void setConsoleOutput(bool enabled) { console_ = enabled; }

    void log(LogLevel level, const std::string& component, const std::string& message) {
        if (level < level_) return;
        std::lock_guard<std::mutex> lock(mtx_);
        std::string line = formatLine(level, component, message);
        if (init_ && file_.is_open()) { file_ << line << "\n"; file_.flush(); }
        if (console_) std::cout << line << "\n";
    }

    void trace(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_TRACE, comp, msg); }
    void debug(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_DEBUG, comp, msg); }
    void info(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_INFO, comp, msg); }
    void warning(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_WARNING, comp, msg); }
    void error(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_ERROR, comp, msg); }
    void fatal(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_FATAL, comp, msg); }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) {
            file_.flush();
            file_.close();
        }
        init_ = false;
    }

private:
    Logger() = default;
    ~Logger() { if (file_.is_open()) file_.close(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::tm localNow() {
        auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        return tm;
    }

    void openFile() {
        if (file_.is_open()) file_.close();
        std::tm tm = localNow();
        std::ostringstream fn;
        fn << "tierguard_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
        file_.open(dir_ / fn.str(), std::ios::app);
    }

    std::string formatLine(LogLevel level, const std::string& comp, const std::string& msg) {
        static const char* levels[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
        std::tm tm = localNow();
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " [" << levels[static_cast<int>(level)] << "] [" << comp << "] " << msg;
        return oss.str();
    }

    mutable std::mutex mtx_;
    std::filesystem::path dir_;
    std::ofstream file_;
    std::atomic<LogLevel> level_{LogLevel::LOG_INFO};
    bool init_ = false;
    std::atomic<bool> console_{false};
};

#define LOG_TRACE(comp, msg) tierguard::Logger::instance().trace(comp, msg)
#define LOG_DEBUG(comp, msg) tierguard::Logger::instance().debug(comp, msg)
#define LOG_INFO(comp, msg) tierguard::Logger::instance().info(comp, msg)
#define LOG_WARNING(comp, msg) tierguard::Logger::instance().warning(comp, msg)
#define LOG_ERROR(comp, msg) tierguard::Logger::instance().error(comp, msg)
#define LOG_FATAL(comp, msg) tierguard::Logger::instance().fatal(comp, msg)

} // namespace tierguard
#endif
