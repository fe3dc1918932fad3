/**
 * @file tg_config.hpp
 * @brief Engine configuration
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Plain key=value files, '#' starts a comment line. Unset keys keep their
 * defaults.
 */
#ifndef TIERGUARD_TG_CONFIG_HPP
#define TIERGUARD_TG_CONFIG_HPP

#include "tg_types.hpp"
#include "result.hpp"
#include "cancellation.hpp"
#include "tg_logger.hpp"
#include <map>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <vector>
#include <algorithm>

namespace tierguard {

/**
 * @struct EngineConfig
 * @brief Typed engine settings
 */
struct EngineConfig {
    // Storage
    std::string data_dir = "./tierguard_data";
    bool persist_state = true;

    // Logging
    std::string log_level = "INFO";
    bool log_to_console = false;
    bool log_to_file = true;

    // Workers and adapter calls
    int worker_threads = 4;
    int64_t adapter_timeout_ms = 5000;

    // Replication retry
    int replication_max_attempts = 3;
    int64_t replication_base_delay_ms = 50;
    double replication_backoff_multiplier = 2.0;
    int64_t replication_max_delay_ms = 2000;

    // Usage
    int64_t default_window_seconds = 3600;
    int64_t warm_state_max_age_seconds = 3600;

    // Events
    size_t event_history_limit = 1000;

    [[nodiscard]] std::filesystem::path stateDir() const { return std::filesystem::path(data_dir) / "state"; }
    [[nodiscard]] std::filesystem::path logDir() const { return std::filesystem::path(data_dir) / "logs"; }
    [[nodiscard]] Millis adapterTimeout() const { return Millis(adapter_timeout_ms); }
    [[nodiscard]] Seconds defaultWindow() const { return Seconds(default_window_seconds); }
    [[nodiscard]] Seconds warmStateMaxAge() const { return Seconds(warm_state_max_age_seconds); }

    [[nodiscard]] RetryPolicy retryPolicy() const {
        return RetryPolicy{static_cast<uint32_t>(std::max(1, replication_max_attempts)),
                           Millis(replication_base_delay_ms), replication_backoff_multiplier,
                           Millis(replication_max_delay_ms)};
    }

    /**
     * @brief Set one field from its textual form
     * @return CONFIG_PARSE_ERROR for unknown keys or unparsable values
     */
    Result<void> setFromString(const std::string& key, const std::string& value) {
        try {
            if (key == "data_dir") data_dir = value;
            else if (key == "persist_state") persist_state = parseBool(value);
            else if (key == "log_level") log_level = value;
            else if (key == "log_to_console") log_to_console = parseBool(value);
            else if (key == "log_to_file") log_to_file = parseBool(value);
            else if (key == "worker_threads") worker_threads = std::stoi(value);
            else if (key == "adapter_timeout_ms") adapter_timeout_ms = std::stoll(value);
            else if (key == "replication_max_attempts") replication_max_attempts = std::stoi(value);
            else if (key == "replication_base_delay_ms") replication_base_delay_ms = std::stoll(value);
            else if (key == "replication_backoff_multiplier") replication_backoff_multiplier = std::stod(value);
            else if (key == "replication_max_delay_ms") replication_max_delay_ms = std::stoll(value);
            else if (key == "default_window_seconds") default_window_seconds = std::stoll(value);
            else if (key == "warm_state_max_age_seconds") warm_state_max_age_seconds = std::stoll(value);
            else if (key == "event_history_limit") event_history_limit = std::stoull(value);
            else return Err(ErrorCode::CONFIG_PARSE_ERROR, "unknown key '" + key + "'");
        } catch (const std::exception& e) {
            return Err(ErrorCode::CONFIG_PARSE_ERROR, "bad value '" + value + "' for " + key + ": " + e.what());
        }
        return Ok();
    }

    [[nodiscard]] std::map<std::string, std::string> toMap() const {
        std::map<std::string, std::string> m;
        m["data_dir"] = data_dir;
        m["persist_state"] = persist_state ? "true" : "false";
        m["log_level"] = log_level;
        m["log_to_console"] = log_to_console ? "true" : "false";
        m["log_to_file"] = log_to_file ? "true" : "false";
        m["worker_threads"] = std::to_string(worker_threads);
        m["adapter_timeout_ms"] = std::to_string(adapter_timeout_ms);
        m["replication_max_attempts"] = std::to_string(replication_max_attempts);
        m["replication_base_delay_ms"] = std::to_string(replication_base_delay_ms);
        std::ostringstream mult;
        mult << replication_backoff_multiplier;
        m["replication_backoff_multiplier"] = mult.str();
        m["replication_max_delay_ms"] = std::to_string(replication_max_delay_ms);
        m["default_window_seconds"] = std::to_string(default_window_seconds);
        m["warm_state_max_age_seconds"] = std::to_string(warm_state_max_age_seconds);
        m["event_history_limit"] = std::to_string(event_history_limit);
        return m;
    }

    [[nodiscard]] std::string toString() const {
        std::ostringstream oss;
        oss << "=== TierGuard Configuration ===\n"
            << "Data Directory: " << data_dir << "\n"
            << "Persist State: " << (persist_state ? "Yes" : "No") << "\n"
            << "Log Level: " << log_level << "\n"
            << "Worker Threads: " << worker_threads << "\n"
            << "Adapter Timeout: " << adapter_timeout_ms << " ms\n"
            << "Replication Retry: " << replication_max_attempts << " attempts, "
            << replication_base_delay_ms << " ms base, x" << replication_backoff_multiplier
            << ", cap " << replication_max_delay_ms << " ms\n"
            << "Default Window: " << default_window_seconds << " s\n"
            << "Warm State Max Age: " << warm_state_max_age_seconds << " s\n";
        return oss.str();
    }

private:
    static bool parseBool(const std::string& s) {
        std::string lower = s;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
        throw std::invalid_argument("not a boolean");
    }
};

/**
 * @class EngineConfigValidator
 * @brief Cross-field checks on an EngineConfig
 */
class EngineConfigValidator {
public:
    struct ValidationError {
        std::string field;
        std::string message;
    };

    /// Lists every bad field in the error message
    [[nodiscard]] static Result<void> validate(const EngineConfig& config) {
        std::vector<ValidationError> errors;

        if (config.data_dir.empty()) errors.push_back({"data_dir", "Must not be empty"});
        if (config.worker_threads <= 0) errors.push_back({"worker_threads", "Must be positive"});
        if (config.adapter_timeout_ms <= 0) errors.push_back({"adapter_timeout_ms", "Must be positive"});
        if (config.replication_max_attempts <= 0)
            errors.push_back({"replication_max_attempts", "Must be positive"});
        if (config.replication_base_delay_ms < 0)
            errors.push_back({"replication_base_delay_ms", "Must not be negative"});
        if (config.replication_backoff_multiplier < 1.0)
            errors.push_back({"replication_backoff_multiplier", "Must be at least 1.0"});
        if (config.replication_max_delay_ms < config.replication_base_delay_ms)
            errors.push_back({"replication_max_delay_ms", "Must not be below replication_base_delay_ms"});
        if (config.default_window_seconds <= 0) errors.push_back({"default_window_seconds", "Must be positive"});
        if (config.warm_state_max_age_seconds < 0)
            errors.push_back({"warm_state_max_age_seconds", "Must not be negative"});
        if (config.event_history_limit == 0) errors.push_back({"event_history_limit", "Must be greater than 0"});
        if (!logLevelFromString(config.log_level))
            errors.push_back({"log_level", "Invalid log level: " + config.log_level});

        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "Configuration validation failed:\n";
            for (const auto& err : errors) oss << "  - " << err.field << ": " << err.message << "\n";
            return Err(ErrorCode::CONFIG_INVALID, oss.str());
        }
        return Ok();
    }
};

/**
 * @class EngineConfigLoader
 * @brief Reads and writes configuration files
 */
class EngineConfigLoader {
public:
    /// Start from defaults and apply every key in the file
    static Result<EngineConfig> loadFromFile(const std::filesystem::path& filepath) {
        EngineConfig config;
        std::ifstream file(filepath);
        if (!file) return Err<EngineConfig>(ErrorCode::NOT_FOUND, "cannot open " + filepath.string());
        std::string line;
        int lineno = 0;
        while (std::getline(file, line)) {
            ++lineno;
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) {
                return Err<EngineConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                    filepath.filename().string() + ":" + std::to_string(lineno) + ": expected key=value");
            }
            auto applied = config.setFromString(trim(line.substr(0, pos)), trim(line.substr(pos + 1)));
            if (!applied) {
                Error err = applied.error();
                err.context = filepath.filename().string() + ":" + std::to_string(lineno);
                return Err<EngineConfig>(err);
            }
        }
        LOG_INFO("Config", "Loaded configuration from " + filepath.string());
        return config;
    }

    static Result<void> saveToFile(const EngineConfig& config, const std::filesystem::path& filepath) {
        std::ofstream file(filepath);
        if (!file) return Err(ErrorCode::IO_ERROR, "cannot write " + filepath.string());
        file << "# TierGuard Configuration v" << VERSION << "\n\n";
        for (const auto& [k, v] : config.toMap()) file << k << "=" << v << "\n";
        if (!file) return Err(ErrorCode::IO_ERROR, "write to " + filepath.string() + " failed");
        return Ok();
    }

private:
    static std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        auto end = s.find_last_not_of(" \t\r\n");
        return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
    }
};

} // namespace tierguard
#endif
