/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace quadfetch {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;

std::unique_ptr<std::ofstream> Logger::file_stream_;
bool Logger::console_enabled_ = true;
std::mutex Logger::output_mutex_;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::optional<LogLevel> parse_level(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const int level_int = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<LogLevel>(std::clamp(level_int, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

Logger::Logger() = default;

Logger::Logger(const std::string& component_name)
    : component_name_(component_name) {
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (!shouldOutput(level)) {
        return;
    }

    const std::string line = formatLine(level, component_name_, message);

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (console_enabled_) {
        std::cout << line << '\n';
    }
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line << '\n';
        if (level <= LogLevel::WARNING) {
            file_stream_->flush();
        }
    }
}

std::string Logger::formatLine(LogLevel level, const std::string& component,
                               const std::string& message) {
    // YYYY-MM-DD HH:MM:SS,mmm - LEVEL - [Component] message
    const auto now = std::chrono::system_clock::now();
    const auto time_t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);
    char timestamp[48];
    std::snprintf(timestamp, sizeof(timestamp), "%04d-%02d-%02d %02d:%02d:%02d,%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));

    std::string line = std::string(timestamp) + " - " + levelName(level) + " - ";
    if (!component.empty()) {
        line += "[" + component + "] ";
    }
    line += message;
    return line;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAILED";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "LOG";
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (instance_level_.has_value()) {
        return *instance_level_;
    }

    return default_level_;
}

// ============================================================================
// Process-wide control
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getDefaultLevel() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::parseLogConfig(const std::string& config) {
    bool all_valid = true;

    std::stringstream ss(config);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) {
            continue;
        }

        const auto equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            auto level = parse_level(token);
            if (level) {
                setDefaultLevel(*level);
            } else {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
                all_valid = false;
            }
            continue;
        }

        const std::string facility = trim(token.substr(0, equals_pos));
        const std::string level_str = trim(token.substr(equals_pos + 1));
        auto level = parse_level(level_str);
        if (!level || facility.empty()) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            all_valid = false;
            continue;
        }

        if (facility == "default") {
            setDefaultLevel(*level);
        } else {
            setFacilityLevel(facility, *level);
        }
    }

    return all_valid;
}

bool Logger::setSharedLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (file_stream_) {
        file_stream_->flush();
        file_stream_.reset();
    }

    if (!log_file.has_value()) {
        return true;
    }

    std::error_code ec;
    const std::filesystem::path log_path(*log_file);
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    auto stream = std::make_unique<std::ofstream>(*log_file, std::ios::app);
    if (!stream->is_open()) {
        // Not routed through outputMessage: we hold the output lock
        std::cerr << "Warning: Failed to open log file: " << *log_file << std::endl;
        return false;
    }
    file_stream_ = std::move(stream);
    return true;
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    console_enabled_ = enabled;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

} // namespace quadfetch
