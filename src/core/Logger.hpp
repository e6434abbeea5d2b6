/**
 * @file Logger.hpp
 * @brief Centralized logging system with per-facility verbosity control
 *
 * Every component owns a Logger named after itself. All instances share one
 * console sink and one optional append-mode log file, and all output passes
 * through a single mutex so download workers never interleave lines.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace quadfetch {

/**
 * @brief Log levels
 *
 * Level 1: Errors (an operation failed)
 * Level 2: Warnings (a retry, a skipped item, a recovered fault)
 * Level 3: Information (run and collection progress)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (requests, cache hits)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

class Logger {
public:
    /**
     * @brief Logger without a facility name; uses the default level
     */
    Logger();

    /**
     * @brief Logger for a named facility (component)
     * @param component_name Name used for facility-level lookup and in each line
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Single point of output control for the whole program.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /**
     * @brief Pin this instance to a level, overriding the default (not facility overrides)
     */
    void setLogLevel(LogLevel level) { instance_level_ = level; }

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }
    void trace(const std::string& message) const { outputMessage(LogLevel::TRACE, message); }

    const std::string& componentName() const { return component_name_; }

    /**
     * @brief Effective level: facility override, then instance level, then default
     */
    LogLevel getEffectiveLevel() const;

    // ========================================================================
    // Process-wide control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getDefaultLevel();
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Parse and apply a log configuration string
     *
     * "5" sets the default to DEBUG; "CatalogWalker=6,TileDownloader=2" sets
     * facility levels; "3,CatalogWalker=6" mixes both; "default=4" is accepted
     * as a named default. Levels are clamped to 1..6.
     *
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Open (append) or close the shared log file
     * @return false if the file could not be opened
     */
    static bool setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Silence or restore console output (file output is unaffected)
     */
    static void setConsoleEnabled(bool enabled);

    /**
     * @brief Flush console and file sinks
     */
    static void flush();

    static std::string levelName(LogLevel level);

private:
    std::string component_name_;
    std::optional<LogLevel> instance_level_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    static std::unique_ptr<std::ofstream> file_stream_;
    static bool console_enabled_;
    static std::mutex output_mutex_;

    static std::string formatLine(LogLevel level, const std::string& component,
                                  const std::string& message);
};

} // namespace quadfetch
