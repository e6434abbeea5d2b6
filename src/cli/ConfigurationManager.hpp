/**
 * @file ConfigurationManager.hpp
 * @brief Configuration file and environment management for QuadFetch
 */

#pragma once

#include "quadfetch.hpp"
#include <functional>
#include <string>
#include <map>
#include <optional>

namespace quadfetch {

/**
 * @brief Configuration manager for loading and saving settings
 *
 * Values are kept as strings keyed by FetchConfig field name and converted
 * in to_fetch_config(). Precedence is file, then environment, then any
 * set_value() calls made afterwards (the command line).
 */
class ConfigurationManager {
public:
    /// Returns the value of an environment variable, if set
    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     *
     * The API key itself is never written; only api_key_file is.
     *
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Apply QUADFETCH_* overrides from the process environment
     */
    void apply_environment();
    void apply_environment(const EnvironmentLookup& lookup);

    /**
     * @brief Convert to FetchConfig, reading the API key file when no key is set
     * @throws FetchError CONFIGURATION for values that do not parse
     */
    FetchConfig to_fetch_config() const;

    /**
     * @brief Load from FetchConfig object
     */
    void from_fetch_config(const FetchConfig& config);

    /**
     * @brief Whitespace-trimmed contents of a key file
     * @return std::nullopt if the file cannot be read
     */
    static std::optional<std::string> read_api_key_file(const std::string& path);

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    int get_int(const std::string& key, int default_value = 0) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            try {
                return std::stoi(it->second);
            } catch (const std::exception&) {
                // Fall through to default
            }
        }
        return default_value;
    }

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            const std::string& value = it->second;
            return value == "true" || value == "1" || value == "yes";
        }
        return default_value;
    }

private:
    std::map<std::string, std::string> config_values_;

    int require_int(const std::string& key, int default_value) const;
    RetryPolicy read_retry_policy(const std::string& prefix, RetryPolicy policy) const;
};

} // namespace quadfetch
