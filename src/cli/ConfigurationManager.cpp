/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for QuadFetch
 */

#include "ConfigurationManager.hpp"
#include "../core/RegionLoader.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace quadfetch {

namespace {

// Environment variable -> configuration key
const std::pair<const char*, const char*> kEnvironmentKeys[] = {
    {"QUADFETCH_OUTPUT_DIR", "output_directory"},
    {"QUADFETCH_LOG_DIR", "log_directory"},
    {"QUADFETCH_API_KEY", "api_key"},
    {"QUADFETCH_API_KEY_FILE", "api_key_file"},
    {"QUADFETCH_REGION_FILE", "region_file"},
    {"QUADFETCH_BBOX", "bbox"},
    {"QUADFETCH_CONCURRENCY", "concurrency"},
    {"QUADFETCH_LOG_LEVEL", "log_level"},
};

void trim_in_place(std::string& value) {
    value.erase(0, value.find_first_not_of(" \t\r\n"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // Simple key=value parser
    std::string line;
    while (std::getline(file, line)) {
        trim_in_place(line);
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        trim_in_place(key);
        trim_in_place(value);

        config_values_[key] = value;
    }

    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# QuadFetch Configuration" << std::endl;
    file << "# Generated automatically" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        if (key == "api_key") {
            continue;
        }
        file << key << "=" << value << std::endl;
    }

    return file.good();
}

void ConfigurationManager::apply_environment() {
    apply_environment([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

void ConfigurationManager::apply_environment(const EnvironmentLookup& lookup) {
    for (const auto& [variable, key] : kEnvironmentKeys) {
        if (auto value = lookup(variable)) {
            trim_in_place(*value);
            if (!value->empty()) {
                config_values_[key] = *value;
            }
        }
    }
}

std::optional<std::string> ConfigurationManager::read_api_key_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    std::string key = contents.str();
    trim_in_place(key);
    return key;
}

int ConfigurationManager::require_int(const std::string& key, int default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end() || it->second.empty()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed == it->second.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    throw FetchError(ErrorKind::CONFIGURATION, key + " must be an integer, got '" + it->second + "'");
}

RetryPolicy ConfigurationManager::read_retry_policy(const std::string& prefix, RetryPolicy policy) const {
    policy.max_attempts = require_int(prefix + "_attempts", policy.max_attempts);
    policy.base_delay = std::chrono::milliseconds(
        require_int(prefix + "_delay_ms", static_cast<int>(policy.base_delay.count())));

    if (has_value(prefix + "_backoff")) {
        const std::string mode = get_string(prefix + "_backoff");
        if (mode == "constant") {
            policy.backoff = BackoffMode::CONSTANT;
        } else if (mode == "exponential") {
            policy.backoff = BackoffMode::EXPONENTIAL;
        } else {
            throw FetchError(ErrorKind::CONFIGURATION,
                             prefix + "_backoff must be 'constant' or 'exponential', got '" + mode + "'");
        }
    }
    return policy;
}

FetchConfig ConfigurationManager::to_fetch_config() const {
    FetchConfig config;

    config.api_base_url = get_string("api_base_url", config.api_base_url);
    config.collection_prefix = get_string("collection_prefix", config.collection_prefix);
    config.api_key_file = get_string("api_key_file", config.api_key_file);
    config.api_key = get_string("api_key");
    if (config.api_key.empty() && !config.api_key_file.empty()) {
        if (auto key = read_api_key_file(config.api_key_file)) {
            config.api_key = *key;
        }
    }

    // Parse bounds as min_x,min_y,max_x,max_y
    if (has_value("bbox") && !get_string("bbox").empty()) {
        auto bbox = RegionLoader::parse_bbox(get_string("bbox"));
        if (!bbox) {
            throw FetchError(ErrorKind::CONFIGURATION,
                             "bbox must be min_x,min_y,max_x,max_y with min <= max, got '" +
                             get_string("bbox") + "'");
        }
        config.bbox = *bbox;
    }
    config.region_file = get_string("region_file", config.region_file);

    config.output_directory = get_string("output_directory", config.output_directory);
    config.log_directory = get_string("log_directory", config.log_directory);
    config.cache_file = get_string("cache_file", config.cache_file);

    config.page_size = require_int("page_size", config.page_size);
    config.concurrency = require_int("concurrency", config.concurrency);
    config.request_timeout_seconds = require_int("request_timeout_seconds", config.request_timeout_seconds);
    config.download_timeout_seconds = require_int("download_timeout_seconds", config.download_timeout_seconds);
    config.catalog_retry = read_retry_policy("catalog_retry", config.catalog_retry);
    config.page_retry = read_retry_policy("page_retry", config.page_retry);

    config.max_collections = require_int("max_collections", config.max_collections);
    config.log_config = get_string("log_level", config.log_config);

    return config;
}

void ConfigurationManager::from_fetch_config(const FetchConfig& config) {
    set_value("api_base_url", config.api_base_url);
    set_value("collection_prefix", config.collection_prefix);
    set_value("api_key_file", config.api_key_file);
    if (config.bbox) {
        set_value("bbox", config.bbox->to_query_string());
    }
    set_value("region_file", config.region_file);
    set_value("output_directory", config.output_directory);
    set_value("log_directory", config.log_directory);
    if (!config.cache_file.empty()) {
        set_value("cache_file", config.cache_file);
    }
    set_value("page_size", std::to_string(config.page_size));
    set_value("concurrency", std::to_string(config.concurrency));
    set_value("request_timeout_seconds", std::to_string(config.request_timeout_seconds));
    set_value("download_timeout_seconds", std::to_string(config.download_timeout_seconds));

    auto store_policy = [this](const std::string& prefix, const RetryPolicy& policy) {
        set_value(prefix + "_attempts", std::to_string(policy.max_attempts));
        set_value(prefix + "_delay_ms", std::to_string(policy.base_delay.count()));
        set_value(prefix + "_backoff",
                  policy.backoff == BackoffMode::CONSTANT ? "constant" : "exponential");
    };
    store_policy("catalog_retry", config.catalog_retry);
    store_policy("page_retry", config.page_retry);

    set_value("max_collections", std::to_string(config.max_collections));
    set_value("log_level", config.log_config);
}

} // namespace quadfetch
