/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "HttpClient.hpp"
#include <algorithm>
#include <sstream>
#include <cmath>

namespace quadfetch {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid configuration detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to invalid configuration.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const FetchConfig& config) const {
    ValidationResult result;

    if (config.bbox) {
        if (auto conflict = check_bounding_box(*config.bbox, "bbox")) {
            result.add(std::move(*conflict));
        }
    } else if (config.region_file.empty()) {
        ParameterConflict conflict;
        conflict.description = "No region of interest given";
        conflict.involved_params = {"bbox (unset)", "region_file (empty)"};
        conflict.suggestions = {
            "Set bbox=min_x,min_y,max_x,max_y",
            "Set region_file to a GeoJSON file describing the region"
        };
        result.add(std::move(conflict));
    }

    if (auto conflict = check_credentials(config)) {
        result.add(std::move(*conflict));
    }
    if (auto conflict = check_endpoint(config)) {
        result.add(std::move(*conflict));
    }
    for (auto& conflict : check_transfer_settings(config)) {
        result.add(std::move(conflict));
    }
    if (auto conflict = check_retry_policy(config.catalog_retry, "catalog_retry")) {
        result.add(std::move(*conflict));
    }
    if (auto conflict = check_retry_policy(config.page_retry, "page_retry")) {
        result.add(std::move(*conflict));
    }
    if (auto conflict = check_output_locations(config)) {
        result.add(std::move(*conflict));
    }

    if (config.max_collections < 0) {
        ParameterConflict conflict;
        conflict.description = "Collection limit is negative";
        conflict.involved_params = {"max_collections " + std::to_string(config.max_collections)};
        conflict.suggestions = {"Use max_collections=0 to process every matching collection"};
        result.add(std::move(conflict));
    }

    return result;
}

ValidationResult InputValidator::validate_region(const BoundingBox& bbox) const {
    ValidationResult result;
    if (auto conflict = check_bounding_box(bbox, "region")) {
        result.add(std::move(*conflict));
    }
    return result;
}

std::optional<ParameterConflict> InputValidator::check_bounding_box(
    const BoundingBox& bbox, const std::string& source) const {

    const bool finite = std::isfinite(bbox.min_x) && std::isfinite(bbox.min_y) &&
                        std::isfinite(bbox.max_x) && std::isfinite(bbox.max_y);
    if (finite && bbox.is_valid()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = finite ? "Bounding box minimum exceeds maximum"
                                  : "Bounding box has non-finite coordinates";
    conflict.involved_params = {source + " " + bbox.to_query_string()};
    if (bbox.min_x > bbox.max_x) {
        conflict.involved_params.push_back("min_x > max_x");
    }
    if (bbox.min_y > bbox.max_y) {
        conflict.involved_params.push_back("min_y > max_y");
    }

    if (finite) {
        BoundingBox swapped(std::min(bbox.min_x, bbox.max_x), std::min(bbox.min_y, bbox.max_y),
                            std::max(bbox.min_x, bbox.max_x), std::max(bbox.min_y, bbox.max_y));
        conflict.suggestions = {"Use bbox=" + swapped.to_query_string()};
    }
    conflict.suggestions.push_back("Order coordinates as min_x,min_y,max_x,max_y");
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_credentials(const FetchConfig& config) const {
    if (!config.api_key.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "No API key available";
    conflict.involved_params = {
        "api_key_file " + (config.api_key_file.empty() ? std::string("(unset)") : config.api_key_file),
        "QUADFETCH_API_KEY (unset)"
    };
    conflict.suggestions = {
        "Write the key to " + (config.api_key_file.empty() ? std::string("a key file") : config.api_key_file),
        "Set api_key_file in the configuration file",
        "Export QUADFETCH_API_KEY"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_endpoint(const FetchConfig& config) const {
    if (is_well_formed_url(config.api_base_url)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = config.api_base_url.empty() ? "Catalog URL is empty"
                                                       : "Catalog URL is not an http(s) URL";
    conflict.involved_params = {"api_base_url '" + config.api_base_url + "'"};
    conflict.suggestions = {"Use api_base_url=" + FetchConfig().api_base_url};
    return conflict;
}

std::vector<ParameterConflict> InputValidator::check_transfer_settings(const FetchConfig& config) const {
    std::vector<ParameterConflict> conflicts;

    auto require_positive = [&conflicts](int value, const std::string& name, int suggested) {
        if (value >= 1) {
            return;
        }
        ParameterConflict conflict;
        conflict.description = name + " must be at least 1";
        conflict.involved_params = {name + " " + std::to_string(value)};
        conflict.suggestions = {"Use " + name + "=" + std::to_string(suggested)};
        conflicts.push_back(std::move(conflict));
    };

    const FetchConfig defaults;
    require_positive(config.page_size, "page_size", defaults.page_size);
    require_positive(config.concurrency, "concurrency", defaults.concurrency);
    require_positive(config.request_timeout_seconds, "request_timeout_seconds",
                     defaults.request_timeout_seconds);
    require_positive(config.download_timeout_seconds, "download_timeout_seconds",
                     defaults.download_timeout_seconds);
    return conflicts;
}

std::optional<ParameterConflict> InputValidator::check_retry_policy(
    const RetryPolicy& policy, const std::string& name) const {

    if (policy.max_attempts >= 1 && policy.base_delay.count() >= 0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Retry policy " + name + " is unusable";
    conflict.involved_params = {
        name + "_attempts " + std::to_string(policy.max_attempts),
        name + "_delay_ms " + std::to_string(policy.base_delay.count())
    };
    conflict.suggestions = {
        "Allow at least one attempt",
        "Use a delay of zero or more milliseconds"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output_locations(const FetchConfig& config) const {
    if (!config.output_directory.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Output directory is empty";
    conflict.involved_params = {"output_directory ''"};
    conflict.suggestions = {"Use output_directory=output", "Pass --output DIR"};
    return conflict;
}

} // namespace quadfetch
