/**
 * @file InputValidator.hpp
 * @brief Validation of the assembled run configuration
 *
 * Validates settings before any network or filesystem work starts and
 * reports every problem at once, each with suggested fixes.
 */

#pragma once

#include "quadfetch.hpp"
#include <string>
#include <vector>
#include <optional>

namespace quadfetch {

/**
 * @brief Represents a parameter conflict detected in the configuration
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    void add(ParameterConflict conflict) {
        conflicts.push_back(std::move(conflict));
        is_valid = false;
    }

    std::string format_error_message() const;
};

/**
 * @brief Validates a FetchConfig and region bounds
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const FetchConfig& config) const;

    /**
     * @brief Validate a resolved region (min <= max on each axis, finite)
     */
    ValidationResult validate_region(const BoundingBox& bbox) const;

private:
    std::optional<ParameterConflict> check_bounding_box(const BoundingBox& bbox,
                                                        const std::string& source) const;

    std::optional<ParameterConflict> check_credentials(const FetchConfig& config) const;

    std::optional<ParameterConflict> check_endpoint(const FetchConfig& config) const;

    /**
     * @brief page_size, concurrency and both timeouts must be positive
     */
    std::vector<ParameterConflict> check_transfer_settings(const FetchConfig& config) const;

    std::optional<ParameterConflict> check_retry_policy(const RetryPolicy& policy,
                                                        const std::string& name) const;

    std::optional<ParameterConflict> check_output_locations(const FetchConfig& config) const;
};

} // namespace quadfetch
