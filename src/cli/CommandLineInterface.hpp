/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for quad-fetch
 */

#pragma once

#include "quadfetch.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ConfigurationManager.hpp"
#include <iostream>
#include <string>

namespace quadfetch {

/**
 * @brief Parses arguments and assembles the validated FetchConfig
 *
 * Settings come from, in increasing precedence: built-in defaults, the
 * configuration file (--config, or quadfetch.conf when present), QUADFETCH_*
 * environment variables, and command-line flags.
 */
class CommandLineInterface {
public:
    static constexpr const char* DEFAULT_CONFIG_FILE = "quadfetch.conf";

    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if a run should proceed; false on error or when an
     *         informational flag was handled (see should_exit_cleanly())
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Get the parsed configuration
     * @return FetchConfig object
     */
    const FetchConfig& get_config() const { return config_; }

    /**
     * @brief Check if this is a dry run
     * @return true if dry run mode is enabled
     */
    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief True after --help or --create-config; the caller exits with status 0
     */
    bool should_exit_cleanly() const { return exit_cleanly_; }

    /**
     * @brief Print the current configuration
     */
    void print_config(std::ostream& out = std::cout) const;

    void set_error_stream(std::ostream& err) { err_ = &err; }

private:
    FetchConfig config_;
    bool dry_run_ = false;
    bool exit_cleanly_ = false;
    std::ostream* err_ = &std::cerr;

    bool load_config_file(ConfigurationManager& manager, const SimpleCommandLineParser& parser);
    bool apply_overrides(ConfigurationManager& manager, const SimpleCommandLineParser& parser);
};

} // namespace quadfetch
