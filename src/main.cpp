/**
 * @file main.cpp
 * @brief Main entry point for quad-fetch
 *
 * Resolves the region, then lists and downloads every matching imagery
 * quad, resuming from the tile cache and files already on disk.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "quadfetch.hpp"
#include "core/HttpClient.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/RegionLoader.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/FetchOrchestrator.hpp"
#include <iostream>
#include <filesystem>

using namespace quadfetch;

/**
 * @brief Apply log levels and open the shared log file
 */
bool configure_logging(const FetchConfig& config) {
    if (!Logger::parseLogConfig(config.log_config)) {
        std::cerr << "Warning: could not fully parse log level '" << config.log_config << "'\n";
    }

    std::error_code ec;
    std::filesystem::create_directories(config.log_directory, ec);
    if (ec) {
        std::cerr << "Error: cannot create log directory " << config.log_directory
                  << ": " << ec.message() << "\n";
        return false;
    }

    const auto log_file = std::filesystem::path(config.log_directory) / "quadfetch.log";
    if (!Logger::setSharedLogFile(log_file.string())) {
        std::cerr << "Error: cannot open log file " << log_file.string() << "\n";
        return false;
    }
    return true;
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.should_exit_cleanly() ? 0 : 1;
        }
        const FetchConfig& config = cli.get_config();

        if (!configure_logging(config)) {
            return 1;
        }
        Logger logger("main");

        if (Logger::getDefaultLevel() >= LogLevel::DETAILED) {
            cli.print_config();
        }

        BoundingBox bbox;
        try {
            RegionLoader region_loader;
            bbox = region_loader.resolve(config);
        } catch (const FetchError& e) {
            logger.error(std::string("Could not resolve region: ") + e.what());
            return 1;
        }

        InputValidator validator;
        ValidationResult region_check = validator.validate_region(bbox);
        if (region_check.has_errors()) {
            std::cerr << region_check.format_error_message();
            return 1;
        }

        if (cli.is_dry_run()) {
            std::cout << "Region bounding box: " << bbox.to_query_string() << "\n";
            std::cout << "Dry run mode - configuration validated successfully\n";
            return 0;
        }

        std::error_code ec;
        std::filesystem::create_directories(config.output_directory, ec);
        if (ec) {
            logger.error("Cannot create output directory " + config.output_directory + ": " +
                         ec.message());
            return 1;
        }

        CurlTransport transport;
        FetchOrchestrator orchestrator(config, transport);
        if (!orchestrator.run(bbox)) {
            logger.error("Run aborted: the collection listing could not be retrieved");
            Logger::flush();
            return 1;
        }

        Logger::flush();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        Logger::flush();
        return 1;
    }
}
