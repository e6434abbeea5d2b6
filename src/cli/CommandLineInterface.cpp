/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/InputValidator.hpp"
#include <filesystem>

namespace quadfetch {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("quad-fetch",
        "Download every imagery quad covering a region from the tile catalog\n"
        "\n"
        "Lists matching collections, walks each collection's paginated quad\n"
        "listing for the region's bounding box (cached between runs), and\n"
        "downloads each quad once into <output>/<collection>/.");

    parser.add_option("config", "c", "Configuration file (default: quadfetch.conf if present)");
    parser.add_option("log-level", "l", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE;\n"
                                        "                                   per component: \"3,CatalogWalker=5\"");
    parser.add_option("max-collections", "n", "Process at most N matching collections (0 = all)");
    parser.add_option("bbox", "b", "Region as min_x,min_y,max_x,max_y (overrides region_file)");
    parser.add_option("output", "o", "Output directory");
    parser.add_option("concurrency", "j", "Simultaneous downloads per collection");
    parser.add_option("create-config", "", "Write a configuration file with current settings and exit");
    parser.add_flag("dry-run", "", "Validate configuration and resolve the region without downloading");

    exit_cleanly_ = false;
    if (!parser.parse(argc, argv, *err_)) {
        exit_cleanly_ = parser.help_requested();
        return false;
    }

    ConfigurationManager manager;
    if (!load_config_file(manager, parser)) {
        return false;
    }
    manager.apply_environment();
    if (!apply_overrides(manager, parser)) {
        return false;
    }

    try {
        config_ = manager.to_fetch_config();
    } catch (const FetchError& e) {
        *err_ << "Invalid configuration: " << e.what() << std::endl;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        ConfigurationManager defaults;
        defaults.from_fetch_config(config_);
        if (!defaults.save_to_file(config_path.value())) {
            *err_ << "Failed to write configuration file: " << config_path.value() << std::endl;
            return false;
        }
        std::cout << "Created configuration file: " << config_path.value() << std::endl;
        exit_cleanly_ = true;
        return false;
    }

    dry_run_ = parser.get_flag("dry-run");

    InputValidator validator;
    ValidationResult result = validator.validate(config_);
    if (result.has_errors()) {
        *err_ << result.format_error_message();
        return false;
    }

    return true;
}

bool CommandLineInterface::load_config_file(ConfigurationManager& manager,
                                            const SimpleCommandLineParser& parser) {
    if (auto config_file = parser.get("config")) {
        if (!manager.load_from_file(config_file.value())) {
            *err_ << "Failed to load configuration file: " << config_file.value() << std::endl;
            return false;
        }
        return true;
    }

    std::error_code ec;
    if (std::filesystem::exists(DEFAULT_CONFIG_FILE, ec)) {
        if (!manager.load_from_file(DEFAULT_CONFIG_FILE)) {
            *err_ << "Failed to load configuration file: " << DEFAULT_CONFIG_FILE << std::endl;
            return false;
        }
    }
    return true;
}

bool CommandLineInterface::apply_overrides(ConfigurationManager& manager,
                                           const SimpleCommandLineParser& parser) {
    if (auto level = parser.get("log-level")) {
        manager.set_value("log_level", level.value());
    }
    if (auto bbox = parser.get("bbox")) {
        manager.set_value("bbox", bbox.value());
    }
    if (auto output = parser.get("output")) {
        manager.set_value("output_directory", output.value());
    }

    if (parser.get("max-collections")) {
        auto count = parser.get_as<int>("max-collections");
        if (!count) {
            *err_ << "--max-collections requires an integer" << std::endl;
            return false;
        }
        manager.set_value("max_collections", std::to_string(*count));
    }
    if (parser.get("concurrency")) {
        auto count = parser.get_as<int>("concurrency");
        if (!count) {
            *err_ << "--concurrency requires an integer" << std::endl;
            return false;
        }
        manager.set_value("concurrency", std::to_string(*count));
    }
    return true;
}

void CommandLineInterface::print_config(std::ostream& out) const {
    out << "\n=== Configuration ===\n";
    out << "Catalog: " << config_.api_base_url << " (collections named '"
        << config_.collection_prefix << "*')\n";
    if (config_.bbox) {
        out << "Region: bbox " << config_.bbox->to_query_string() << "\n";
    } else {
        out << "Region: " << config_.region_file << "\n";
    }
    out << "Output directory: " << config_.output_directory << "\n";
    out << "Cache file: " << config_.resolved_cache_file() << "\n";
    out << "Log directory: " << config_.log_directory << "\n";
    out << "Concurrency: " << config_.concurrency << "\n";
    out << "Page size: " << config_.page_size << "\n";
    out << "Timeouts: " << config_.request_timeout_seconds << "s request, "
        << config_.download_timeout_seconds << "s download\n";
    out << "Max collections: "
        << (config_.max_collections > 0 ? std::to_string(config_.max_collections) : std::string("all"))
        << "\n";
    out << "API key: " << (config_.api_key.empty() ? "missing" : "loaded") << "\n";
    out << "===================\n\n";
}

} // namespace quadfetch
