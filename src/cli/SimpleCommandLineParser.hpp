/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser
 */

#pragma once

#include <cctype>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace quadfetch {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long, --long=value, -s value and boolean flags. A value that
 * starts with '-' followed by a digit (a negative coordinate) is taken as a
 * value, not as the next option.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse command line arguments
     * @return false on error or when help was shown (see help_requested())
     */
    bool parse(int argc, char* argv[], std::ostream& err = std::cerr, std::ostream& out = std::cout) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        // Store all arguments
        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help(out);
                return false;
            }
        }

        // Parse arguments
        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                if (options_.find(option_name) == options_.end()) {
                    err << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || is_option_token(args_[i + 1])) {
                            err << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    if (inline_value) {
                        err << "Option --" << option_name << " does not take a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = "true";
                }

            } else if (is_option_token(arg)) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    err << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || is_option_token(args_[i + 1])) {
                        err << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }

        // Check required options
        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                err << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        // Set default values
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help(std::ostream& out = std::cout) const {
        out << description_ << "\n\n";

        out << "USAGE:\n";
        out << "    " << program_name_ << " [OPTIONS]\n\n";

        out << "OPTIONS:\n";
        for (const auto& name : order_) {
            print_help_section(out, name);
        }
        out << "    -h, --help                     Show this help\n\n";

        out << "ENVIRONMENT:\n";
        out << "    QUADFETCH_API_KEY, QUADFETCH_API_KEY_FILE, QUADFETCH_BBOX,\n";
        out << "    QUADFETCH_REGION_FILE, QUADFETCH_OUTPUT_DIR, QUADFETCH_LOG_DIR,\n";
        out << "    QUADFETCH_CONCURRENCY, QUADFETCH_LOG_LEVEL\n\n";

        out << "EXAMPLES:\n";
        out << "    " << program_name_ << "\n";
        out << "    " << program_name_ << " --bbox -10.5,4.2,-9.8,5.0 --output tiles\n";
        out << "    " << program_name_ << " --config survey.conf --log-level 3,CatalogWalker=5\n";
    }

private:
    static bool is_option_token(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-') {
            return false;
        }
        const unsigned char next = static_cast<unsigned char>(arg[1]);
        return !(std::isdigit(next) || next == '.');
    }

    void print_help_section(std::ostream& out, const std::string& option_name) const {
        auto it = options_.find(option_name);
        if (it == options_.end()) {
            return;
        }
        const auto& option = it->second;
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name;
        if (option.has_value) {
            flags += " VALUE";
        }
        out << "    " << flags;
        if (flags.size() < 31) {
            out << std::string(31 - flags.size(), ' ');
        } else {
            out << "  ";
        }
        out << option.description << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace quadfetch
