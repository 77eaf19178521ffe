// =============================================================================
// Civil Time - Command Line Argument Parser
// Version: 1.2.0
// =============================================================================

#pragma once

#include "civil/common/types.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>

namespace civil::cli {

/**
 * @brief Command-line argument parser
 *
 * Supports long options (--name, --name=value), short options (-n value),
 * boolean flags and generated help. Options may be given at most once.
 */
class ArgParser {
public:
    struct Option {
        String long_name;
        char short_name = 0;
        String description;
        String default_value;
        bool is_flag = false;
        bool required = false;
    };

    explicit ArgParser(String program_name = "", String description = "")
        : program_name_(std::move(program_name)), description_(std::move(description)) {}

    /**
     * @brief Add an option taking a value
     */
    ArgParser& add_option(const String& long_name,
                          char short_name = 0,
                          const String& description = "",
                          const String& default_value = "",
                          bool required = false) {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.default_value = default_value;
        opt.required = required;
        options_.push_back(std::move(opt));
        return *this;
    }

    /**
     * @brief Add a boolean flag
     */
    ArgParser& add_flag(const String& long_name,
                        char short_name = 0,
                        const String& description = "") {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.is_flag = true;
        options_.push_back(std::move(opt));
        return *this;
    }

    /**
     * @brief Parse command-line arguments
     * @return true if parsing succeeded; false on error or when help was shown
     */
    bool parse(int argc, char* argv[]) {
        if (argc > 0 && program_name_.empty()) {
            program_name_ = argv[0];
        }

        for (const auto& opt : options_) {
            if (!opt.default_value.empty()) {
                values_[opt.long_name] = opt.default_value;
            }
        }

        for (int i = 1; i < argc; ++i) {
            String arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                help_requested_ = true;
                show_help();
                return false;
            }

            String name;
            String value;
            bool has_value = false;
            const Option* opt = nullptr;

            if (arg.starts_with("--")) {
                auto eq_pos = arg.find('=');
                if (eq_pos != String::npos) {
                    name = arg.substr(2, eq_pos - 2);
                    value = arg.substr(eq_pos + 1);
                    has_value = true;
                } else {
                    name = arg.substr(2);
                }
                opt = find_option(name);
                if (!opt) {
                    error_ = "Unknown option: --" + name;
                    return false;
                }
            } else if (arg.size() == 2 && arg[0] == '-') {
                opt = find_option(arg[1]);
                if (!opt) {
                    error_ = "Unknown option: " + arg;
                    return false;
                }
            } else {
                error_ = "Unexpected argument: " + arg;
                return false;
            }

            if (!seen_.insert(opt->long_name).second) {
                error_ = "Option --" + opt->long_name + " given more than once";
                return false;
            }

            if (opt->is_flag) {
                if (has_value) {
                    error_ = "Flag --" + opt->long_name + " does not take a value";
                    return false;
                }
                flags_[opt->long_name] = true;
                continue;
            }

            if (!has_value) {
                if (i + 1 >= argc) {
                    error_ = "Option --" + opt->long_name + " requires a value";
                    return false;
                }
                value = argv[++i];
            }
            values_[opt->long_name] = value;
        }

        for (const auto& opt : options_) {
            if (opt.required && values_.find(opt.long_name) == values_.end()) {
                error_ = "Required option missing: --" + opt.long_name;
                return false;
            }
        }

        return true;
    }

    /**
     * @brief Get option value if given or defaulted
     */
    [[nodiscard]] Optional<String> get(const String& name) const {
        auto it = values_.find(name);
        if (it != values_.end()) {
            return it->second;
        }
        return nullopt;
    }

    /**
     * @brief Get integer option value
     * @return nullopt when absent or not an integer
     */
    [[nodiscard]] Optional<Int64> get_int(const String& name) const {
        auto str = get(name);
        if (!str) return nullopt;
        Int64 result = 0;
        const char* last = str->data() + str->size();
        auto [ptr, ec] = std::from_chars(str->data(), last, result);
        if (ec != std::errc{} || ptr != last) return nullopt;
        return result;
    }

    [[nodiscard]] bool has(const String& name) const {
        return values_.find(name) != values_.end();
    }

    [[nodiscard]] bool flag(const String& name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    [[nodiscard]] const String& error() const { return error_; }
    [[nodiscard]] bool help_requested() const { return help_requested_; }

    /**
     * @brief Write usage and option descriptions
     */
    void show_help(std::ostream& out = std::cout) const {
        out << "Usage: " << program_name_;
        for (const auto& opt : options_) {
            if (opt.is_flag) {
                out << " [--" << opt.long_name << "]";
            } else if (opt.required) {
                out << " --" << opt.long_name << "=<value>";
            } else {
                out << " [--" << opt.long_name << "=<value>]";
            }
        }
        out << "\n\n";

        if (!description_.empty()) {
            out << description_ << "\n\n";
        }

        out << "Options:\n";
        for (const auto& opt : options_) {
            out << "  ";
            if (opt.short_name) {
                out << "-" << opt.short_name << ", ";
            } else {
                out << "    ";
            }
            out << "--" << std::left << std::setw(20) << opt.long_name << opt.description;
            if (!opt.default_value.empty()) {
                out << " [default: " << opt.default_value << "]";
            }
            if (opt.required) {
                out << " (required)";
            }
            out << "\n";
        }
        out << "  -h, --help                Show this help message\n";
    }

private:
    const Option* find_option(const String& name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    const Option* find_option(char short_name) const {
        for (const auto& opt : options_) {
            if (opt.short_name == short_name) return &opt;
        }
        return nullptr;
    }

    String program_name_;
    String description_;
    Vector<Option> options_;

    std::map<String, String> values_;
    std::map<String, bool> flags_;
    std::set<String> seen_;
    String error_;
    bool help_requested_ = false;
};

} // namespace civil::cli
