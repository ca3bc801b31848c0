#include "chunkrelay/core/cli.hpp"
#include "chunkrelay/network/protocol.hpp"
#include <sodium.h>
#include <spdlog/version.h>
#include <iomanip>
#include <iostream>

namespace chunkrelay::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Read settings from a key=value file", true, "~/.chunkrelay.conf");
    add_option("", "verbose", "Log at debug level regardless of log.level");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    options_.push_back(Option{short_name, long_name, description, has_value, default_value});
}

const CommandLineParser::Option* CommandLineParser::find_option(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name || (!option.short_name.empty() && option.short_name == name)) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::take_value(const Option& option, const std::string& spelled,
                                   int& i, int argc, char* argv[]) {
    if (i + 1 >= argc) {
        error_ = "Option " + spelled + " requires a value";
        return false;
    }
    parsed_options_[option.long_name] = argv[++i];
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

            const Option* option = find_option(name);
            if (!option || option->long_name != name) {
                error_ = "Unknown option: --" + name;
                return false;
            }

            if (!option->has_value) {
                if (eq_pos != std::string::npos) {
                    error_ = "Option --" + name + " does not take a value";
                    return false;
                }
                parsed_options_[name] = "true";
            } else if (eq_pos != std::string::npos) {
                parsed_options_[name] = arg.substr(eq_pos + 1);
            } else if (!take_value(*option, "--" + name, i, argc, argv)) {
                return false;
            }
            continue;
        }

        // Bundled short flags: "-hv", or "-cfile" for a value option.
        for (std::size_t j = 1; j < arg.length(); ++j) {
            std::string short_name(1, arg[j]);
            const Option* option = find_option(short_name);
            if (!option || option->short_name != short_name) {
                error_ = "Unknown option: -" + short_name;
                return false;
            }

            if (!option->has_value) {
                parsed_options_[option->long_name] = "true";
                continue;
            }

            if (j + 1 < arg.length()) {
                parsed_options_[option->long_name] = arg.substr(j + 1);
            } else if (!take_value(*option, "-" + short_name, i, argc, argv)) {
                return false;
            }
            break;
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const Option* option = find_option(name);
    return option && parsed_options_.count(option->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const Option* option = find_option(name);
    if (!option) {
        return default_value;
    }

    auto it = parsed_options_.find(option->long_name);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << program_name_ << " moves a payload through a relay as budget-sized chunks.\n\n";
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& option : options_) {
        std::string spelled = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        spelled += "--" + option.long_name;
        if (option.has_value) {
            spelled += " <path>";
        }

        out << "  " << std::left << std::setw(24) << spelled << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }

    out << "\nExamples:\n";
    out << "  " << program_name_ << " budget 104857600       chunk length and count for 100 MiB\n";
    out << "  " << program_name_ << " digest report.pdf      SHA-256 the receiver will verify\n";
    out << "  " << program_name_ << " --verbose send report.pdf copy.pdf\n";
    out << "  " << program_name_ << " -c relay.conf checkpoints\n";
}

void CommandLineParser::print_help() const {
    print_help(std::cout);
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " 1.0.0 (wire protocol " << network::PROTOCOL_VERSION << ")\n";
    out << "libsodium " << sodium_version_string()
        << ", spdlog " << SPDLOG_VER_MAJOR << "." << SPDLOG_VER_MINOR << "." << SPDLOG_VER_PATCH << "\n";
}

void CommandLineParser::print_version() const {
    print_version(std::cout);
}

}
