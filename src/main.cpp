#include <iostream>
#include <string>
#include <vector>
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/cli.hpp"
#include "chunkrelay/core/utils.hpp"
#include "chunkrelay/core/command_registry.hpp"
#include "chunkrelay/crypto/random.hpp"

int main(int argc, char* argv[]) {
    chunkrelay::core::CommandLineParser parser("chunkrelay");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        chunkrelay::core::CommandRegistry().print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = chunkrelay::core::Config::instance();
    config.set_defaults();

    auto config_file = chunkrelay::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.chunkrelay.conf"));
    if (chunkrelay::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: could not read " << config_file.string() << "\n";
        }
    }

    auto log_level = parser.has_option("verbose") ?
        chunkrelay::core::LogLevel::Debug :
        chunkrelay::core::parse_log_level(config.get_string("log.level", "info"));
    chunkrelay::core::Logger::initialize(config.get_string("log.file", "chunkrelay.log"), log_level);

    if (!chunkrelay::crypto::SecureRandom::initialize()) {
        LOG_CRITICAL("libsodium failed to initialize");
        return 1;
    }

    chunkrelay::core::CommandRegistry command_registry;

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    const std::string& command = args[0];
    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help();
        }
    }

    chunkrelay::core::Logger::shutdown();
    return result.exit_code;
}
