#include <iostream>
#include <string>
#include <vector>
#include "chunkwire/core/logger.hpp"
#include "chunkwire/core/config.hpp"
#include "chunkwire/core/cli.hpp"
#include "chunkwire/core/identity.hpp"
#include "chunkwire/core/utils.hpp"
#include "chunkwire/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    using namespace chunkwire::core;

    CommandLineParser parser("chunkwire");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = Config::instance();
    config.set_defaults();

    auto config_file = utils::FileUtils::expand_user(parser.get_option("config", "~/.chunkwire.conf"));
    if (utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Warning: could not read " << config_file.string() << "\n";
    }

    // command line wins over the config file
    if (parser.has_option("port")) {
        config.set("server.port", parser.get_option("port"));
    }
    if (parser.has_option("output")) {
        config.set("download.directory", parser.get_option("output"));
    }
    if (parser.has_option("peer-id")) {
        config.set("peer.id", parser.get_option("peer-id"));
    }

    auto log_level = parser.has_option("verbose") ?
        LogLevel::Debug : parse_log_level(config.get_string("log.level", "info"));
    Logger::initialize(config.get_string("log.file", "chunkwire.log"), log_level);

    if (!Identity::initialize()) {
        std::cerr << "Error: failed to initialize the crypto library\n";
        return 1;
    }

    LOG_INFO("chunkwire starting up");

    CommandRegistry command_registry;

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        LOG_INFO("{}", result.message);
    }

    Logger::shutdown();
    return result.exit_code;
}
