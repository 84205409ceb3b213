#include "config/config_loader.hpp"
#include "core/gatekeeper.hpp"
#include "core/utils.hpp"
#include "server/line_protocol.hpp"

#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <string_view>

using namespace sqlgate;

namespace {

void signal_handler(int) {
    // Closing stdin ends the read loop; shutdown then runs on the main thread
    ::close(STDIN_FILENO);
}

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [-c config.toml] [--check-config]\n"
        "  -c, --config PATH   configuration file (default config/gatekeeper.toml)\n"
        "      --check-config  validate the configuration and exit\n"
        "  -h, --help          show this help\n", prog);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config/gatekeeper.toml";
    bool check_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--check-config") {
            check_only = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }
        for (const auto& warning : ConfigLoader::security_warnings(cfg)) {
            utils::log::warn(std::format("Config: {}", warning));
        }

        if (check_only) {
            utils::log::info(std::format("Configuration OK: database {}",
                ConfigLoader::redact_conninfo(cfg.database.connection_string)));
            return 0;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utils::log::info("[2/3] Starting gatekeeper");
        Gatekeeper gatekeeper(cfg);
        LineProtocolHandler handler(gatekeeper);

        utils::log::info("[3/3] Reading requests from stdin");
        std::string line;
        while (std::getline(std::cin, line)) {
            if (utils::trim(line).empty()) {
                continue;
            }
            std::cout << handler.handle_line(line) << '\n' << std::flush;
        }

        utils::log::info("Input closed, shutting down");
        gatekeeper.shutdown();

    } catch (const ConfigurationError& e) {
        utils::log::error(std::format("Configuration error: {}", e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
