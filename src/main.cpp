#include "carlink/core/config.hpp"
#include "carlink/core/logger.hpp"
#include "carlink/relay/relay_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace carlink;

namespace {

std::atomic<bool> g_shutdown{false};

void onSignal(int) {
    g_shutdown = true;
}

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> log_level;
    bool help = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config <file>] [--port <n>] [--host <addr>]"
                 " [--log-level debug|info|warn|error]" << std::endl;
}

core::Result<Options> parseArgs(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
            continue;
        }

        if (i + 1 >= argc) {
            return {core::ErrorCode::InvalidArgument, "Missing value for " + arg};
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--host") {
            options.host = value;
        } else if (arg == "--log-level") {
            options.log_level = value;
        } else if (arg == "--port") {
            try {
                size_t consumed = 0;
                int port = std::stoi(value, &consumed);
                if (consumed != value.size() || port < 0 || port > 65535) {
                    return {core::ErrorCode::InvalidArgument, "Invalid port: " + value};
                }
                options.port = port;
            } catch (const std::exception&) {
                return {core::ErrorCode::InvalidArgument, "Invalid port: " + value};
            }
        } else {
            return {core::ErrorCode::InvalidArgument, "Unknown option: " + arg};
        }
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parseArgs(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error().what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }
    const auto& options = parsed.value();
    if (options.help) {
        printUsage(argv[0]);
        return 0;
    }

    auto& config = core::config();
    if (options.config_path) {
        auto loaded = config.loadFromFile(*options.config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error().what() << std::endl;
            return 1;
        }
    }

    auto relay_config = relay::RelayConfig::fromConfig(config);
    if (relay_config.is_error()) {
        std::cerr << relay_config.error().what() << std::endl;
        return 1;
    }

    // Flag command line menimpa nilai dari file config
    auto settings = relay_config.value();
    if (options.host) settings.host = *options.host;
    if (options.port) settings.port = *options.port;
    if (options.log_level) settings.log_level = *options.log_level;

    auto level = core::logLevelFromString(settings.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << settings.log_level << std::endl;
        return 2;
    }
    core::Logger::setLevel(*level);

    core::Logger::info("Starting carlink relay");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto server = relay::RelayServer::create(settings);
    auto started = server->start();
    if (started.is_error()) {
        core::Logger::error("{}", started.error().what());
        return 1;
    }

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto stats = server->stats();
    core::Logger::info("Shutting down: {} connections, {} messages, {} forwarded, {} errors",
        stats.connections_accepted, stats.messages_received,
        stats.messages_forwarded, stats.errors);
    server->stop();
    return 0;
}
