#include "cloudless.h"
#include "config.h"
#include "logger.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

void install_signal_handlers() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

} // namespace

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config.json] [--port <port>] [--write-config]\n";
    std::cout << "  config.json:    Configuration file (default: ./config.json)\n";
    std::cout << "  --port <port>:  Override listen_port\n";
    std::cout << "  --write-config: Write the effective configuration back and exit\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << "                       # Defaults, port 8765\n";
    std::cout << "  " << program_name << " relay.json --port 9000 # Custom config and port\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = "config.json";
    int port_override = -1;
    bool write_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--port") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            try {
                port_override = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
            continue;
        }
        if (arg == "--write-config") {
            write_config = true;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
        config_path = arg;
    }

    cloudless::ServerConfig config;
    if (!cloudless::load_server_config(config_path, config)) {
        LOG_MAIN_ERROR("Cannot use configuration " << config_path);
        return 1;
    }
    if (port_override >= 0) {
        config.listen_port = port_override;
    }

    if (write_config) {
        if (!cloudless::save_server_config(config_path, config)) {
            return 1;
        }
        LOG_MAIN_INFO("Wrote configuration to " << config_path);
        return 0;
    }

    cloudless::LogLevel level = cloudless::LogLevel::INFO;
    if (cloudless::parse_log_level(config.log_level, level)) {
        cloudless::Logger::getInstance().set_log_level(level);
    }
    if (!config.log_file.empty() && !cloudless::Logger::getInstance().set_log_file(config.log_file)) {
        LOG_MAIN_WARN("Could not open log file " << config.log_file << ", logging to console only");
    }

    if (config.tokens.empty()) {
        LOG_MAIN_WARN("No tokens configured: every realtime connection will be rejected");
    }

    install_signal_handlers();

    LOG_MAIN_INFO("=== Cloudless relay ===");
    cloudless::CloudlessServer server(config);
    if (!server.start()) {
        LOG_MAIN_ERROR("Failed to start the relay on port " << config.listen_port);
        return 1;
    }

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_MAIN_INFO("Shutdown requested");
    server.stop();
    return 0;
}
