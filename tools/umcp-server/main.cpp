// ─────────────────────────────────────────────────────────────────────────────
// umcp-server - JSON-RPC session server
// ─────────────────────────────────────────────────────────────────────────────
// Serves newline-delimited JSON-RPC 2.0 over TCP with the built-in
// initialize, ping and operation.status methods.
//
// Usage:
//   umcp-server                               # 127.0.0.1:7654
//   umcp-server --port 9000 --log-level debug
//   umcp-server --config server.json --log-file /var/log/umcp.log
//
// Settings are layered: defaults, then --config, then MCP_* environment
// variables, then command-line flags.

#include <cxxopts.hpp>

#include "umcp/config/server_config.hpp"
#include "umcp/log/logger.hpp"
#include "umcp/log/spdlog_logger.hpp"
#include "umcp/server/server.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace umcp;

namespace {

constexpr const char* kVersion = "1.0.0";

void install_logger(const LoggingConfig& logging) {
    const bool has_file = (logging.file.empty() == false);
    if (has_file) {
        set_logger(make_console_rotating_file_logger(
            logging.file, logging.max_file_size, logging.max_files, logging.level));
    } else {
        set_logger(make_console_logger(logging.level));
    }
}

int fail(const std::string& message) {
    std::cerr << "umcp-server: " << message << "\n";
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("umcp-server", "JSON-RPC 2.0 session server");

    options.add_options()
        ("host", "Address to bind", cxxopts::value<std::string>())
        ("p,port", "TCP port", cxxopts::value<std::uint32_t>())
        ("c,config", "JSON configuration file", cxxopts::value<std::string>())
        ("max-connections", "Maximum concurrent connections", cxxopts::value<std::size_t>())
        ("l,log-level", "trace, debug, info, warn, error, fatal or off", cxxopts::value<std::string>())
        ("log-file", "Rotating log file (console only when omitted)", cxxopts::value<std::string>())
        ("t,threads", "Threads running the event loop", cxxopts::value<std::size_t>())
        ("version", "Print version")
        ("h,help", "Print usage");

    ServerConfig config;
    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (result.count("version")) {
            std::cout << "umcp-server " << kVersion << "\n";
            return 0;
        }

        if (result.count("config")) {
            auto loaded = apply_config_file(config, result["config"].as<std::string>());
            if (loaded.has_value() == false) {
                return fail(loaded.error().describe());
            }
        }

        auto from_env = apply_environment(config, system_environment());
        if (from_env.has_value() == false) {
            return fail(from_env.error().describe());
        }

        if (result.count("host")) config.host = result["host"].as<std::string>();
        if (result.count("port")) config.port = result["port"].as<std::uint32_t>();
        if (result.count("max-connections")) config.max_connections = result["max-connections"].as<std::size_t>();
        if (result.count("log-file")) config.logging.file = result["log-file"].as<std::string>();
        if (result.count("threads")) config.io_threads = result["threads"].as<std::size_t>();
        if (result.count("log-level")) {
            const auto text = result["log-level"].as<std::string>();
            const auto level = parse_log_level(text);
            if (level.has_value() == false) {
                return fail("unknown log level '" + text + "'");
            }
            config.logging.level = *level;
        }
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << options.help() << "\n";
        return 1;
    }

    auto valid = validate(config);
    if (valid.has_value() == false) {
        return fail("invalid configuration: " + valid.error().describe());
    }

    try {
        install_logger(config.logging);
    } catch (const std::exception& e) {
        return fail(std::string("cannot open log: ") + e.what());
    }

    asio::io_context io(static_cast<int>(config.io_threads));
    Server server(io, config);

    auto bound = server.start();
    if (bound.has_value() == false) {
        UMCP_LOG_FATAL("{}", bound.error().message);
        return fail(bound.error().message);
    }

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        UMCP_LOG_INFO("Received signal {}, shutting down", signal_number);
        server.stop();
    });

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.io_threads; ++i) {
        workers.emplace_back([&io]() { io.run(); });
    }
    io.run();
    for (auto& worker : workers) {
        worker.join();
    }

    return 0;
}
