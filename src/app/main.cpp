#include "cli.hpp"
#include "console_shell.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <server/ingest_server.hpp>
#include <thread>
#include <util/config.hpp>
#include <util/error.hpp>
#include <util/logging.hpp>

namespace {

std::atomic<bool> g_should_run{true};

auto signal_handler(int /*sig*/) -> void {
    g_should_run = false;
}

auto setup_signal_handlers() -> void {
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocked console read returns so the shell can exit.
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

auto resolve_config(const snapgate::app::CliOptions& cli_opts) -> snapgate::Config {
    auto config_result = snapgate::load_config(cli_opts.config_path);

    snapgate::Config config;
    if (!config_result) {
        const auto& error = config_result.error();
        SNAPGATE_LOG_ERROR("Failed to load configuration from '{}': {} ({})",
                           cli_opts.config_path.string(), error.message,
                           snapgate::error_code_name(error.code));
        SNAPGATE_LOG_INFO("Using default configuration");
        config = snapgate::default_config();
    } else {
        config = config_result.value();
    }

    if (cli_opts.host) {
        config.server.host = *cli_opts.host;
        SNAPGATE_LOG_INFO("Listen host overridden by CLI: {}", config.server.host);
    }
    if (cli_opts.port) {
        config.server.port = *cli_opts.port;
        SNAPGATE_LOG_INFO("Listen port overridden by CLI: {}", config.server.port);
    }
    if (cli_opts.database) {
        config.storage.database = *cli_opts.database;
        SNAPGATE_LOG_INFO("Database overridden by CLI: {}", config.storage.database.string());
    }
    return config;
}

auto run_grant(const snapgate::Config& config, const snapgate::app::GrantRequest& request)
    -> int {
    snapgate::storage::PoolOptions pool_options;
    pool_options.database = config.storage.database;
    pool_options.max_idle = 1;
    pool_options.busy_timeout_ms = config.storage.busy_timeout_ms;

    auto store = snapgate::storage::CaptureStore::create(std::move(pool_options));
    if (!store) {
        SNAPGATE_LOG_CRITICAL("Failed to open database '{}': {}",
                              config.storage.database.string(), store.error().message);
        return EXIT_FAILURE;
    }

    auto result = store.value()->grant_authorization(request.uid, request.room, request.name);
    if (!result) {
        SNAPGATE_LOG_ERROR("Grant failed: {} ({})", result.error().message,
                           snapgate::error_code_name(result.error().code));
        return EXIT_FAILURE;
    }
    SNAPGATE_LOG_INFO("Authorized UID {} in room {} as {}", request.uid, request.room,
                      request.name);
    return EXIT_SUCCESS;
}

auto run_headless() -> void {
    while (g_should_run) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    SNAPGATE_LOG_INFO("Shutdown signal received");
}

auto run_app(int argc, char** argv) -> int {
    auto cli_result = snapgate::app::parse_cli(argc, argv);
    if (!cli_result) {
        return EXIT_FAILURE;
    }
    if (cli_result->action == snapgate::app::CliAction::exit_ok) {
        return EXIT_SUCCESS;
    }
    const auto& cli_opts = cli_result->options;

    snapgate::initialize_logger("snapgate");
    SNAPGATE_LOG_INFO(SNAPGATE_PROJECT_NAME " v" SNAPGATE_VERSION " starting");

    auto config = resolve_config(cli_opts);

    if (!config.logging.file.empty()) {
        auto attach_result = snapgate::attach_log_file(config.logging.file);
        if (!attach_result) {
            SNAPGATE_LOG_ERROR("{}", attach_result.error().message);
        }
    }
    if (auto level = snapgate::parse_log_level(config.logging.level)) {
        snapgate::set_log_level(*level);
    }

    SNAPGATE_LOG_DEBUG("Configuration loaded:");
    SNAPGATE_LOG_DEBUG("  Listen: {}:{}", config.server.host, config.server.port);
    SNAPGATE_LOG_DEBUG("  Max connections: {}", config.server.max_connections);
    SNAPGATE_LOG_DEBUG("  Max payload: {} bytes", config.server.max_payload_bytes);
    SNAPGATE_LOG_DEBUG("  Transfer timeout: {} ms", config.server.transfer_timeout_ms);
    SNAPGATE_LOG_DEBUG("  Database: {} (pool {})", config.storage.database.string(),
                       config.storage.pool_size);
    SNAPGATE_LOG_DEBUG("  Authorization cache: {}", config.authorization.cache_capacity);
    SNAPGATE_LOG_DEBUG("  Log level: {}", config.logging.level);

    if (cli_result->action == snapgate::app::CliAction::grant) {
        return run_grant(config, cli_opts.grant);
    }

    setup_signal_handlers();

    auto server_result = snapgate::IngestServer::create(config);
    if (!server_result) {
        SNAPGATE_LOG_CRITICAL("Failed to create server: {} ({})", server_result.error().message,
                              snapgate::error_code_name(server_result.error().code));
        return EXIT_FAILURE;
    }
    auto& server = *server_result.value();

    if (config.server.autostart || cli_opts.no_console) {
        auto start_result = server.start();
        if (!start_result && cli_opts.no_console) {
            SNAPGATE_LOG_CRITICAL("Failed to start server: {}", start_result.error().message);
            return EXIT_FAILURE;
        }
    }

    if (cli_opts.no_console) {
        run_headless();
    } else {
        snapgate::app::ConsoleShell shell(server, std::cout);
        shell.run(std::cin, g_should_run);
    }

    if (server.running()) {
        auto stop_result = server.stop();
        if (!stop_result) {
            SNAPGATE_LOG_WARN("Stop failed: {}", stop_result.error().message);
        }
    }
    SNAPGATE_LOG_INFO("Waiting for in-flight sessions...");
    server.wait_for_sessions();
    SNAPGATE_LOG_INFO("snapgate terminated successfully");
    return EXIT_SUCCESS;
}

} // namespace

auto main(int argc, char** argv) -> int {
    try {
        return run_app(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[CRITICAL] Unhandled exception: %s\n", e.what());
        try {
            SNAPGATE_LOG_CRITICAL("Unhandled exception caught in main: {}", e.what());
            spdlog::shutdown();
        } catch (...) {
            std::fprintf(stderr, "[CRITICAL] Logger failed to handle exception\n");
        }
        return EXIT_FAILURE;
    } catch (...) {
        std::fprintf(stderr, "[CRITICAL] Unknown exception caught in main\n");
        return EXIT_FAILURE;
    }
}
