#include "config.hpp"

#include "logging.hpp"

#include <toml.hpp>

namespace snapgate {

namespace {

[[nodiscard]] auto read_bounded(const toml::value& table, const char* key, int64_t min,
                                int64_t max, const char* section) -> Result<int64_t> {
    auto value = toml::find<int64_t>(table, key);
    if (value < min || value > max) {
        return make_error<int64_t>(ErrorCode::invalid_config,
                                   std::string("Invalid ") + section + "." + key + ": " +
                                       std::to_string(value) + " (expected: " +
                                       std::to_string(min) + "-" + std::to_string(max) + ")");
    }
    return value;
}

[[nodiscard]] auto parse_server(const toml::value& server, Config::Server& out) -> Result<void> {
    if (server.contains("host")) {
        out.host = toml::find<std::string>(server, "host");
        if (out.host.empty()) {
            return make_error<void>(ErrorCode::invalid_config, "Invalid server.host: empty");
        }
    }
    if (server.contains("port")) {
        out.port = static_cast<uint16_t>(
            SNAPGATE_TRY(read_bounded(server, "port", 0, 65535, "server")));
    }
    if (server.contains("max_connections")) {
        out.max_connections = static_cast<uint32_t>(
            SNAPGATE_TRY(read_bounded(server, "max_connections", 1, 10000, "server")));
    }
    if (server.contains("max_payload_bytes")) {
        out.max_payload_bytes = static_cast<size_t>(SNAPGATE_TRY(
            read_bounded(server, "max_payload_bytes", 1, int64_t{1} << 32, "server")));
    }
    if (server.contains("transfer_timeout_ms")) {
        out.transfer_timeout_ms = static_cast<uint32_t>(
            SNAPGATE_TRY(read_bounded(server, "transfer_timeout_ms", 1, 3600000, "server")));
    }
    if (server.contains("accept_poll_ms")) {
        out.accept_poll_ms = static_cast<uint32_t>(
            SNAPGATE_TRY(read_bounded(server, "accept_poll_ms", 1, 60000, "server")));
    }
    if (server.contains("handshake_buffer_bytes")) {
        out.handshake_buffer_bytes = static_cast<size_t>(
            SNAPGATE_TRY(read_bounded(server, "handshake_buffer_bytes", 64, 65536, "server")));
    }
    if (server.contains("read_chunk_bytes")) {
        out.read_chunk_bytes = static_cast<size_t>(
            SNAPGATE_TRY(read_bounded(server, "read_chunk_bytes", 64, 1048576, "server")));
    }
    if (server.contains("autostart")) {
        out.autostart = toml::find<bool>(server, "autostart");
    }
    return {};
}

[[nodiscard]] auto parse_storage(const toml::value& storage, Config::Storage& out)
    -> Result<void> {
    if (storage.contains("database")) {
        out.database = toml::find<std::string>(storage, "database");
        if (out.database.empty()) {
            return make_error<void>(ErrorCode::invalid_config, "Invalid storage.database: empty");
        }
    }
    if (storage.contains("pool_size")) {
        out.pool_size = static_cast<uint32_t>(
            SNAPGATE_TRY(read_bounded(storage, "pool_size", 0, 64, "storage")));
    }
    if (storage.contains("busy_timeout_ms")) {
        out.busy_timeout_ms = static_cast<uint32_t>(
            SNAPGATE_TRY(read_bounded(storage, "busy_timeout_ms", 0, 600000, "storage")));
    }
    return {};
}

} // namespace

auto default_config() -> Config {
    return Config{}; // Uses struct defaults
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return make_error<Config>(ErrorCode::file_not_found,
                                  "Configuration file not found: " + path.string());
    }

    toml::value data;
    try {
        data = toml::parse(path);
    } catch (const std::exception& e) {
        return make_error<Config>(ErrorCode::parse_error,
                                  "Failed to parse TOML: " + std::string(e.what()));
    }

    Config config = default_config();

    try {
        if (data.contains("server")) {
            SNAPGATE_TRY(parse_server(toml::find(data, "server"), config.server));
        }

        if (data.contains("storage")) {
            SNAPGATE_TRY(parse_storage(toml::find(data, "storage"), config.storage));
        }

        if (data.contains("authorization")) {
            const auto authorization = toml::find(data, "authorization");
            if (authorization.contains("cache_capacity")) {
                config.authorization.cache_capacity = static_cast<size_t>(SNAPGATE_TRY(
                    read_bounded(authorization, "cache_capacity", 1, 1000000, "authorization")));
            }
        }

        if (data.contains("logging")) {
            const auto logging = toml::find(data, "logging");
            if (logging.contains("level")) {
                config.logging.level = toml::find<std::string>(logging, "level");
                if (!parse_log_level(config.logging.level)) {
                    return make_error<Config>(
                        ErrorCode::invalid_config,
                        "Invalid log level: " + config.logging.level +
                            " (expected: trace, debug, info, warn, error, critical)");
                }
            }
            if (logging.contains("file")) {
                config.logging.file = toml::find<std::string>(logging, "file");
            }
        }
    } catch (const toml::type_error& e) {
        return make_error<Config>(ErrorCode::invalid_config,
                                  "Invalid value type: " + std::string(e.what()));
    }

    return config;
}

} // namespace snapgate
