#pragma once

#include "error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace snapgate {

inline constexpr size_t DEFAULT_MAX_PAYLOAD_BYTES = 10 * 1024 * 1024;

struct Config {
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 8888;
        uint32_t max_connections = 50;
        size_t max_payload_bytes = DEFAULT_MAX_PAYLOAD_BYTES;
        uint32_t transfer_timeout_ms = 30000;
        uint32_t accept_poll_ms = 1000;
        size_t handshake_buffer_bytes = 1024;
        size_t read_chunk_bytes = 8192;
        bool autostart = true;
    } server;

    struct Storage {
        std::filesystem::path database = "database.db";
        uint32_t pool_size = 5;
        uint32_t busy_timeout_ms = 10000;
    } storage;

    struct Authorization {
        size_t cache_capacity = 1000;
    } authorization;

    struct Logging {
        std::string level = "info";
        std::string file;
    } logging;
};

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;
[[nodiscard]] auto default_config() -> Config;

} // namespace snapgate
