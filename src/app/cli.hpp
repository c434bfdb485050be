#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <util/error.hpp>

namespace snapgate::app {

enum class CliAction : uint8_t {
    run,
    grant,
    exit_ok,
};

struct GrantRequest {
    std::string uid;
    std::string room;
    std::string name;
};

struct CliOptions {
    std::filesystem::path config_path = "config/snapgate.toml";
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::filesystem::path> database;
    bool no_console = false;
    GrantRequest grant;
};

struct CliParseOutcome {
    CliAction action = CliAction::run;
    CliOptions options;
};

using CliResult = Result<CliParseOutcome>;

[[nodiscard]] auto parse_cli(int argc, char** argv) -> CliResult;

} // namespace snapgate::app
