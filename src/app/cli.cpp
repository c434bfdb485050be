#include "app/cli.hpp"

#include <CLI/CLI.hpp>

namespace snapgate::app {
namespace {

[[nodiscard]] auto make_exit_ok() -> CliResult {
    return CliParseOutcome{
        .action = CliAction::exit_ok,
        .options = {},
    };
}

auto register_options(CLI::App& app, CliOptions& options) -> void {
    app.add_option("-c,--config", options.config_path, "Path to configuration file");
    app.add_option("--host", options.host, "Override listen address (IPv4)");
    app.add_option("--port", options.port, "Override listen port (0 = ephemeral)")
        ->check(CLI::Range(0, 65535));
    app.add_option("--db", options.database, "Override SQLite database path");
    app.add_flag("--no-console", options.no_console,
                 "Run headless until SIGINT/SIGTERM instead of attaching the console shell");
}

auto register_grant(CLI::App& grant, GrantRequest& request) -> void {
    grant.add_option("uid", request.uid, "Client identity")->required();
    grant.add_option("room", request.room, "Room the identity may submit to")->required();
    grant.add_option("name", request.name, "Display name stored with each capture")->required();
}

[[nodiscard]] auto validate_grant(const GrantRequest& request) -> Result<void> {
    if (request.uid.empty() || request.room.empty() || request.name.empty()) {
        return make_error<void>(ErrorCode::parse_error,
                                "grant requires non-empty <uid> <room> <name>");
    }
    return {};
}

} // namespace

auto parse_cli(int argc, char** argv) -> CliResult {
    CLI::App app{SNAPGATE_PROJECT_NAME " - Authorized image ingestion server"};
    app.set_version_flag("--version,-v", SNAPGATE_PROJECT_NAME " v" SNAPGATE_VERSION);
    app.footer(R"(Usage:
  snapgate [options]
  snapgate [options] grant <uid> <room> <name>

Notes:
  - 'grant' writes an allow-list entry into the configured database and exits.)");

    CliOptions options;
    register_options(app, options);

    auto* grant = app.add_subcommand("grant", "Authorize <uid> to submit to <room> and exit");
    register_grant(*grant, options.grant);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            (void)app.exit(e);
            return make_exit_ok();
        }
        (void)app.exit(e);
        return make_error<CliParseOutcome>(ErrorCode::parse_error,
                                           "Failed to parse command line arguments.");
    }

    if (grant->parsed()) {
        auto validation = validate_grant(options.grant);
        if (!validation) {
            return make_error<CliParseOutcome>(validation.error().code,
                                               validation.error().message,
                                               validation.error().location);
        }
        return CliParseOutcome{
            .action = CliAction::grant,
            .options = std::move(options),
        };
    }

    return CliParseOutcome{
        .action = CliAction::run,
        .options = std::move(options),
    };
}

} // namespace snapgate::app
