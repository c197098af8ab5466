/**
 * ocfg CLI - Entry Point
 *
 * Inspect the overlay configuration resolved below a root directory.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace ocfg::cli::commands {
    void setup_order(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_show(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace ocfg::cli;

    CLI::App app{"ocfg - overlay configuration resolver"};
    app.set_version_flag("-V,--version", OCFG_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Directory holding the partitions");
    app.add_option("--settings", opts.settings_path, "Resolver settings JSON file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");

    // Commands
    auto* order_cmd = app.add_subcommand("order", "Print the effective partition order");
    commands::setup_order(order_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Print every overlay configuration");
    commands::setup_resolve(resolve_cmd, opts);

    auto* show_cmd = app.add_subcommand("show", "Print the configuration of one overlay");
    commands::setup_show(show_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
