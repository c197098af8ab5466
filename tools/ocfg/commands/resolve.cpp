/**
 * ocfg CLI - resolve command
 *
 * Resolve every overlay below the root and print them in priority order.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ocfg::cli::commands {

namespace {

int cmd_resolve(const GlobalOptions& opts) {
    ResolverSettings settings;
    if (!load_settings(opts, settings)) {
        return kExitFatal;
    }

    WarningCollector diagnostics;
    auto config = create_overlay_config(opts, settings, diagnostics);
    if (config.isErr()) {
        print_error(config.error().message(), opts.json);
        return kExitFatal;
    }

    const auto& table = config.value()->table();
    if (opts.json) {
        auto j = nlohmann::json::parse(serialize_configuration_table(table));
        j["ok"] = true;
        j["warnings"] = warnings_to_json(diagnostics);
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << "Partition order: " << table.partitionOrderString()
                  << (table.isDefaultPartitionOrder() ? " (default)" : "") << std::endl;
        for (const auto& c : table.sortedOverlays()) {
            std::cout << "  [" << c.config_index << "] " << c.package_name
                      << " partition=" << c.partition
                      << " enabled=" << (c.enabled ? "true" : "false")
                      << " mutable=" << (c.is_mutable ? "true" : "false") << std::endl;
        }
        if (table.empty()) {
            std::cout << "  (no overlays)" << std::endl;
        }
    }

    return exit_code_for(diagnostics);
}

} // namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_resolve(opts));
    });
}

} // namespace ocfg::cli::commands
