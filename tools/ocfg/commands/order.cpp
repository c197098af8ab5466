/**
 * ocfg CLI - order command
 *
 * Print the effective partition order and whether it came from
 * product/overlay/partition_order.xml.
 */

#include "../common.hpp"
#include <ocfg/partition_order.hpp>
#include <ocfg/platform.hpp>
#include <CLI/CLI.hpp>

namespace ocfg::cli::commands {

namespace {

int cmd_order(const GlobalOptions& opts) {
    ResolverSettings settings;
    if (!load_settings(opts, settings)) {
        return kExitFatal;
    }

    if (!is_listable_directory(opts.root)) {
        print_error("root directory not accessible: " + opts.root, opts.json);
        return kExitFatal;
    }

    WarningCollector diagnostics(settings.warnings);
    std::string override_path = join_path(opts.root, kPartitionOrderRelativePath);
    auto result = resolve_partition_order(override_path, make_partitions(opts.root));
    if (!result.accepted && path_exists(override_path)) {
        diagnostics.emit(Warning::partition_order_rejected,
                         warnings::partition_order_rejected(result.reason, override_path));
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        nlohmann::json order = nlohmann::json::array();
        for (const auto& partition : result.order) {
            order.push_back(partition.name);
        }
        j["partition_order"] = order;
        j["default_partition_order"] = !result.accepted;
        if (!result.reason.empty()) {
            j["reason"] = result.reason;
        }
        j["warnings"] = warnings_to_json(diagnostics);
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << render_partition_order(result.order) << std::endl;
        std::cout << (result.accepted ? "source: " + override_path : std::string("source: default"))
                  << std::endl;
    }

    return exit_code_for(diagnostics);
}

} // namespace

void setup_order(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_order(opts));
    });
}

} // namespace ocfg::cli::commands
