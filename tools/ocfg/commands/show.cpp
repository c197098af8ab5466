/**
 * ocfg CLI - show command
 *
 * Print the resolved configuration of a single overlay package.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ocfg::cli::commands {

namespace {

struct ShowOptions {
    std::string package;
};

int cmd_show(const GlobalOptions& opts, const ShowOptions& show_opts) {
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

    auto found = config.value()->getConfiguration(show_opts.package);
    if (!found) {
        print_error("No overlay configuration for " + show_opts.package, opts.json);
        return kExitFatal;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = found->package_name;
        j["enabled"] = found->enabled;
        j["mutable"] = found->is_mutable;
        j["config_index"] = found->config_index;
        j["partition"] = found->partition;
        j["target_package"] = found->overlay.target_package;
        j["path"] = found->overlay.path;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << found->package_name << std::endl;
        std::cout << "  Partition:    " << found->partition << std::endl;
        std::cout << "  Config index: " << found->config_index << std::endl;
        std::cout << "  Enabled:      " << (found->enabled ? "true" : "false") << std::endl;
        std::cout << "  Mutable:      " << (found->is_mutable ? "true" : "false") << std::endl;
        std::cout << "  Target:       " << found->overlay.target_package << std::endl;
        std::cout << "  Manifest:     " << found->overlay.path << std::endl;
    }

    return exit_code_for(diagnostics);
}

} // namespace

void setup_show(CLI::App* app, GlobalOptions& opts) {
    static ShowOptions show_opts;

    app->add_option("package", show_opts.package, "Overlay package name")->required();

    app->callback([&opts]() {
        std::exit(cmd_show(opts, show_opts));
    });
}

} // namespace ocfg::cli::commands
