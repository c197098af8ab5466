/**
 * ocfg CLI - Common utilities and types
 */

#pragma once

#include <ocfg/overlay_config.hpp>
#include <ocfg/settings.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <string>

namespace ocfg::cli {

constexpr int kExitFatal = 1;
constexpr int kExitPolicyError = 2;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root = "/";        // --root
    std::string settings_path;     // --settings
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline nlohmann::json warnings_to_json(const WarningCollector& diagnostics) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& w : diagnostics.get_warnings()) {
        nlohmann::json j;
        j["key"] = w.key;
        j["action"] = w.action;
        j["fields"] = w.fields;
        out.push_back(j);
    }
    return out;
}

/**
 * Load settings (defaults when --settings is not given) and configure logging.
 * Returns false after printing the error when the file cannot be used.
 */
inline bool load_settings(const GlobalOptions& opts, ResolverSettings& out) {
    if (opts.settings_path.empty()) {
        out = get_default_settings();
    } else {
        auto loaded = load_resolver_settings(opts.settings_path);
        if (loaded.isErr()) {
            print_error(loaded.error().message(), opts.json);
            return false;
        }
        out = loaded.value();
    }

    apply_log_level(out);
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    return true;
}

/**
 * Resolve the configuration below --root using the loaded settings.
 */
inline Result<std::unique_ptr<OverlayConfig>> create_overlay_config(const GlobalOptions& opts,
                                                                    const ResolverSettings& settings,
                                                                    WarningCollector& diagnostics) {
    diagnostics.set_policy(settings.warnings);

    ResolveInputs inputs;
    inputs.root = opts.root;
    inputs.scanner_factory = make_directory_scanner_factory(settings.max_scan_depth);
    inputs.parallel_scan = settings.parallel_scan;
    inputs.diagnostics = &diagnostics;
    return OverlayConfig::create(inputs);
}

inline int exit_code_for(const WarningCollector& diagnostics) {
    return diagnostics.has_errors() ? kExitPolicyError : 0;
}

} // namespace ocfg::cli
