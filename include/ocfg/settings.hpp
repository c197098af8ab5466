#pragma once

#include "ocfg/result.hpp"
#include "ocfg/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace ocfg {

// ============================================================================
// Resolver Settings
// ============================================================================

constexpr const char* kSettingsSchema = "ocfg.settings.v1";

struct ResolverSettings {
    std::string schema;  // MUST be "ocfg.settings.v1"

    std::string log_level = "info";   // debug | info | warn | error
    bool parallel_scan = false;
    int max_scan_depth = 8;

    // [warnings] section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for diagnostics
    std::string source_path;
};

// Settings used when no file is given
ResolverSettings get_default_settings();

struct SettingsParseResult {
    bool ok = false;
    std::string error;
    ResolverSettings settings;
    std::vector<std::string> warnings;
};

/**
 * Parse settings from JSON:
 * {
 *   "$schema": "ocfg.settings.v1",
 *   "log_level": "warn",
 *   "parallel_scan": true,
 *   "max_scan_depth": 4,
 *   "warnings": { "overlay_declaration_unknown": "error" }
 * }
 * Invalid values keep their default and add an
 * "invalid_configuration:<field>" entry to warnings.
 */
SettingsParseResult parse_resolver_settings(const std::string& json_str,
                                            const std::string& source_path = "");

// Read and parse a settings file
Result<ResolverSettings> load_resolver_settings(const std::string& path);

// Apply log_level to the spdlog default logger
void apply_log_level(const ResolverSettings& settings);

} // namespace ocfg
