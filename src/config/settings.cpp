#include "ocfg/settings.hpp"
#include "ocfg/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ocfg {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

bool is_known_log_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

} // namespace

ResolverSettings get_default_settings() {
    ResolverSettings settings;
    settings.schema = kSettingsSchema;
    settings.log_level = "info";
    settings.parallel_scan = false;
    settings.max_scan_depth = 8;
    return settings;
}

SettingsParseResult parse_resolver_settings(const std::string& json_str,
                                            const std::string& source_path) {
    SettingsParseResult result;
    result.settings = get_default_settings();
    result.settings.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.settings.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.settings.schema != kSettingsSchema) {
            result.error = std::string("$schema mismatch: expected ") + kSettingsSchema;
            return result;
        }

        if (j.contains("log_level")) {
            auto level = get_string(j, "log_level");
            if (level && is_known_log_level(to_lower(*level))) {
                result.settings.log_level = to_lower(*level);
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        if (j.contains("parallel_scan")) {
            if (j["parallel_scan"].is_boolean()) {
                result.settings.parallel_scan = j["parallel_scan"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:parallel_scan");
            }
        }

        if (j.contains("max_scan_depth")) {
            if (j["max_scan_depth"].is_number_integer() && j["max_scan_depth"].get<int>() >= 1) {
                result.settings.max_scan_depth = j["max_scan_depth"].get<int>();
            } else {
                result.warnings.push_back("invalid_configuration:max_scan_depth");
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                std::string key_str = to_lower(key);
                if (!parse_warning_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_warning_key:" + key_str);
                    continue;
                }
                auto action = val.is_string() ? parse_warning_action(val.get<std::string>())
                                              : std::nullopt;
                if (action) {
                    result.settings.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<ResolverSettings> load_resolver_settings(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<ResolverSettings>::err(Error(ErrorCode::SETTINGS_MISSING,
                                                   "settings not found: " + path));
    }

    auto parsed = parse_resolver_settings(*content, path);
    if (!parsed.ok) {
        return Result<ResolverSettings>::err(Error(ErrorCode::SETTINGS_PARSE_ERROR,
                                                   parsed.error).withContext(path));
    }

    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", path, warning);
    }
    return Result<ResolverSettings>::ok(parsed.settings);
}

void apply_log_level(const ResolverSettings& settings) {
    if (settings.log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (settings.log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (settings.log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace ocfg
