#include "ocfg/overlay_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>

#include <nlohmann/json.hpp>

namespace ocfg {

namespace {

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

// Integer JSON value representable as int
bool fits_int(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    auto v = value.get<std::int64_t>();
    return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
}

} // namespace

OverlayManifestParseResult parse_overlay_manifest(const std::string& json_str,
                                                  const std::string& source_path) {
    OverlayManifestParseResult result;
    result.overlay.path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto package = get_string(j, "package");
        if (!package || trim(*package).empty()) {
            result.error = "package missing";
            return result;
        }
        result.overlay.package_name = trim(*package);

        auto target = get_string(j, "target_package");
        if (!target || trim(*target).empty()) {
            result.error = "target_package missing";
            return result;
        }
        result.overlay.target_package = trim(*target);

        if (j.contains("target_name")) {
            if (!j["target_name"].is_string()) {
                result.error = "target_name must be a string";
                return result;
            }
            result.overlay.target_name = j["target_name"].get<std::string>();
        }

        if (j.contains("static")) {
            if (!j["static"].is_boolean()) {
                result.error = "static must be a boolean";
                return result;
            }
            result.overlay.is_static = j["static"].get<bool>();
        }

        if (j.contains("priority")) {
            if (!j["priority"].is_number_integer()) {
                result.error = "priority must be an integer";
                return result;
            }
            if (!fits_int(j["priority"])) {
                result.error = "priority out of range";
                return result;
            }
            result.overlay.priority = j["priority"].get<int>();
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

} // namespace ocfg
