#include "ocfg/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace ocfg {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<PartitionId> parse_partition_id(const std::string& name) {
    if (name == "system") return PartitionId::System;
    if (name == "vendor") return PartitionId::Vendor;
    if (name == "odm") return PartitionId::Odm;
    if (name == "oem") return PartitionId::Oem;
    if (name == "product") return PartitionId::Product;
    if (name == "system_ext") return PartitionId::SystemExt;
    return std::nullopt;
}

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "partition_order_rejected") return Warning::partition_order_rejected;
    if (lower == "overlay_manifest_invalid") return Warning::overlay_manifest_invalid;
    if (lower == "overlay_duplicate") return Warning::overlay_duplicate;
    if (lower == "overlay_outside_partitions") return Warning::overlay_outside_partitions;
    if (lower == "overlay_config_invalid") return Warning::overlay_config_invalid;
    if (lower == "overlay_config_merge_invalid") return Warning::overlay_config_merge_invalid;
    if (lower == "overlay_declaration_invalid") return Warning::overlay_declaration_invalid;
    if (lower == "overlay_declaration_unknown") return Warning::overlay_declaration_unknown;
    if (lower == "overlay_declaration_duplicate") return Warning::overlay_declaration_duplicate;
    if (lower == "overlay_declaration_static") return Warning::overlay_declaration_static;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace ocfg
