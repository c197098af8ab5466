#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace ocfg {

// ============================================================================
// Partition Identity
// ============================================================================

// Closed set of filesystem layers that may contribute overlays.
// Declaration order is the compiled-in default order.
enum class PartitionId {
    System,
    Vendor,
    Odm,
    Oem,
    Product,
    SystemExt,
};

constexpr int kPartitionCount = 6;

inline const char* partition_id_to_string(PartitionId id) {
    switch (id) {
        case PartitionId::System: return "system";
        case PartitionId::Vendor: return "vendor";
        case PartitionId::Odm: return "odm";
        case PartitionId::Oem: return "oem";
        case PartitionId::Product: return "product";
        case PartitionId::SystemExt: return "system_ext";
        default: return "unknown";
    }
}

// Exact, case-sensitive match against the on-disk partition names
std::optional<PartitionId> parse_partition_id(const std::string& name);

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    partition_order_rejected,
    overlay_manifest_invalid,
    overlay_duplicate,
    overlay_outside_partitions,
    overlay_config_invalid,
    overlay_config_merge_invalid,
    overlay_declaration_invalid,
    overlay_declaration_unknown,
    overlay_declaration_duplicate,
    overlay_declaration_static,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::partition_order_rejected: return "partition_order_rejected";
        case Warning::overlay_manifest_invalid: return "overlay_manifest_invalid";
        case Warning::overlay_duplicate: return "overlay_duplicate";
        case Warning::overlay_outside_partitions: return "overlay_outside_partitions";
        case Warning::overlay_config_invalid: return "overlay_config_invalid";
        case Warning::overlay_config_merge_invalid: return "overlay_config_merge_invalid";
        case Warning::overlay_declaration_invalid: return "overlay_declaration_invalid";
        case Warning::overlay_declaration_unknown: return "overlay_declaration_unknown";
        case Warning::overlay_declaration_duplicate: return "overlay_declaration_duplicate";
        case Warning::overlay_declaration_static: return "overlay_declaration_static";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace ocfg
