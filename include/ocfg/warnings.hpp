#pragma once

#include "ocfg/types.hpp"

#include <string>
#include <vector>
#include <unordered_map>

namespace ocfg {

// ============================================================================
// Warning Collector
// ============================================================================

// Side channel for resolution diagnostics. Every non-ignored emission is
// also written to the spdlog default logger.
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    void set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
        policy_ = policy;
    }
    const std::unordered_map<std::string, WarningAction>& policy() const { return policy_; }

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Fold warnings collected elsewhere into this collector, keeping their
    // already-resolved actions. Nothing is logged again.
    void append(const WarningCollector& other);

    // Warnings with action "ignore" are excluded
    std::vector<WarningObject> get_warnings() const;

    // Number of emissions of one key, ignored ones included
    std::size_t count(Warning warning) const;

    bool has_errors() const;
    bool has_effective_warnings() const;
    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> partition_order_rejected(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> overlay_manifest_invalid(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> overlay_duplicate(
    const std::string& package,
    const std::string& kept_path,
    const std::string& skipped_path) {
    return {{"package", package}, {"kept_path", kept_path}, {"skipped_path", skipped_path}};
}

inline std::unordered_map<std::string, std::string> overlay_outside_partitions(
    const std::string& package,
    const std::string& path) {
    return {{"package", package}, {"path", path}};
}

inline std::unordered_map<std::string, std::string> overlay_config_invalid(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> overlay_config_merge_invalid(
    const std::string& merge_path,
    const std::string& reason,
    const std::string& source_path) {
    return {{"merge_path", merge_path}, {"reason", reason}, {"source_path", source_path}};
}

// Declaration-level warnings share one shape
inline std::unordered_map<std::string, std::string> overlay_declaration(
    const std::string& package,
    const std::string& partition,
    const std::string& source_path,
    const std::string& reason = "") {
    std::unordered_map<std::string, std::string> result = {
        {"package", package}, {"partition", partition}, {"source_path", source_path}
    };
    if (!reason.empty()) {
        result["reason"] = reason;
    }
    return result;
}

} // namespace warnings

} // namespace ocfg
