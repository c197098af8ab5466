#pragma once

#include "ocfg/overlay_scanner.hpp"
#include "ocfg/partition.hpp"
#include "ocfg/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ocfg {

// ============================================================================
// Partition Policy File
// ============================================================================

// <partition>/overlay/config/config.xml
constexpr const char* kOverlayConfigFileName = "config.xml";

constexpr bool kDefaultOverlayEnabled = false;
constexpr bool kDefaultOverlayMutable = true;

/**
 * @brief Policy declared for one overlay by one partition
 */
struct PolicyFragment {
    std::string package_name;
    bool enabled = kDefaultOverlayEnabled;
    bool is_mutable = kDefaultOverlayMutable;
    bool configured = false;    // declared by an <overlay> element
    PartitionId partition = PartitionId::System;
    OverlayInfo overlay;
};

/**
 * @brief Build the ordered policy fragments contributed by one partition
 *
 * Reads <partition>/overlay/config/config.xml (following <merge> elements)
 * and combines it with the overlays found in that partition. Fragment order:
 *   1. configured overlays, in declaration order
 *   2. unconfigured static overlays by ascending priority: enabled, immutable
 *   3. remaining unconfigured overlays by name: default policy
 *
 * Invalid declarations are reported to diagnostics and skipped.
 */
std::vector<PolicyFragment> parse_partition_config(const Partition& partition,
                                                   const std::vector<OverlayInfo>& overlays,
                                                   WarningCollector& diagnostics);

// Strict "true" / "false"
std::optional<bool> parse_xml_bool(const std::string& value);

} // namespace ocfg
