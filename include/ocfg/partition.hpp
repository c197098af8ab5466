#pragma once

#include "ocfg/types.hpp"

#include <array>
#include <string>
#include <vector>

namespace ocfg {

// ============================================================================
// Partition Model
// ============================================================================

// Compiled-in fallback order: system, vendor, odm, oem, product, system_ext
constexpr std::array<PartitionId, kPartitionCount> kDefaultPartitionOrder = {
    PartitionId::System,
    PartitionId::Vendor,
    PartitionId::Odm,
    PartitionId::Oem,
    PartitionId::Product,
    PartitionId::SystemExt,
};

// Position of a partition in kDefaultPartitionOrder
int default_rank_of(PartitionId id);

/**
 * @brief One filesystem layer that may contribute overlay packages
 *
 * Created once per resolver run from the root directory and never
 * modified afterwards.
 */
struct Partition {
    PartitionId id = PartitionId::System;
    std::string name;
    std::string root;       // e.g. "<root>/vendor"
    int default_rank = 0;

    /// Directory scanned for overlay packages: <root>/overlay
    std::string overlay_dir() const;

    /// Directory holding config.xml and its merged files: <root>/overlay/config
    std::string config_dir() const;

    /// True when path lies below overlay_dir() (lexical test)
    bool contains_path(const std::string& path) const;

    bool operator==(const Partition& other) const {
        return id == other.id && root == other.root;
    }
    bool operator!=(const Partition& other) const { return !(*this == other); }
};

using PartitionOrder = std::vector<Partition>;

// Build a single partition rooted at <root_dir>/<name>
Partition make_partition(PartitionId id, const std::string& root_dir);

// Build every known partition in the default order
PartitionOrder make_partitions(const std::string& root_dir);

// "system, vendor, odm, oem, product, system_ext"
std::string render_partition_order(const PartitionOrder& order);

// Every known partition exactly once, nothing else
bool is_complete_partition_order(const PartitionOrder& order);

// Index of a partition within an order, -1 when absent
int index_of(const PartitionOrder& order, PartitionId id);

} // namespace ocfg
