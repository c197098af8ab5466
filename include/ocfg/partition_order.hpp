#pragma once

#include "ocfg/partition.hpp"

#include <string>
#include <vector>

namespace ocfg {

// ============================================================================
// Partition Order Override
// ============================================================================

// Override file location relative to the resolver root
constexpr const char* kPartitionOrderRelativePath = "product/overlay/partition_order.xml";

constexpr const char* kPartitionOrderRootElement = "partition-order";
constexpr const char* kPartitionOrderEntryElement = "partition";

/**
 * @brief Structural parse of a partition_order.xml file
 *
 * Checks the document shape only: readable, well-formed, root element
 * <partition-order>, only <partition name="..."/> children, no duplicate
 * names. Whether the names form the known partition set is decided by
 * resolve_partition_order().
 */
struct PartitionOrderParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> names;  // in file order
};

PartitionOrderParseResult parse_partition_order_file(const std::string& path);

struct PartitionOrderResult {
    bool accepted = false;
    PartitionOrder order;   // listed order when accepted, copy of the input otherwise
    std::string reason;     // why the file was rejected; empty when accepted
};

/**
 * @brief Validate an override file against a complete partition sequence
 *
 * Fail-closed: the override is applied only when every entry names a
 * partition of default_order, nothing repeats and nothing is missing.
 * default_order itself is never modified.
 */
PartitionOrderResult resolve_partition_order(const std::string& override_path,
                                             const PartitionOrder& default_order);

/**
 * @brief In-place variant kept for callers that reorder their own list
 *
 * Replaces the contents of partitions with the override order only when
 * the file is accepted; otherwise partitions keeps its caller-supplied order.
 * @return true when the override was applied
 */
bool sort_partitions(const std::string& override_path, PartitionOrder& partitions);

} // namespace ocfg
