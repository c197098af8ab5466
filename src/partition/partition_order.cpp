#include "ocfg/partition_order.hpp"
#include "ocfg/platform.hpp"
#include "ocfg/xml_document.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace ocfg {

PartitionOrderParseResult parse_partition_order_file(const std::string& path) {
    PartitionOrderParseResult result;

    if (!is_regular_file(path)) {
        result.error = "file not found";
        return result;
    }

    auto xml = parse_xml_file(path);
    if (!xml.ok) {
        result.error = xml.error;
        return result;
    }

    if (xml.root.name != kPartitionOrderRootElement) {
        result.error = "root element is <" + xml.root.name + ">, expected <" +
                       kPartitionOrderRootElement + ">";
        return result;
    }

    std::set<std::string> seen;
    for (const auto& child : xml.root.children) {
        if (child.name != kPartitionOrderEntryElement) {
            result.error = "unexpected element <" + child.name + "> at line " +
                           std::to_string(child.line);
            return result;
        }

        auto name = child.attribute("name");
        if (!name || name->empty()) {
            result.error = "partition entry without name at line " + std::to_string(child.line);
            return result;
        }

        if (!seen.insert(*name).second) {
            result.error = "duplicate partition: " + *name;
            return result;
        }
        result.names.push_back(*name);
    }

    result.ok = true;
    return result;
}

PartitionOrderResult resolve_partition_order(const std::string& override_path,
                                             const PartitionOrder& default_order) {
    PartitionOrderResult result;
    result.order = default_order;

    auto parsed = parse_partition_order_file(override_path);
    if (!parsed.ok) {
        result.reason = parsed.error;
        return result;
    }

    PartitionOrder listed;
    listed.reserve(parsed.names.size());
    for (const auto& name : parsed.names) {
        auto id = parse_partition_id(name);
        int index = id ? index_of(default_order, *id) : -1;
        if (index < 0) {
            result.reason = "unknown partition: " + name;
            return result;
        }
        listed.push_back(default_order[static_cast<std::size_t>(index)]);
    }

    // Names are distinct and all known, so equal size means the same set
    if (listed.size() != default_order.size()) {
        result.reason = "expected " + std::to_string(default_order.size()) +
                        " partitions, found " + std::to_string(listed.size());
        return result;
    }

    result.accepted = true;
    result.order = std::move(listed);
    return result;
}

bool sort_partitions(const std::string& override_path, PartitionOrder& partitions) {
    auto result = resolve_partition_order(override_path, partitions);
    if (!result.accepted) {
        if (path_exists(override_path)) {
            spdlog::warn("Ignoring {}: {}", override_path, result.reason);
        } else {
            spdlog::debug("No partition order override at {}", override_path);
        }
        return false;
    }

    partitions = std::move(result.order);
    return true;
}

} // namespace ocfg
