#include "ocfg/partition.hpp"
#include "ocfg/path_utils.hpp"
#include "ocfg/platform.hpp"

#include <set>

namespace ocfg {

int default_rank_of(PartitionId id) {
    for (std::size_t i = 0; i < kDefaultPartitionOrder.size(); ++i) {
        if (kDefaultPartitionOrder[i] == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string Partition::overlay_dir() const {
    return join_path(root, "overlay");
}

std::string Partition::config_dir() const {
    return join_path(overlay_dir(), "config");
}

bool Partition::contains_path(const std::string& path) const {
    return is_within_root(overlay_dir(), path);
}

Partition make_partition(PartitionId id, const std::string& root_dir) {
    Partition p;
    p.id = id;
    p.name = partition_id_to_string(id);
    p.root = join_path(root_dir, p.name);
    p.default_rank = default_rank_of(id);
    return p;
}

PartitionOrder make_partitions(const std::string& root_dir) {
    PartitionOrder order;
    order.reserve(kDefaultPartitionOrder.size());
    for (PartitionId id : kDefaultPartitionOrder) {
        order.push_back(make_partition(id, root_dir));
    }
    return order;
}

std::string render_partition_order(const PartitionOrder& order) {
    std::string out;
    for (const auto& partition : order) {
        if (!out.empty()) out += ", ";
        out += partition.name;
    }
    return out;
}

bool is_complete_partition_order(const PartitionOrder& order) {
    if (order.size() != kDefaultPartitionOrder.size()) {
        return false;
    }
    std::set<PartitionId> seen;
    for (const auto& partition : order) {
        if (!seen.insert(partition.id).second) {
            return false;
        }
    }
    return true;
}

int index_of(const PartitionOrder& order, PartitionId id) {
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (order[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace ocfg
