#include "ocfg/overlay_config.hpp"

#include <nlohmann/json.hpp>

namespace ocfg {

namespace {

nlohmann::json configuration_to_json(const Configuration& config) {
    nlohmann::json j;
    j["package"] = config.package_name;
    j["enabled"] = config.enabled;
    j["mutable"] = config.is_mutable;
    j["config_index"] = config.config_index;
    j["partition"] = config.partition;
    j["target_package"] = config.overlay.target_package;
    if (!config.overlay.target_name.empty()) {
        j["target_name"] = config.overlay.target_name;
    }
    j["static"] = config.overlay.is_static;
    j["path"] = config.overlay.path;
    return j;
}

} // namespace

std::string serialize_configuration_table(const ConfigurationTable& table) {
    nlohmann::json j;

    nlohmann::json order = nlohmann::json::array();
    for (const auto& partition : table.partitionOrder()) {
        order.push_back(partition.name);
    }
    j["partition_order"] = order;
    j["default_partition_order"] = table.isDefaultPartitionOrder();

    nlohmann::json overlays = nlohmann::json::array();
    for (const auto& config : table.sortedOverlays()) {
        overlays.push_back(configuration_to_json(config));
    }
    j["overlays"] = overlays;

    return j.dump(2);
}

} // namespace ocfg
