#include "ocfg/overlay_config_parser.hpp"
#include "ocfg/path_utils.hpp"
#include "ocfg/platform.hpp"
#include "ocfg/xml_document.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace ocfg {

namespace {

constexpr const char* kConfigRootElement = "config";
constexpr const char* kMergeElement = "merge";
constexpr const char* kOverlayElement = "overlay";

struct ConfigParseState {
    const Partition& partition;
    std::unordered_map<std::string, const OverlayInfo*> overlays_by_package;
    std::set<std::string> visited_files;
    std::set<std::string> declared_packages;
    std::vector<PolicyFragment> configured;
    WarningCollector& diagnostics;
};

void parse_config_file(const std::string& path, ConfigParseState& state);

void handle_merge(const XmlElement& element, const std::string& source_path,
                  ConfigParseState& state) {
    auto merge_path = element.attribute("path");
    if (!merge_path || merge_path->empty()) {
        state.diagnostics.emit(Warning::overlay_config_merge_invalid,
                               warnings::overlay_config_merge_invalid(
                                   "", "path attribute missing", source_path));
        return;
    }

    auto resolved = normalize_under_root(state.partition.config_dir(), *merge_path);
    if (!resolved.ok) {
        state.diagnostics.emit(Warning::overlay_config_merge_invalid,
                               warnings::overlay_config_merge_invalid(
                                   *merge_path, path_error_to_string(resolved.error), source_path));
        return;
    }

    if (state.visited_files.count(resolved.path) > 0) {
        state.diagnostics.emit(Warning::overlay_config_merge_invalid,
                               warnings::overlay_config_merge_invalid(
                                   *merge_path, "already merged", source_path));
        return;
    }

    if (!is_regular_file(resolved.path)) {
        state.diagnostics.emit(Warning::overlay_config_merge_invalid,
                               warnings::overlay_config_merge_invalid(
                                   *merge_path, "file not found", source_path));
        return;
    }

    parse_config_file(resolved.path, state);
}

void handle_overlay(const XmlElement& element, const std::string& source_path,
                    ConfigParseState& state) {
    const std::string& partition_name = state.partition.name;

    auto package = element.attribute("package");
    if (!package || package->empty()) {
        state.diagnostics.emit(Warning::overlay_declaration_invalid,
                               warnings::overlay_declaration(
                                   "", partition_name, source_path,
                                   "package attribute missing at line " + std::to_string(element.line)));
        return;
    }

    PolicyFragment fragment;
    fragment.package_name = *package;
    fragment.partition = state.partition.id;
    fragment.configured = true;

    if (auto enabled = element.attribute("enabled")) {
        auto value = parse_xml_bool(*enabled);
        if (!value) {
            state.diagnostics.emit(Warning::overlay_declaration_invalid,
                                   warnings::overlay_declaration(
                                       *package, partition_name, source_path,
                                       "invalid enabled value: " + *enabled));
            return;
        }
        fragment.enabled = *value;
    }

    if (auto mut = element.attribute("mutable")) {
        auto value = parse_xml_bool(*mut);
        if (!value) {
            state.diagnostics.emit(Warning::overlay_declaration_invalid,
                                   warnings::overlay_declaration(
                                       *package, partition_name, source_path,
                                       "invalid mutable value: " + *mut));
            return;
        }
        fragment.is_mutable = *value;
    }

    auto overlay_it = state.overlays_by_package.find(*package);
    if (overlay_it == state.overlays_by_package.end()) {
        state.diagnostics.emit(Warning::overlay_declaration_unknown,
                               warnings::overlay_declaration(*package, partition_name, source_path));
        return;
    }

    if (overlay_it->second->is_static) {
        state.diagnostics.emit(Warning::overlay_declaration_static,
                               warnings::overlay_declaration(*package, partition_name, source_path));
        return;
    }

    if (!state.declared_packages.insert(*package).second) {
        state.diagnostics.emit(Warning::overlay_declaration_duplicate,
                               warnings::overlay_declaration(*package, partition_name, source_path));
        return;
    }

    fragment.overlay = *overlay_it->second;
    state.configured.push_back(std::move(fragment));
}

void parse_config_file(const std::string& path, ConfigParseState& state) {
    state.visited_files.insert(path);

    auto xml = parse_xml_file(path);
    if (!xml.ok) {
        state.diagnostics.emit(Warning::overlay_config_invalid,
                               warnings::overlay_config_invalid(xml.error, path));
        return;
    }

    if (xml.root.name != kConfigRootElement) {
        state.diagnostics.emit(Warning::overlay_config_invalid,
                               warnings::overlay_config_invalid(
                                   "root element is <" + xml.root.name + ">", path));
        return;
    }

    for (const auto& child : xml.root.children) {
        if (child.name == kMergeElement) {
            handle_merge(child, path, state);
        } else if (child.name == kOverlayElement) {
            handle_overlay(child, path, state);
        } else {
            state.diagnostics.emit(Warning::overlay_config_invalid,
                                   warnings::overlay_config_invalid(
                                       "unexpected element <" + child.name + "> at line " +
                                           std::to_string(child.line),
                                       path));
        }
    }
}

PolicyFragment unconfigured_fragment(const Partition& partition, const OverlayInfo& overlay) {
    PolicyFragment fragment;
    fragment.package_name = overlay.package_name;
    fragment.partition = partition.id;
    fragment.overlay = overlay;
    if (overlay.is_static) {
        fragment.enabled = true;
        fragment.is_mutable = false;
    }
    return fragment;
}

} // namespace

std::optional<bool> parse_xml_bool(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    return std::nullopt;
}

std::vector<PolicyFragment> parse_partition_config(const Partition& partition,
                                                   const std::vector<OverlayInfo>& overlays,
                                                   WarningCollector& diagnostics) {
    ConfigParseState state{partition, {}, {}, {}, {}, diagnostics};
    for (const auto& overlay : overlays) {
        state.overlays_by_package.emplace(overlay.package_name, &overlay);
    }

    // Normalized so that a <merge> back to config.xml is seen as already visited
    auto config_path = normalize_under_root(partition.config_dir(), kOverlayConfigFileName);
    if (config_path.ok && is_regular_file(config_path.path)) {
        parse_config_file(config_path.path, state);
    } else {
        spdlog::debug("No overlay config for partition {}", partition.name);
    }

    std::vector<PolicyFragment> fragments = std::move(state.configured);

    std::vector<const OverlayInfo*> unconfigured_static;
    std::vector<const OverlayInfo*> unconfigured_dynamic;
    for (const auto& overlay : overlays) {
        if (state.declared_packages.count(overlay.package_name) > 0) {
            continue;
        }
        (overlay.is_static ? unconfigured_static : unconfigured_dynamic).push_back(&overlay);
    }

    std::sort(unconfigured_static.begin(), unconfigured_static.end(),
              [](const OverlayInfo* a, const OverlayInfo* b) {
                  if (a->priority != b->priority) return a->priority < b->priority;
                  return a->package_name < b->package_name;
              });
    std::sort(unconfigured_dynamic.begin(), unconfigured_dynamic.end(),
              [](const OverlayInfo* a, const OverlayInfo* b) {
                  return a->package_name < b->package_name;
              });

    for (const auto* overlay : unconfigured_static) {
        fragments.push_back(unconfigured_fragment(partition, *overlay));
    }
    for (const auto* overlay : unconfigured_dynamic) {
        fragments.push_back(unconfigured_fragment(partition, *overlay));
    }

    spdlog::debug("Partition {}: {} policy fragment(s), {} configured",
                  partition.name, fragments.size(), state.declared_packages.size());
    return fragments;
}

} // namespace ocfg
