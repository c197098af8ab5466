#include "ocfg/overlay_config.hpp"
#include "ocfg/partition_order.hpp"
#include "ocfg/platform.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace ocfg {

namespace {

// What one partition contributes before the merge
struct PartitionContribution {
    std::vector<PolicyFragment> fragments;
    WarningCollector diagnostics;
};

using ProvidedOverlays = std::vector<std::vector<OverlayInfo>>;

// Assign provider overlays to the partitions whose overlay directory holds them
ProvidedOverlays bucket_provided_overlays(const PackageProvider& provider,
                                          const PartitionOrder& order,
                                          WarningCollector& diagnostics) {
    ProvidedOverlays buckets(order.size());
    std::vector<std::unordered_set<std::string>> seen(order.size());

    provider.forEachOverlay([&](const OverlayInfo& overlay) {
        for (std::size_t i = 0; i < order.size(); ++i) {
            if (!order[i].contains_path(overlay.path)) {
                continue;
            }
            if (!seen[i].insert(overlay.package_name).second) {
                auto kept = std::find_if(buckets[i].begin(), buckets[i].end(),
                                         [&](const OverlayInfo& o) {
                                             return o.package_name == overlay.package_name;
                                         });
                diagnostics.emit(Warning::overlay_duplicate,
                                 warnings::overlay_duplicate(overlay.package_name,
                                                             kept->path, overlay.path));
                return;
            }
            buckets[i].push_back(overlay);
            return;
        }
        diagnostics.emit(Warning::overlay_outside_partitions,
                         warnings::overlay_outside_partitions(overlay.package_name, overlay.path));
    });

    return buckets;
}

PartitionContribution collect_partition(const Partition& partition,
                                        const ResolveInputs& inputs,
                                        const ProvidedOverlays* provided,
                                        std::size_t index,
                                        const WarningCollector& parent) {
    PartitionContribution contribution;
    contribution.diagnostics.set_policy(parent.policy());

    std::vector<OverlayInfo> overlays;
    if (provided) {
        overlays = (*provided)[index];
    } else {
        std::unique_ptr<OverlayScanner> scanner;
        if (inputs.scanner_factory) {
            scanner = inputs.scanner_factory();
        } else {
            scanner = std::make_unique<DirectoryOverlayScanner>();
        }
        if (!scanner) {
            throw std::runtime_error("scanner factory returned no scanner");
        }
        overlays = scanner->scan(partition.overlay_dir(), contribution.diagnostics);
    }

    contribution.fragments = parse_partition_config(partition, overlays, contribution.diagnostics);
    return contribution;
}

} // namespace

// ============================================================================
// ConfigurationTable
// ============================================================================

ConfigurationTable::ConfigurationTable(std::map<std::string, Configuration> entries,
                                       PartitionOrder partition_order,
                                       bool default_partition_order)
    : entries_(std::move(entries)),
      partition_order_(std::move(partition_order)),
      default_partition_order_(default_partition_order) {}

const Configuration* ConfigurationTable::find(const std::string& package_name) const {
    auto it = entries_.find(package_name);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<Configuration> ConfigurationTable::sortedOverlays() const {
    std::vector<Configuration> sorted;
    sorted.reserve(entries_.size());
    for (const auto& [name, config] : entries_) {
        sorted.push_back(config);
    }
    std::sort(sorted.begin(), sorted.end(), [](const Configuration& a, const Configuration& b) {
        if (a.config_index != b.config_index) return a.config_index < b.config_index;
        return a.partition_position < b.partition_position;
    });
    return sorted;
}

// ============================================================================
// Resolution
// ============================================================================

Result<ConfigurationTable> resolve(const ResolveInputs& inputs) {
    if (inputs.root.empty() || !is_directory(inputs.root)) {
        return Result<ConfigurationTable>::err(
            Error(ErrorCode::ROOT_INACCESSIBLE, "root directory not accessible: " + inputs.root));
    }
    // An unreadable root would otherwise read as six empty partitions
    if (!is_listable_directory(inputs.root)) {
        return Result<ConfigurationTable>::err(
            Error(ErrorCode::ROOT_INACCESSIBLE, "root directory not readable: " + inputs.root));
    }

    WarningCollector local_diagnostics;
    WarningCollector& diagnostics = inputs.diagnostics ? *inputs.diagnostics : local_diagnostics;

    // 1. Effective partition order
    PartitionOrder defaults = make_partitions(inputs.root);
    std::string override_path = join_path(inputs.root, kPartitionOrderRelativePath);
    auto order_result = resolve_partition_order(override_path, defaults);
    if (order_result.accepted) {
        spdlog::info("Partition order from {}: {}", override_path,
                     render_partition_order(order_result.order));
    } else if (path_exists(override_path)) {
        diagnostics.emit(Warning::partition_order_rejected,
                         warnings::partition_order_rejected(order_result.reason, override_path));
    } else {
        spdlog::debug("No partition order override, using default order");
    }
    const PartitionOrder& order = order_result.order;

    // 2. Per-partition fragments; collection may run in parallel, merge never does
    std::vector<PartitionContribution> contributions;
    contributions.reserve(order.size());
    try {
        ProvidedOverlays provided;
        if (inputs.package_provider) {
            provided = bucket_provided_overlays(*inputs.package_provider, order, diagnostics);
        }
        const ProvidedOverlays* provided_ptr = inputs.package_provider ? &provided : nullptr;

        if (inputs.parallel_scan) {
            std::vector<std::future<PartitionContribution>> pending;
            pending.reserve(order.size());
            for (std::size_t i = 0; i < order.size(); ++i) {
                pending.push_back(std::async(std::launch::async, collect_partition,
                                             std::cref(order[i]), std::cref(inputs),
                                             provided_ptr, i, std::cref(diagnostics)));
            }
            for (auto& future : pending) {
                contributions.push_back(future.get());
            }
        } else {
            for (std::size_t i = 0; i < order.size(); ++i) {
                contributions.push_back(
                    collect_partition(order[i], inputs, provided_ptr, i, diagnostics));
            }
        }
    } catch (const std::exception& e) {
        return Result<ConfigurationTable>::err(
            Error(ErrorCode::IO_ERROR, std::string("overlay scan failed: ") + e.what()));
    }

    // 3. Merge in effective order; later partitions replace earlier ones
    std::map<std::string, Configuration> entries;
    for (std::size_t i = 0; i < order.size(); ++i) {
        diagnostics.append(contributions[i].diagnostics);

        int position = 0;
        for (auto& fragment : contributions[i].fragments) {
            auto existing = entries.find(fragment.package_name);
            if (existing != entries.end()) {
                spdlog::debug("{}: {} overrides {}", fragment.package_name,
                              order[i].name, existing->second.partition);
            }

            Configuration config;
            config.package_name = fragment.package_name;
            config.enabled = fragment.enabled;
            config.is_mutable = fragment.is_mutable;
            config.config_index = static_cast<int>(i);
            config.partition = order[i].name;
            config.partition_position = position++;
            config.overlay = std::move(fragment.overlay);
            entries[config.package_name] = std::move(config);
        }
    }

    spdlog::info("Resolved {} overlay configuration(s), partition order: {}",
                 entries.size(), render_partition_order(order));

    return Result<ConfigurationTable>::ok(
        ConfigurationTable(std::move(entries), order, !order_result.accepted));
}

Result<ConfigurationTable> resolve(const std::string& root,
                                   ScannerFactory scanner_factory,
                                   std::shared_ptr<const PackageProvider> package_provider) {
    ResolveInputs inputs;
    inputs.root = root;
    inputs.scanner_factory = std::move(scanner_factory);
    inputs.package_provider = std::move(package_provider);
    return resolve(inputs);
}

// ============================================================================
// OverlayConfig
// ============================================================================

Result<std::unique_ptr<OverlayConfig>> OverlayConfig::create(const ResolveInputs& inputs) {
    auto table = resolve(inputs);
    if (table.isErr()) {
        return Result<std::unique_ptr<OverlayConfig>>::err(table.error());
    }
    return Result<std::unique_ptr<OverlayConfig>>::ok(
        std::make_unique<OverlayConfig>(std::move(table.value())));
}

std::optional<Configuration> OverlayConfig::getConfiguration(const std::string& package_name) const {
    const Configuration* config = table_.find(package_name);
    if (!config) {
        return std::nullopt;
    }
    return *config;
}

bool OverlayConfig::isEnabled(const std::string& package_name) const {
    const Configuration* config = table_.find(package_name);
    return config ? config->enabled : kDefaultOverlayEnabled;
}

bool OverlayConfig::isMutable(const std::string& package_name) const {
    const Configuration* config = table_.find(package_name);
    return config ? config->is_mutable : kDefaultOverlayMutable;
}

int OverlayConfig::getPriority(const std::string& package_name) const {
    const Configuration* config = table_.find(package_name);
    return config ? config->config_index : -1;
}

bool OverlayConfig::sortPartitions(const std::string& override_path,
                                   PartitionOrder& partitions) const {
    return sort_partitions(override_path, partitions);
}

} // namespace ocfg
