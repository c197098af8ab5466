#pragma once

/**
 * @file overlay_config.hpp
 * @brief Overlay configuration resolution
 *
 * Resolves, once per run, the effective partition order and a policy
 * record for every overlay package found in the partitions:
 *
 * ```cpp
 * #include <ocfg/overlay_config.hpp>
 *
 * ocfg::ResolveInputs inputs;
 * inputs.root = "/";
 * auto config = ocfg::OverlayConfig::create(inputs);
 * if (config.isOk()) {
 *     int priority = config.value()->getPriority("com.example.overlay");
 * }
 * ```
 */

#include "ocfg/overlay_config_parser.hpp"
#include "ocfg/overlay_scanner.hpp"
#include "ocfg/partition.hpp"
#include "ocfg/result.hpp"
#include "ocfg/warnings.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ocfg {

// ============================================================================
// Resolved Configuration
// ============================================================================

struct Configuration {
    std::string package_name;
    bool enabled = kDefaultOverlayEnabled;
    bool is_mutable = kDefaultOverlayMutable;
    int config_index = -1;           // position of the owning partition in the effective order
    std::string partition;           // owning partition name
    int partition_position = 0;      // fragment position within the owning partition
    OverlayInfo overlay;

    bool operator==(const Configuration& other) const {
        return package_name == other.package_name &&
               enabled == other.enabled &&
               is_mutable == other.is_mutable &&
               config_index == other.config_index &&
               partition == other.partition &&
               partition_position == other.partition_position &&
               overlay == other.overlay;
    }
    bool operator!=(const Configuration& other) const { return !(*this == other); }
};

/**
 * @brief Immutable result of one resolver run
 */
class ConfigurationTable {
public:
    ConfigurationTable() = default;
    ConfigurationTable(std::map<std::string, Configuration> entries,
                       PartitionOrder partition_order,
                       bool default_partition_order);

    /// Configuration for a package, nullptr when the package is unknown
    const Configuration* find(const std::string& package_name) const;

    /// Entries keyed by package name
    const std::map<std::string, Configuration>& entries() const { return entries_; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const PartitionOrder& partitionOrder() const { return partition_order_; }

    /// Comma-joined effective order, e.g. "system, vendor, odm, oem, product, system_ext"
    std::string partitionOrderString() const { return render_partition_order(partition_order_); }

    bool isDefaultPartitionOrder() const { return default_partition_order_; }

    /// Configurations ordered by (config_index, partition_position)
    std::vector<Configuration> sortedOverlays() const;

    bool operator==(const ConfigurationTable& other) const {
        return entries_ == other.entries_ &&
               partition_order_ == other.partition_order_ &&
               default_partition_order_ == other.default_partition_order_;
    }
    bool operator!=(const ConfigurationTable& other) const { return !(*this == other); }

private:
    std::map<std::string, Configuration> entries_;
    PartitionOrder partition_order_;
    bool default_partition_order_ = true;
};

// JSON rendering of a table for diagnostics
std::string serialize_configuration_table(const ConfigurationTable& table);

// ============================================================================
// Resolution Engine
// ============================================================================

struct ResolveInputs {
    std::string root;                                   // directory holding the partitions
    ScannerFactory scanner_factory;                     // empty: DirectoryOverlayScanner
    std::shared_ptr<const PackageProvider> package_provider;  // replaces scanning when set
    bool parallel_scan = false;
    WarningCollector* diagnostics = nullptr;            // optional side channel, borrowed for one call
};

/**
 * @brief Resolve the overlay configuration below a root directory
 *
 * Partitions are processed in the effective order; a package mentioned
 * by several partitions takes the policy and index of the last one.
 * Only an inaccessible root is an error.
 */
Result<ConfigurationTable> resolve(const ResolveInputs& inputs);

Result<ConfigurationTable> resolve(const std::string& root,
                                   ScannerFactory scanner_factory,
                                   std::shared_ptr<const PackageProvider> package_provider = nullptr);

// ============================================================================
// OverlayConfig Class
// ============================================================================

/**
 * @brief Query surface over one resolved configuration table
 */
class OverlayConfig {
public:
    /**
     * @brief Resolve the configuration and wrap it
     * @param inputs Root directory and collaborators
     * @return OverlayConfig or the fatal resolve error
     */
    static Result<std::unique_ptr<OverlayConfig>> create(const ResolveInputs& inputs);

    explicit OverlayConfig(ConfigurationTable table) : table_(std::move(table)) {}

    /// Configuration of a package, nullopt when no partition provides it
    std::optional<Configuration> getConfiguration(const std::string& package_name) const;

    /// Enabled state; false for unknown packages
    bool isEnabled(const std::string& package_name) const;

    /// Mutability; true for unknown packages
    bool isMutable(const std::string& package_name) const;

    /// Configuration index; -1 for unknown packages
    int getPriority(const std::string& package_name) const;

    /// Effective partition order, comma-joined
    std::string getPartitionOrder() const { return table_.partitionOrderString(); }

    bool isDefaultPartitionOrder() const { return table_.isDefaultPartitionOrder(); }

    /// In-place reordering of a caller-owned list, see sort_partitions()
    bool sortPartitions(const std::string& override_path, PartitionOrder& partitions) const;

    /// All configurations in priority order
    std::vector<Configuration> getSortedOverlays() const { return table_.sortedOverlays(); }

    const ConfigurationTable& table() const { return table_; }

private:
    ConfigurationTable table_;
};

// ============================================================================
// Process Cache
// ============================================================================

/**
 * @brief Lazily-initialized, single-assignment holder of the process-wide
 * OverlayConfig
 *
 * get() resolves on first use and returns the same snapshot afterwards.
 * Failed resolutions are not cached. rescan() is the only way to replace
 * a held snapshot; invalidate() drops it so the next get() resolves again.
 *
 * The cache never keeps inputs.diagnostics; every resolution reports to
 * the collector it shares ownership of.
 */
class OverlayConfigCache {
public:
    explicit OverlayConfigCache(ResolveInputs inputs,
                                std::shared_ptr<WarningCollector> diagnostics = nullptr);

    Result<std::shared_ptr<const OverlayConfig>> get();
    Result<std::shared_ptr<const OverlayConfig>> rescan();
    void invalidate();
    bool isInitialized() const;

    /// Collector receiving the warnings of every resolution, nullptr when none
    std::shared_ptr<WarningCollector> diagnostics() const { return diagnostics_; }

private:
    Result<std::shared_ptr<const OverlayConfig>> resolveLocked();

    ResolveInputs inputs_;
    std::shared_ptr<WarningCollector> diagnostics_;
    mutable std::mutex mutex_;
    std::shared_ptr<const OverlayConfig> config_;
};

} // namespace ocfg
