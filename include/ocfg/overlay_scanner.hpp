#pragma once

#include "ocfg/warnings.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ocfg {

// ============================================================================
// Overlay Package Descriptor
// ============================================================================

// Manifest files are recognised by this suffix anywhere below <partition>/overlay
constexpr const char* kOverlayManifestSuffix = ".overlay.json";

struct OverlayInfo {
    std::string package_name;
    std::string target_package;
    std::string target_name;    // optional overlayable name
    bool is_static = false;
    int priority = 0;           // ordering hint among static overlays
    std::string path;           // manifest path

    bool operator==(const OverlayInfo& other) const {
        return package_name == other.package_name &&
               target_package == other.target_package &&
               target_name == other.target_name &&
               is_static == other.is_static &&
               priority == other.priority &&
               path == other.path;
    }
    bool operator!=(const OverlayInfo& other) const { return !(*this == other); }
};

struct OverlayManifestParseResult {
    bool ok = false;
    std::string error;
    OverlayInfo overlay;
};

/**
 * Parse an overlay manifest:
 * {
 *   "package": "com.example.overlay",     (required)
 *   "target_package": "android",          (required)
 *   "target_name": "Theme",               (optional)
 *   "static": false,                      (optional)
 *   "priority": 0                         (optional)
 * }
 */
OverlayManifestParseResult parse_overlay_manifest(const std::string& json_str,
                                                  const std::string& source_path = "");

// ============================================================================
// Package Scanner (collaborator)
// ============================================================================

/**
 * @brief Enumerates overlay packages below one directory
 *
 * Each call is a single pass; descriptors that cannot be read are
 * reported to diagnostics and left out of the result.
 */
class OverlayScanner {
public:
    virtual ~OverlayScanner() = default;

    virtual std::vector<OverlayInfo> scan(const std::string& overlay_dir,
                                          WarningCollector& diagnostics) = 0;
};

/**
 * @brief Filesystem scanner reading *.overlay.json manifests
 *
 * Visits entries in name order and descends at most max_depth directory
 * levels. A package seen twice keeps its first manifest.
 */
class DirectoryOverlayScanner : public OverlayScanner {
public:
    static constexpr int kDefaultMaxDepth = 8;

    explicit DirectoryOverlayScanner(int max_depth = kDefaultMaxDepth)
        : max_depth_(max_depth) {}

    std::vector<OverlayInfo> scan(const std::string& overlay_dir,
                                  WarningCollector& diagnostics) override;

private:
    void scan_directory(const std::string& dir, int depth,
                        std::vector<OverlayInfo>& out,
                        WarningCollector& diagnostics);

    int max_depth_;
};

using ScannerFactory = std::function<std::unique_ptr<OverlayScanner>()>;

// Factory producing DirectoryOverlayScanner instances
ScannerFactory make_directory_scanner_factory(int max_depth = DirectoryOverlayScanner::kDefaultMaxDepth);

// ============================================================================
// Package Provider (collaborator)
// ============================================================================

/**
 * @brief Source of already-parsed overlay packages
 *
 * Used instead of scanning when another component (for instance a package
 * manager) has parsed the overlays already. Overlays are assigned to
 * partitions by their path.
 */
class PackageProvider {
public:
    virtual ~PackageProvider() = default;

    virtual void forEachOverlay(const std::function<void(const OverlayInfo&)>& visit) const = 0;
};

} // namespace ocfg
