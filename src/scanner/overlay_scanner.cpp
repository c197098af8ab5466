#include "ocfg/overlay_scanner.hpp"
#include "ocfg/platform.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>

namespace ocfg {

namespace {

bool has_manifest_suffix(const std::string& filename) {
    const std::string suffix = kOverlayManifestSuffix;
    return filename.size() > suffix.size() &&
           filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<OverlayInfo> DirectoryOverlayScanner::scan(const std::string& overlay_dir,
                                                       WarningCollector& diagnostics) {
    std::vector<OverlayInfo> found;
    if (!is_directory(overlay_dir)) {
        spdlog::debug("No overlay directory at {}", overlay_dir);
        return found;
    }

    scan_directory(overlay_dir, 0, found, diagnostics);

    // First manifest per package wins
    std::vector<OverlayInfo> overlays;
    std::unordered_map<std::string, std::size_t> index_by_package;
    for (auto& overlay : found) {
        auto it = index_by_package.find(overlay.package_name);
        if (it != index_by_package.end()) {
            diagnostics.emit(Warning::overlay_duplicate,
                             warnings::overlay_duplicate(overlay.package_name,
                                                         overlays[it->second].path,
                                                         overlay.path));
            continue;
        }
        index_by_package.emplace(overlay.package_name, overlays.size());
        overlays.push_back(std::move(overlay));
    }

    spdlog::debug("Found {} overlay(s) in {}", overlays.size(), overlay_dir);
    return overlays;
}

void DirectoryOverlayScanner::scan_directory(const std::string& dir, int depth,
                                             std::vector<OverlayInfo>& out,
                                             WarningCollector& diagnostics) {
    for (const auto& name : list_directory(dir)) {
        std::string path = join_path(dir, name);

        if (is_directory(path)) {
            if (depth + 1 < max_depth_) {
                scan_directory(path, depth + 1, out, diagnostics);
            } else {
                spdlog::debug("Not descending into {}: depth limit {}", path, max_depth_);
            }
            continue;
        }

        if (!has_manifest_suffix(name) || !is_regular_file(path)) {
            continue;
        }

        auto content = read_file(path);
        if (!content) {
            diagnostics.emit(Warning::overlay_manifest_invalid,
                             warnings::overlay_manifest_invalid("unreadable", path));
            continue;
        }

        auto parsed = parse_overlay_manifest(*content, path);
        if (!parsed.ok) {
            diagnostics.emit(Warning::overlay_manifest_invalid,
                             warnings::overlay_manifest_invalid(parsed.error, path));
            continue;
        }
        out.push_back(std::move(parsed.overlay));
    }
}

ScannerFactory make_directory_scanner_factory(int max_depth) {
    return [max_depth]() -> std::unique_ptr<OverlayScanner> {
        return std::make_unique<DirectoryOverlayScanner>(max_depth);
    };
}

} // namespace ocfg
