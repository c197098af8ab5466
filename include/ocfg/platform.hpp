#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ocfg {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Filesystem queries. None of these throw; an inaccessible path reads as absent.
bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Directory whose entries can be enumerated by this process
bool is_listable_directory(const std::string& path);

// List directory entry names, sorted. Empty when the path is not a directory.
std::vector<std::string> list_directory(const std::string& path);

// Read a whole file; nullopt when it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Generate a UUID string
std::string generate_uuid();

} // namespace ocfg
