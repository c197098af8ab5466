#pragma once

#include <string>

namespace ocfg {

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "contains_nul";
        case PathError::AbsoluteNotAllowed: return "absolute_not_allowed";
        case PathError::EscapesRoot: return "escapes_root";
        default: return "unknown";
    }
}

struct PathResult {
    bool ok;
    std::string path;  // normalized path under root when ok
    PathError error;
};

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects absolute relative_path
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path);

// Lexical containment test: true when path equals root or lies below it
bool is_within_root(const std::string& root, const std::string& path);

} // namespace ocfg
