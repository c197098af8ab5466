#include "ocfg/path_utils.hpp"
#include "ocfg/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace ocfg {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

} // namespace

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    if (!relative_path.empty() && (relative_path[0] == '/' || relative_path[0] == '\\')) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> components = split(relative_path, '/');

    std::vector<std::string> normalized;
    for (const auto& part : components) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = join_components(root, normalized);
    if (!is_within_root(root, out)) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

bool is_within_root(const std::string& root, const std::string& path) {
    auto lex_root = std::filesystem::path(root).lexically_normal();
    auto lex_path = std::filesystem::path(path).lexically_normal();

    // A trailing separator leaves an empty final element
    if (!lex_root.empty() && lex_root.filename().empty()) {
        lex_root = lex_root.parent_path();
    }

    auto root_it = lex_root.begin();
    auto path_it = lex_path.begin();
    for (; root_it != lex_root.end() && path_it != lex_path.end(); ++root_it, ++path_it) {
        if (*root_it != *path_it) {
            return false;
        }
    }
    return root_it == lex_root.end();
}

} // namespace ocfg
