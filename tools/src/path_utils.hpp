// Common filesystem/path helpers for mockforge codegen.
#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace mockforge::codegen {

namespace fs = std::filesystem;

inline fs::path normalize_path(const fs::path &path) {
    std::error_code ec;
    fs::path        out = path;
    if (!out.is_absolute()) {
        out = fs::absolute(out, ec);
        if (ec) {
            return path;
        }
    }
    ec.clear();
    out = fs::weakly_canonical(out, ec);
    if (ec) {
        return path;
    }
    return out;
}

inline std::string ascii_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

#if defined(_WIN32)
inline std::string path_component_key(const fs::path &part) { return ascii_lower_copy(part.generic_string()); }
#else
inline std::string path_component_key(const fs::path &part) { return part.generic_string(); }
#endif

// True when `path` is `root` or lies below it, compared component by component.
inline bool is_path_within(const fs::path &path, const fs::path &root) {
    if (root.empty()) {
        return false;
    }
    const fs::path inner = normalize_path(path);
    const fs::path outer = normalize_path(root);

    auto it = inner.begin();
    for (const auto &part : outer) {
        if (part.empty()) {
            continue; // trailing separator
        }
        if (it == inner.end() || path_component_key(*it) != path_component_key(part)) {
            return false;
        }
        ++it;
    }
    return true;
}

// Spelling used in `#include "..."` for `header`: relative to the first include
// directory that contains it, else relative to `fallback_dir`, else the file name.
inline std::string include_spelling(const fs::path &header, const std::vector<fs::path> &include_dirs, const fs::path &fallback_dir) {
    const fs::path normalized = normalize_path(header);
    for (const auto &dir : include_dirs) {
        if (is_path_within(normalized, dir)) {
            return normalized.lexically_relative(normalize_path(dir)).generic_string();
        }
    }
    if (!fallback_dir.empty()) {
        const fs::path rel = normalized.lexically_relative(normalize_path(fallback_dir));
        if (!rel.empty()) {
            return rel.generic_string();
        }
    }
    return normalized.filename().generic_string();
}

} // namespace mockforge::codegen
