#pragma once
// Filesystem helpers (header-only)
// All path strings in and out are UTF-8.

#include <string>
#include <vector>
#include <fstream>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace app {
namespace settings {
namespace helpers {
namespace fs_ops {

inline std::filesystem::path to_path(const std::string& utf8) {
    return std::filesystem::u8path(utf8);
}

inline std::string from_path(const std::filesystem::path& p) {
    return p.u8string();
}

inline bool is_dir(const std::string& path) {
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(to_path(path), ec);
}

// Create directory (and parents) if missing
inline bool ensure_dir(const std::string& path) {
    if (path.empty()) return false;
    const auto p = to_path(path);
    std::error_code ec;
    std::filesystem::create_directories(p, ec);
    return !ec && std::filesystem::is_directory(p, ec);
}

inline std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    return from_path(to_path(a) / to_path(b));
}

// Names (not paths) of the regular files directly inside `dir`, sorted.
inline bool list_files(const std::string& dir, std::vector<std::string>& out) {
    out.clear();
    std::error_code ec;
    std::filesystem::directory_iterator it(to_path(dir), ec), end;
    if (ec) return false;
    for (; it != end; it.increment(ec)) {
        if (ec) return false;
        std::error_code fec;
        if (it->is_regular_file(fec)) out.push_back(from_path(it->path().filename()));
    }
    std::sort(out.begin(), out.end());
    return true;
}

inline bool write_file(const std::string& path, const std::string& data) {
    std::ofstream out(to_path(path), std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) return false;
    out << data;
    return out.good();
}

} // namespace fs_ops
} // namespace helpers
} // namespace settings
} // namespace app
