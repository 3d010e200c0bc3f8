#pragma once
// String helpers shared by the document, entity and revision modules.
// All helpers operate on UTF-8 byte strings; multi-byte characters are never split.

#include <string>
#include <vector>
#include <utility>
#include <cctype>

namespace parser {

namespace detail {

// Length of a trailing/leading non-ASCII blank at s[pos], 0 when none.
// Covers NBSP (C2 A0) and the ideographic space (E3 80 80) common in wiki text.
inline std::size_t utf8_blank_at(const std::string& s, std::size_t pos) {
    if (pos + 1 < s.size() && (unsigned char)s[pos] == 0xC2 && (unsigned char)s[pos + 1] == 0xA0) return 2;
    if (pos + 2 < s.size() && (unsigned char)s[pos] == 0xE3 && (unsigned char)s[pos + 1] == 0x80 &&
        (unsigned char)s[pos + 2] == 0x80) return 3;
    return 0;
}

inline std::size_t utf8_blank_before(const std::string& s, std::size_t end) {
    if (end >= 2 && (unsigned char)s[end - 2] == 0xC2 && (unsigned char)s[end - 1] == 0xA0) return 2;
    if (end >= 3 && (unsigned char)s[end - 3] == 0xE3 && (unsigned char)s[end - 2] == 0x80 &&
        (unsigned char)s[end - 1] == 0x80) return 3;
    return 0;
}

} // namespace detail

inline std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e) {
        if (std::isspace(static_cast<unsigned char>(s[b]))) { ++b; continue; }
        std::size_t n = detail::utf8_blank_at(s, b);
        if (n == 0 || b + n > e) break;
        b += n;
    }
    while (e > b) {
        if (std::isspace(static_cast<unsigned char>(s[e - 1]))) { --e; continue; }
        std::size_t n = detail::utf8_blank_before(s, e);
        if (n == 0 || e - n < b) break;
        e -= n;
    }
    return s.substr(b, e - b);
}

inline bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

inline std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// Split on a single-byte delimiter, keeping empty pieces.
inline std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        std::size_t sep = s.find(delim, start);
        out.push_back(s.substr(start, sep == std::string::npos ? std::string::npos : sep - start));
        if (sep == std::string::npos) break;
        start = sep + 1;
    }
    return out;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

// Insertion-ordered string map. Writing an existing key replaces its value in place.
template <typename V>
using Ordered = std::vector<std::pair<std::string, V>>;

template <typename V>
V& upsert(Ordered<V>& m, const std::string& key) {
    for (auto& kv : m) {
        if (kv.first == key) return kv.second;
    }
    m.emplace_back(key, V{});
    return m.back().second;
}

template <typename V>
const V* lookup(const Ordered<V>& m, const std::string& key) {
    for (const auto& kv : m) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

template <typename V>
V* lookup(Ordered<V>& m, const std::string& key) {
    for (auto& kv : m) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

} // namespace parser
