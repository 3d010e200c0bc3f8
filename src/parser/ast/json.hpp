#pragma once
// Reads the block tree from the Markdown parser's JSON AST dump:
//   [{"type": "heading", "attrs": {"level": 2}, "children": [{"type": "text", "raw": "..."}]}, ...]
// Malformed entries (no string "type") are skipped; only a non-array root is fatal.

#include <string>
#include <cstdint>
#include <fstream>
#include <utility>
#include <filesystem>

#include <nlohmann/json.hpp>

#include "node.hpp"
#include "../../types.hpp"
#include "../../logger.hpp"

namespace parser {
namespace ast {

namespace detail {

inline int read_level(const nlohmann::json& j) {
    if (!j.contains("attrs") || !j["attrs"].is_object()) return 0;
    const auto& attrs = j["attrs"];
    if (!attrs.contains("level") || !attrs["level"].is_number_integer()) return 0;
    const std::int64_t level = attrs["level"].get<std::int64_t>();
    if (level < 1 || level > 6) return 0;
    return static_cast<int>(level);
}

} // namespace detail

// Converts one JSON node. Returns false if the entry is not a node at all.
inline bool node_from_json(const nlohmann::json& j, Node& out, logger::Sink* log = nullptr) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        if (log) log->warn("ast: skipping entry without a type");
        return false;
    }

    Node n;
    n.type_name = j["type"].get<std::string>();
    if (!kind_from_name(n.type_name, n.kind)) n.kind = NodeKind::Other;

    if (j.contains("raw") && j["raw"].is_string()) n.raw = j["raw"].get<std::string>();

    if (n.kind == NodeKind::Heading) {
        n.level = detail::read_level(j);
        if (n.level < 1 || n.level > 6) {
            // Without a usable level the heading cannot delimit anything; keep its text.
            if (log) log->warn("ast: heading without a valid level, treated as plain content");
            n.kind = NodeKind::Other;
            n.level = 0;
        }
    }

    if (n.kind == NodeKind::Image && j.contains("attrs") && j["attrs"].is_object()) {
        const auto& attrs = j["attrs"];
        if (attrs.contains("title") && attrs["title"].is_string()) n.title = attrs["title"].get<std::string>();
    }

    if (j.contains("children") && j["children"].is_array()) {
        n.children.reserve(j["children"].size());
        for (const auto& c : j["children"]) {
            Node child;
            if (node_from_json(c, child, log)) n.children.push_back(std::move(child));
        }
    }

    out = std::move(n);
    return true;
}

// Converts a whole document. The root must be an array of nodes.
inline bool document_from_json(const nlohmann::json& root, Document& out, types::Error* err = nullptr,
                               logger::Sink* log = nullptr) {
    out.clear();
    if (!root.is_array()) {
        if (err) err->message = "document root is not an array of nodes";
        return false;
    }
    out.reserve(root.size());
    for (const auto& j : root) {
        Node n;
        if (node_from_json(j, n, log)) out.push_back(std::move(n));
    }
    return true;
}

inline bool parse_document(const std::string& text, Document& out, types::Error* err = nullptr,
                           logger::Sink* log = nullptr) {
    try {
        nlohmann::json root = nlohmann::json::parse(text);
        return document_from_json(root, out, err, log);
    } catch (const nlohmann::json::exception& e) {
        out.clear();
        if (err) err->message = std::string("invalid JSON: ") + e.what();
        return false;
    }
}

inline bool load_document(const std::string& path, Document& out, types::Error* err = nullptr,
                          logger::Sink* log = nullptr) {
    std::ifstream in(std::filesystem::u8path(path), std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        out.clear();
        if (err) err->message = "cannot open " + path;
        return false;
    }
    try {
        nlohmann::json root;
        in >> root;
        return document_from_json(root, out, err, log);
    } catch (const nlohmann::json::exception& e) {
        out.clear();
        if (err) err->message = path + ": invalid JSON: " + e.what();
        return false;
    }
}

} // namespace ast
} // namespace parser
