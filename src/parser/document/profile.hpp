#pragma once
// Profile extraction from the first table of a page (the "infobox"): key/value rows, with the
// relation field spread over two rows (the label row, then a row listing the related names).

#include <string>
#include <vector>
#include <set>
#include <utility>

#include "../ast/node.hpp"
#include "../parser.hpp"
#include "text.hpp"

namespace parser {
namespace document {

struct Profile {
    Ordered<std::string> fields;
    std::vector<std::string> relation_names;
    std::string relation_key; // set once the relation rows were read

    bool empty() const { return fields.empty() && relation_names.empty(); }

    const std::string* get(const std::string& key) const { return lookup(fields, key); }

    void set(const std::string& key, std::string value) { upsert(fields, key) = std::move(value); }
};

struct ProfileRules {
    std::set<std::string> header_labels; // header rows repeated inside the body
    std::string relation_key;            // empty: no two-row relation field
};

namespace detail {

// Annotations such as "（注）" or "备注：..." are not names.
inline bool is_annotation(const std::string& name) {
    return contains(name, "）") || contains(name, ")") || contains(name, "：") || contains(name, ":");
}

inline void collect_names(const ast::Node& node, std::vector<std::string>& names) {
    using ast::NodeKind;
    switch (node.kind) {
        case NodeKind::Link:
            for (const auto& c : node.children) {
                if (c.kind == NodeKind::Text) names.push_back(trim(c.raw));
            }
            break;
        case NodeKind::Text:
            for (const auto& piece : split(replace_all(node.raw, "、", ","), ',')) {
                std::string name = trim(piece);
                if (!name.empty()) names.push_back(std::move(name));
            }
            break;
        default:
            for (const auto& c : node.children) collect_names(c, names);
            break;
    }
}

inline std::string cell_text(const ast::Node& row, std::size_t index) {
    if (index >= row.children.size()) return {};
    return flatten_trimmed(row.children[index], FlattenPolicy::Raw);
}

} // namespace detail

// Names from a relation cell: link texts and comma/、-separated plain text, annotations removed.
inline std::vector<std::string> extract_relation_names(const ast::Node& cell) {
    std::vector<std::string> raw;
    detail::collect_names(cell, raw);
    std::vector<std::string> out;
    for (auto& name : raw) {
        if (name.empty() || detail::is_annotation(name)) continue;
        out.push_back(std::move(name));
    }
    return out;
}

// Reads only the first top-level table; later tables are never the profile.
inline Profile extract_profile(const ast::Document& doc, const ProfileRules& rules) {
    using ast::NodeKind;
    Profile profile;

    for (const auto& node : doc) {
        if (node.kind != NodeKind::Table) continue;

        for (const auto& part : node.children) {
            if (part.kind != NodeKind::TableBody) continue;
            const auto& rows = part.children;

            std::size_t i = 0;
            while (i < rows.size()) {
                const ast::Node& row = rows[i];
                if (row.kind != NodeKind::TableRow) { ++i; continue; }

                std::string key = detail::cell_text(row, 0);
                std::string value = detail::cell_text(row, 1);
                if (key.empty() || rules.header_labels.count(key)) { ++i; continue; }

                if (!rules.relation_key.empty() && key == rules.relation_key && i + 1 < rows.size()) {
                    const ast::Node& names_row = rows[i + 1];
                    if (!names_row.children.empty()) {
                        profile.relation_key = key;
                        profile.relation_names = extract_relation_names(names_row.children.front());
                        profile.set(key, join(profile.relation_names, ","));
                    }
                    i += 2;
                    continue;
                }

                if (!value.empty()) profile.set(key, value);
                ++i;
            }
        }
        break;
    }
    return profile;
}

} // namespace document
} // namespace parser
