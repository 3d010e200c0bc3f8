#pragma once
// Heading-driven structuring of a document:
//  - segment():         split the top level into whitelisted sections at the major heading level
//  - group_by_level():  nested outline of a section, one Section per heading, recursing deeper
//  - flatten_content(): one flat level of sub-blocks keyed by a minor heading level

#include <string>
#include <vector>
#include <set>
#include <variant>
#include <optional>
#include <algorithm>
#include <utility>

#include "../ast/node.hpp"
#include "../parser.hpp"
#include "../../types.hpp"
#include "text.hpp"
#include "table.hpp"

namespace parser {
namespace document {

struct SubBlock {
    std::string title;
    std::vector<std::string> content;
};

using ContentItem = std::variant<std::string, SubBlock>;

struct Section {
    std::string title;
    std::vector<ContentItem> content;
    std::vector<Section> subsections; // empty when the section has none
};

using SectionNodes = Ordered<std::vector<ast::Node>>;

struct StructureOptions {
    types::OrphanPolicy orphans = types::OrphanPolicy::Drop;
    std::string preamble_title = "preamble";
};

// How a list block becomes content.
enum class ListPolicy {
    Join,   // one entry, items separated by newlines
    Expand, // one entry per item
    Skip    // lists are not content
};

inline bool is_leaf_block(const ast::Node& n) {
    return n.kind == ast::NodeKind::Paragraph || n.kind == ast::NodeKind::List || n.kind == ast::NodeKind::Table;
}

// Text form of a paragraph, list or table; empty for anything else.
inline std::string leaf_text(const ast::Node& n) {
    switch (n.kind) {
        case ast::NodeKind::Paragraph: return flatten_trimmed(n);
        case ast::NodeKind::List:      return flatten_list(n);
        case ast::NodeKind::Table:     return to_text(n);
        default:                       return {};
    }
}

inline std::vector<std::string> leaf_texts(const ast::Node& n, ListPolicy lists) {
    std::vector<std::string> out;
    if (n.kind == ast::NodeKind::List) {
        switch (lists) {
            case ListPolicy::Join:
                out.push_back(flatten_list(n));
                break;
            case ListPolicy::Expand:
                out = list_items(n);
                break;
            case ListPolicy::Skip:
                break;
        }
    } else if (is_leaf_block(n)) {
        out.push_back(leaf_text(n));
    }
    out.erase(std::remove_if(out.begin(), out.end(), [](const std::string& s){ return s.empty(); }), out.end());
    return out;
}

// Single pass over the top level. A major heading starts a section; nodes up to the
// next major heading are kept only when the section title is in `targets`.
// A title that occurs twice keeps the content of its last occurrence.
inline SectionNodes segment(const ast::Document& nodes, const std::set<std::string>& targets,
                            int major_level = 2, const StructureOptions& opt = {}) {
    SectionNodes out;
    std::vector<ast::Node> acc;
    std::string current;
    bool preamble = opt.orphans == types::OrphanPolicy::Preamble;
    bool collecting = preamble;
    if (preamble) current = opt.preamble_title;

    auto flush = [&]() {
        if (!collecting) return;
        if (preamble && acc.empty()) return;
        upsert(out, current) = acc;
    };

    for (const auto& n : nodes) {
        if (n.is_heading_at(major_level)) {
            flush();
            acc.clear();
            preamble = false;
            current = flatten_trimmed(n);
            collecting = !current.empty() && targets.count(current) > 0;
        } else if (collecting) {
            acc.push_back(n);
        }
    }
    flush();
    return out;
}

namespace detail {

using NodeIter = std::vector<ast::Node>::const_iterator;

inline std::vector<Section> group_range(NodeIter first, NodeIter last, int level, const StructureOptions& opt) {
    std::vector<Section> result;
    std::optional<Section> current;

    auto ensure_open = [&]() {
        if (!current && opt.orphans == types::OrphanPolicy::Preamble) {
            current = Section{opt.preamble_title, {}, {}};
        }
        return current.has_value();
    };

    NodeIter it = first;
    while (it != last) {
        const ast::Node& n = *it;

        if (n.is_heading_at(level)) {
            if (current) result.push_back(std::move(*current));
            current = Section{flatten_trimmed(n), {}, {}};
            ++it;
            continue;
        }

        if (n.is_heading() && n.level > level) {
            // The deeper run ends at the next heading that is at or above this level.
            NodeIter stop = std::find_if(it + 1, last, [level](const ast::Node& x) {
                return x.is_heading() && x.level <= level;
            });
            if (ensure_open()) {
                std::vector<Section> subs = group_range(it, stop, level + 1, opt);
                for (auto& s : subs) current->subsections.push_back(std::move(s));
            }
            it = stop;
            continue;
        }

        if (is_leaf_block(n)) {
            std::string text = leaf_text(n);
            if (!text.empty() && ensure_open()) current->content.emplace_back(std::move(text));
        }
        ++it;
    }

    if (current) result.push_back(std::move(*current));
    return result;
}

} // namespace detail

inline std::vector<Section> group_by_level(const std::vector<ast::Node>& nodes, int level,
                                           const StructureOptions& opt = {}) {
    return detail::group_range(nodes.cbegin(), nodes.cend(), level, opt);
}

// Sub-blocks at `minor_level`; leaf content goes to the latest sub-block, or stays bare
// before the first one. Other headings are ignored.
inline std::vector<ContentItem> flatten_content(const std::vector<ast::Node>& nodes, int minor_level,
                                                ListPolicy lists = ListPolicy::Join) {
    std::vector<ContentItem> result;
    std::optional<std::size_t> active;

    for (const auto& n : nodes) {
        if (n.is_heading_at(minor_level)) {
            result.emplace_back(SubBlock{flatten_trimmed(n), {}});
            active = result.size() - 1;
            continue;
        }
        for (auto& text : leaf_texts(n, lists)) {
            if (active) {
                std::get<SubBlock>(result[*active]).content.push_back(std::move(text));
            } else {
                result.emplace_back(std::move(text));
            }
        }
    }
    return result;
}

} // namespace document
} // namespace parser
