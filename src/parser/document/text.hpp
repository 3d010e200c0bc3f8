#pragma once
// Text flattening: reduces a node and its subtree to plain text in document order.

#include <string>
#include <vector>

#include "../ast/node.hpp"
#include "../parser.hpp"

namespace parser {
namespace document {

enum class FlattenPolicy {
    Rendered, // what a reader sees: image titles replace alt text, only text nodes carry raw
    Raw       // raw payload of any node that has one, images read through their children
};

inline std::string flatten(const ast::Node& node, FlattenPolicy policy = FlattenPolicy::Rendered);

namespace detail {

inline std::string concat_children(const ast::Node& node, FlattenPolicy policy) {
    std::string out;
    for (const auto& c : node.children) out += flatten(c, policy);
    return out;
}

} // namespace detail

inline std::string flatten(const ast::Node& node, FlattenPolicy policy) {
    using ast::NodeKind;
    if (policy == FlattenPolicy::Raw && !node.raw.empty()) return node.raw;

    switch (node.kind) {
        case NodeKind::Text:
            return node.raw;
        case NodeKind::Image:
            if (policy == FlattenPolicy::Rendered && node.title && !node.title->empty()) return *node.title;
            return detail::concat_children(node, policy);
        case NodeKind::Heading:
        case NodeKind::Paragraph:
        case NodeKind::Strong:
        case NodeKind::Emphasis:
        case NodeKind::Link:
        case NodeKind::List:
        case NodeKind::ListItem:
        case NodeKind::Table:
        case NodeKind::TableHead:
        case NodeKind::TableBody:
        case NodeKind::TableRow:
        case NodeKind::TableCell:
        case NodeKind::Other:
            return detail::concat_children(node, policy);
    }
    return {};
}

inline std::string flatten_trimmed(const ast::Node& node, FlattenPolicy policy = FlattenPolicy::Rendered) {
    return trim(flatten(node, policy));
}

// Trimmed text of each list_item child, empty items included.
inline std::vector<std::string> list_items(const ast::Node& list) {
    std::vector<std::string> out;
    for (const auto& item : list.children) {
        if (item.kind == ast::NodeKind::ListItem) out.push_back(flatten_trimmed(item));
    }
    return out;
}

inline std::string flatten_list(const ast::Node& list) {
    return join(list_items(list), "\n");
}

} // namespace document
} // namespace parser
