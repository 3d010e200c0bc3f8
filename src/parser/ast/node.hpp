#pragma once
// Block tree produced by the external Markdown parser (one Document per wiki page).
// Node is a closed tagged union: `kind` selects which of the other fields are meaningful.

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <cstdint>

namespace parser {
namespace ast {

enum class NodeKind : std::uint8_t {
    Text,
    Heading,
    Paragraph,
    Strong,
    Emphasis,
    Link,
    Image,
    List,
    ListItem,
    Table,
    TableHead,
    TableBody,
    TableRow,
    TableCell,
    Other, // any interchange type without a dedicated rule (block_text, codespan, ...)
};

struct Node {
    NodeKind kind = NodeKind::Other;
    std::string raw;                  // Text payload; Other keeps its raw payload if it had one
    int level = 0;                    // Heading only, 1..6
    std::optional<std::string> title; // Image only
    std::string type_name;            // interchange type name as read, informational
    std::vector<Node> children;

    bool is_heading() const { return kind == NodeKind::Heading; }
    bool is_heading_at(int lvl) const { return kind == NodeKind::Heading && level == lvl; }
};

using Document = std::vector<Node>;

// Interchange name for a kind ("table_row", ...)
inline const char* kind_name(NodeKind k) {
    switch (k) {
        case NodeKind::Text:      return "text";
        case NodeKind::Heading:   return "heading";
        case NodeKind::Paragraph: return "paragraph";
        case NodeKind::Strong:    return "strong";
        case NodeKind::Emphasis:  return "emphasis";
        case NodeKind::Link:      return "link";
        case NodeKind::Image:     return "image";
        case NodeKind::List:      return "list";
        case NodeKind::ListItem:  return "list_item";
        case NodeKind::Table:     return "table";
        case NodeKind::TableHead: return "table_head";
        case NodeKind::TableBody: return "table_body";
        case NodeKind::TableRow:  return "table_row";
        case NodeKind::TableCell: return "table_cell";
        case NodeKind::Other:     return "other";
    }
    return "other";
}

// Returns true and sets `out` when `name` is a known interchange type.
inline bool kind_from_name(const std::string& name, NodeKind& out) {
    static const std::pair<const char*, NodeKind> table[] = {
        {"text", NodeKind::Text},
        {"heading", NodeKind::Heading},
        {"paragraph", NodeKind::Paragraph},
        {"strong", NodeKind::Strong},
        {"emphasis", NodeKind::Emphasis},
        {"link", NodeKind::Link},
        {"image", NodeKind::Image},
        {"list", NodeKind::List},
        {"list_item", NodeKind::ListItem},
        {"table", NodeKind::Table},
        {"table_head", NodeKind::TableHead},
        {"table_body", NodeKind::TableBody},
        {"table_row", NodeKind::TableRow},
        {"table_cell", NodeKind::TableCell},
    };
    for (const auto& e : table) {
        if (name == e.first) { out = e.second; return true; }
    }
    return false;
}

// Builders, mostly for assembling documents in code and tests.
namespace make {

inline Node node(NodeKind kind, std::vector<Node> children = {}) {
    Node n;
    n.kind = kind;
    n.type_name = kind_name(kind);
    n.children = std::move(children);
    return n;
}

inline Node text(std::string raw) {
    Node n = node(NodeKind::Text);
    n.raw = std::move(raw);
    return n;
}

inline Node heading(int level, std::vector<Node> children) {
    Node n = node(NodeKind::Heading, std::move(children));
    n.level = level;
    return n;
}

inline Node heading(int level, const std::string& title) {
    return heading(level, std::vector<Node>{text(title)});
}

inline Node paragraph(std::vector<Node> children) { return node(NodeKind::Paragraph, std::move(children)); }
inline Node paragraph(const std::string& s) { return paragraph(std::vector<Node>{text(s)}); }
inline Node strong(std::vector<Node> children) { return node(NodeKind::Strong, std::move(children)); }
inline Node emphasis(std::vector<Node> children) { return node(NodeKind::Emphasis, std::move(children)); }
inline Node link(std::vector<Node> children) { return node(NodeKind::Link, std::move(children)); }
inline Node link(const std::string& s) { return link(std::vector<Node>{text(s)}); }

inline Node image(std::optional<std::string> title, std::vector<Node> children = {}) {
    Node n = node(NodeKind::Image, std::move(children));
    n.title = std::move(title);
    return n;
}

inline Node list_item(std::vector<Node> children) { return node(NodeKind::ListItem, std::move(children)); }
inline Node list_item(const std::string& s) { return list_item(std::vector<Node>{text(s)}); }

inline Node list(const std::vector<std::string>& items) {
    Node n = node(NodeKind::List);
    for (const auto& it : items) n.children.push_back(list_item(it));
    return n;
}

inline Node cell(std::vector<Node> children) { return node(NodeKind::TableCell, std::move(children)); }
inline Node cell(const std::string& s) { return cell(std::vector<Node>{text(s)}); }

inline Node row(std::vector<Node> cells) { return node(NodeKind::TableRow, std::move(cells)); }

inline Node row(const std::vector<std::string>& cells) {
    Node n = node(NodeKind::TableRow);
    for (const auto& c : cells) n.children.push_back(cell(c));
    return n;
}

// Head cells sit directly under table_head, as the Markdown parser emits them.
inline Node table(const std::vector<std::string>& head, std::vector<Node> body_rows) {
    Node h = node(NodeKind::TableHead);
    for (const auto& c : head) h.children.push_back(cell(c));
    Node t = node(NodeKind::Table);
    t.children.push_back(std::move(h));
    t.children.push_back(node(NodeKind::TableBody, std::move(body_rows)));
    return t;
}

inline Node other(const std::string& type_name, std::vector<Node> children = {}) {
    Node n = node(NodeKind::Other, std::move(children));
    n.type_name = type_name;
    return n;
}

} // namespace make

} // namespace ast
} // namespace parser
