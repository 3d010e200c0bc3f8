#pragma once
// Table linearization: a pipe-delimited text dump, or a list of {occasion, line} records.

#include <string>
#include <vector>
#include <algorithm>

#include "../ast/node.hpp"
#include "text.hpp"

namespace parser {
namespace document {

struct QuoteEntry {
    std::string occasion;
    std::string line;
};

inline bool operator==(const QuoteEntry& a, const QuoteEntry& b) {
    return a.occasion == b.occasion && a.line == b.line;
}

// Label of the header row that wiki editors repeat inside quote table bodies.
inline const std::string& default_occasion_label() {
    static const std::string label = "场合";
    return label;
}

inline std::vector<std::string> row_cell_texts(const ast::Node& row) {
    std::vector<std::string> out;
    out.reserve(row.children.size());
    for (const auto& cell : row.children) out.push_back(flatten_trimmed(cell));
    return out;
}

// "| a | b |" per row of head and body, rows in document order.
inline std::string to_text(const ast::Node& table) {
    using ast::NodeKind;
    std::vector<std::string> lines;
    for (const auto& part : table.children) {
        if (part.kind != NodeKind::TableHead && part.kind != NodeKind::TableBody) continue;
        for (const auto& row : part.children) {
            if (row.kind != NodeKind::TableRow) continue;
            lines.push_back("| " + join(row_cell_texts(row), " | ") + " |");
        }
    }
    return join(lines, "\n");
}

// Header texts; the head holds its cells directly or wrapped in one row.
inline std::vector<std::string> header_texts(const ast::Node& table) {
    using ast::NodeKind;
    std::vector<std::string> out;
    for (const auto& part : table.children) {
        if (part.kind != NodeKind::TableHead) continue;
        for (const auto& c : part.children) {
            if (c.kind == NodeKind::TableCell) {
                out.push_back(flatten_trimmed(c));
            } else if (c.kind == NodeKind::TableRow) {
                for (const auto& t : row_cell_texts(c)) out.push_back(t);
            }
        }
    }
    return out;
}

inline std::vector<QuoteEntry> to_records(const ast::Node& table,
                                          const std::string& header_label = default_occasion_label()) {
    using ast::NodeKind;
    std::vector<QuoteEntry> out;

    for (const auto& part : table.children) {
        if (part.kind != NodeKind::TableBody) continue;
        for (const auto& row : part.children) {
            if (row.kind != NodeKind::TableRow) continue;
            std::vector<std::string> cells = row_cell_texts(row);

            bool blank = std::all_of(cells.begin(), cells.end(), [](const std::string& c){ return c.empty(); });
            if (blank) continue;
            if (cells[0] == header_label) continue;
            if (cells.size() < 2) continue;

            out.push_back(QuoteEntry{cells[0], cells[1]});
        }
    }
    return out;
}

} // namespace document
} // namespace parser
