#pragma once
// Sections whose minor headings name versions of the same entity
// (e.g. the default and swimsuit variants of a student), each with its own tables.

#include <string>
#include <vector>
#include <optional>

#include "../ast/node.hpp"
#include "../parser.hpp"
#include "text.hpp"
#include "table.hpp"
#include "sections.hpp"

namespace parser {
namespace document {

using QuoteBook = Ordered<std::vector<QuoteEntry>>;
using VersionedBlocks = Ordered<std::vector<std::string>>;

// Version heading -> quote records of every table under it.
// A repeated version heading starts its list over; tables before the first heading are ignored.
inline QuoteBook parse_quotes(const std::vector<ast::Node>& nodes, int version_level = 3,
                              const std::string& header_label = default_occasion_label()) {
    QuoteBook book;
    std::optional<std::string> current;

    for (const auto& n : nodes) {
        if (n.is_heading_at(version_level)) {
            current = flatten_trimmed(n);
            upsert(book, *current).clear();
        } else if (n.kind == ast::NodeKind::Table && current && !current->empty()) {
            auto rows = to_records(n, header_label);
            auto& dst = upsert(book, *current);
            dst.insert(dst.end(), rows.begin(), rows.end());
        }
    }
    return book;
}

// Version heading -> paragraph and table texts under it. Versions without content are dropped.
inline VersionedBlocks parse_versioned_blocks(const std::vector<ast::Node>& nodes, int version_level = 3) {
    VersionedBlocks out;
    std::string version;
    std::vector<std::string> content;

    auto flush = [&]() {
        if (!version.empty() && !content.empty()) upsert(out, version) = content;
    };

    for (const auto& n : nodes) {
        if (n.is_heading_at(version_level)) {
            flush();
            version = flatten_trimmed(n);
            content.clear();
        } else if (n.kind == ast::NodeKind::Paragraph || n.kind == ast::NodeKind::Table) {
            std::string text = leaf_text(n);
            if (!text.empty()) content.push_back(std::move(text));
        }
    }
    flush();
    return out;
}

} // namespace document
} // namespace parser
