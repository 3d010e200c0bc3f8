#pragma once
// Plain-text rendering of a record for embedding: one "key: text" block per non-empty field.
// Table pipes are removed and blank lines dropped, so the text reads as prose.

#include <string>
#include <vector>
#include <variant>

#include "../parser.hpp"
#include "record.hpp"

namespace parser {
namespace entity {

namespace detail {

inline void outline_lines(const Outline& sections, std::vector<std::string>& out) {
    for (const auto& s : sections) {
        for (const auto& item : s.content) {
            if (const auto* text = std::get_if<std::string>(&item)) out.push_back(*text);
        }
        outline_lines(s.subsections, out);
    }
}

inline std::vector<std::string> field_lines(const FieldValue& value) {
    std::vector<std::string> lines;
    if (const auto* content = std::get_if<Content>(&value)) {
        for (const auto& item : *content) {
            if (const auto* text = std::get_if<std::string>(&item)) {
                lines.push_back(*text);
            } else {
                const auto& block = std::get<document::SubBlock>(item);
                lines.insert(lines.end(), block.content.begin(), block.content.end());
            }
        }
    } else if (const auto* outline = std::get_if<Outline>(&value)) {
        outline_lines(*outline, lines);
    } else if (const auto* profile = std::get_if<document::Profile>(&value)) {
        for (const auto& kv : profile->fields) lines.push_back(kv.first + ": " + kv.second);
    } else if (const auto* quotes = std::get_if<document::QuoteBook>(&value)) {
        for (const auto& version : *quotes) {
            for (const auto& q : version.second) lines.push_back(q.occasion + ": " + q.line);
        }
    } else if (const auto* blocks = std::get_if<document::VersionedBlocks>(&value)) {
        for (const auto& version : *blocks) {
            lines.insert(lines.end(), version.second.begin(), version.second.end());
        }
    }
    return lines;
}

} // namespace detail

// Text of one field: lines trimmed, '|' removed, blank lines skipped.
inline std::string field_text(const FieldValue& value) {
    std::vector<std::string> kept;
    for (const auto& line : detail::field_lines(value)) {
        for (const auto& piece : split(line, '\n')) {
            std::string cleaned = trim(replace_all(trim(piece), "|", ""));
            if (!cleaned.empty()) kept.push_back(std::move(cleaned));
        }
    }
    return join(kept, "\n");
}

inline std::string index_text(const EntityRecord& rec) {
    std::string out = "名称: " + rec.name;
    for (const auto& kv : rec.fields) {
        std::string text = field_text(kv.second);
        if (text.empty()) continue;
        out += "\n" + kv.first + ":\n" + text;
    }
    return out;
}

} // namespace entity
} // namespace parser
