#pragma once
// Assembles one entity record from one document.

#include <string>
#include <vector>
#include <variant>
#include <utility>

#include "../ast/node.hpp"
#include "../parser.hpp"
#include "../document/sections.hpp"
#include "../document/profile.hpp"
#include "../document/versions.hpp"
#include "../../logger.hpp"
#include "../../types.hpp"
#include "schema.hpp"

namespace parser {
namespace entity {

using Content = std::vector<document::ContentItem>;
using Outline = std::vector<document::Section>;

using FieldValue = std::variant<Content, Outline, document::Profile, document::QuoteBook, document::VersionedBlocks>;

struct EntityRecord {
    types::EntityKind kind = types::EntityKind::Game;
    std::string name;
    Ordered<FieldValue> fields;

    const FieldValue* get(const std::string& key) const { return lookup(fields, key); }

    template <typename T>
    const T* get_as(const std::string& key) const {
        const FieldValue* v = get(key);
        return v ? std::get_if<T>(v) : nullptr;
    }
};

// Empty value of the right shape for a canonical key.
inline FieldValue default_value(const EntitySchema& schema, const std::string& key) {
    if (key == schema.profile_key) return document::Profile{};
    if (key == schema.quotes_key) return document::QuoteBook{};
    if (key == schema.game_data_key) return document::VersionedBlocks{};
    for (const auto& title : schema.nested_sections) {
        if (schema.canonical(title) == key) return Outline{};
    }
    return Content{};
}

namespace detail {

// Content lists under the same canonical key are concatenated; anything else replaces.
inline void merge_field(EntityRecord& rec, const std::string& key, FieldValue value) {
    FieldValue& slot = upsert(rec.fields, key);
    Content* dst = std::get_if<Content>(&slot);
    Content* src = std::get_if<Content>(&value);
    if (dst && src) {
        for (auto& item : *src) dst->push_back(std::move(item));
        return;
    }
    slot = std::move(value);
}

} // namespace detail

inline EntityRecord assemble(const ast::Document& doc, const std::string& name, const EntitySchema& schema,
                             const document::StructureOptions& opt = {}, logger::Sink* log = nullptr) {
    EntityRecord rec;
    rec.kind = schema.kind;
    rec.name = name;
    for (const auto& key : schema.canonical_keys()) upsert(rec.fields, key) = default_value(schema, key);

    document::SectionNodes sections = document::segment(doc, schema.section_targets(), schema.major_level, opt);
    for (auto& entry : sections) {
        const std::string& title = entry.first;
        const std::vector<ast::Node>& nodes = entry.second;

        if (!schema.quotes_key.empty() && title == schema.quotes_key) {
            upsert(rec.fields, title) = document::parse_quotes(nodes, schema.quotes_level, schema.occasion_label);
        } else if (!schema.game_data_key.empty() && title == schema.game_data_key) {
            upsert(rec.fields, title) = document::parse_versioned_blocks(nodes, schema.game_data_level);
        } else if (schema.is_nested(title)) {
            detail::merge_field(rec, schema.canonical(title), document::group_by_level(nodes, schema.nested_level, opt));
        } else {
            detail::merge_field(rec, schema.canonical(title),
                                document::flatten_content(nodes, schema.minor_level, schema.lists));
        }
    }

    if (!schema.profile_key.empty()) {
        document::Profile profile = document::extract_profile(doc, schema.profile_rules);
        if (profile.empty() && log) log->warn(name + ": no profile table found");
        upsert(rec.fields, schema.profile_key) = std::move(profile);
    }

    if (log) {
        log->info(name + ": " + std::to_string(sections.size()) + " of " +
                  std::to_string(schema.section_targets().size()) + " sections found");
    }
    return rec;
}

} // namespace entity
} // namespace parser
