#pragma once
// Purpose: effective run configuration (settings file + command line) and helpers.
//
// Notes:
// - AppConfig is what the batch driver consumes; app::settings::Config is what is persisted.
// - apply_defaults ensures sane defaults and normalization.
// - merge follows "b overrides a" semantics (fields present in b replace a).

#include <string>
#include <vector>
#include <cctype>

#include "../types.hpp"
#include "../parser/parser.hpp"
#include "../parser/entity/schema.hpp"
#include "../parser/document/sections.hpp"
#include "settings/settings.hpp"

namespace app {
namespace config {

struct AppConfig {
    types::EntityKind kind = types::EntityKind::Game;

    // Folders
    std::string input_dir;
    std::string output_dir;
    std::string extension;          // empty here means "not given"

    // Processing
    int workers = 0;                // 0: not given
    types::OrphanPolicy orphans = types::OrphanPolicy::Drop;
    bool preamble = false;          // set: orphans = Preamble
    std::string preamble_title;
    bool write_index_text = false;

    // Logging
    std::string log_file;
    int log_level = -1;             // -1: not given

    // Schema adjustments for `kind`, taken from the settings file.
    settings::SchemaOverride schema_override;
};

// Helpers
inline static bool not_empty(const std::string& s) { return !s.empty(); }

// Trim surrounding whitespace and a trailing separator.
inline static void normalize_path(std::string& p) {
    auto l = p.begin(), r = p.end();
    while (l != r && std::isspace(static_cast<unsigned char>(*l))) ++l;
    while (r != l && std::isspace(static_cast<unsigned char>(*(r - 1)))) --r;
    p.assign(l, r);
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) p.pop_back();
}

// Apply defaults and sanity checks.
inline void apply_defaults(AppConfig& cfg) {
    normalize_path(cfg.input_dir);
    normalize_path(cfg.output_dir);
    if (cfg.extension.empty()) cfg.extension = "json";
    if (!cfg.extension.empty() && cfg.extension.front() == '.') cfg.extension.erase(0, 1);
    if (cfg.workers < 1) cfg.workers = 1;
    if (cfg.preamble) cfg.orphans = types::OrphanPolicy::Preamble;
    if (cfg.preamble_title.empty()) cfg.preamble_title = "preamble";
    if (cfg.log_level < 0) cfg.log_level = 0;
    if (cfg.log_level > 2) cfg.log_level = 2;
}

// Effective values from the persisted settings for one entity kind.
inline AppConfig from_settings(const settings::Config& s, types::EntityKind kind) {
    AppConfig out;
    out.kind = kind;
    out.input_dir = s.input_dir;
    out.output_dir = s.output_dir;
    out.extension = s.extension;
    out.workers = s.workers;
    out.preamble = s.orphans == "preamble";
    out.preamble_title = s.preamble_title;
    out.write_index_text = s.write_index_text;
    out.log_file = s.log_file;
    out.log_level = s.log_level;
    auto it = s.schemas.find(types::to_string(kind));
    if (it != s.schemas.end()) out.schema_override = it->second;
    return out;
}

// Merge b overrides a. Flags only ever switch a feature on.
inline AppConfig merge(const AppConfig& a, const AppConfig& b) {
    AppConfig out = a;
    out.kind = b.kind;

    // strings
    if (not_empty(b.input_dir))      out.input_dir = b.input_dir;
    if (not_empty(b.output_dir))     out.output_dir = b.output_dir;
    if (not_empty(b.extension))      out.extension = b.extension;
    if (not_empty(b.preamble_title)) out.preamble_title = b.preamble_title;
    if (not_empty(b.log_file))       out.log_file = b.log_file;

    // numbers
    if (b.workers > 0)    out.workers = b.workers;
    if (b.log_level >= 0) out.log_level = b.log_level;

    // flags
    if (b.preamble)         out.preamble = true;
    if (b.write_index_text) out.write_index_text = true;

    // schema override (replace if provided)
    if (!b.schema_override.sections.empty())   out.schema_override.sections = b.schema_override.sections;
    if (!b.schema_override.field_map.empty())  out.schema_override.field_map = b.schema_override.field_map;
    if (b.schema_override.minor_level > 0)     out.schema_override.minor_level = b.schema_override.minor_level;
    if (!b.schema_override.skip_names.empty()) out.schema_override.skip_names = b.schema_override.skip_names;

    apply_defaults(out);
    return out;
}

inline parser::document::StructureOptions structure_options(const AppConfig& cfg) {
    parser::document::StructureOptions opt;
    opt.orphans = cfg.orphans;
    opt.preamble_title = cfg.preamble_title;
    return opt;
}

// Built-in schema of cfg.kind with the settings overrides applied.
inline parser::entity::EntitySchema effective_schema(const AppConfig& cfg) {
    parser::entity::EntitySchema schema = parser::entity::schema_for(cfg.kind);
    const settings::SchemaOverride& o = cfg.schema_override;
    if (!o.sections.empty()) schema.sections = o.sections;
    for (const auto& kv : o.field_map) parser::upsert(schema.field_map, kv.first) = kv.second;
    if (o.minor_level > 0) schema.minor_level = o.minor_level;
    if (!o.skip_names.empty()) schema.skip_names = o.skip_names;
    return schema;
}

} // namespace config
} // namespace app
