#pragma once
// Settings handling
// - Config structures and serialization (JSON via nlohmann::json)
// - Store: load/save
// NOTE: header-only implementation for simplicity

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <filesystem>
#include <utility>

#include <nlohmann/json.hpp>

#include "../../logger.hpp"

namespace app {
namespace settings {

// Per-kind adjustments on top of the built-in entity schemas.
struct SchemaOverride {
    std::vector<std::string> sections;             // replaces the section whitelist when non-empty
    std::map<std::string, std::string> field_map;  // added to / replacing synonym entries
    int minor_level = 0;                           // 0 keeps the built-in level
    std::vector<std::string> skip_names;           // replaces the skip list when non-empty
};

struct Config {
    // Folders
    std::string input_dir;         // snapshots "<entity>_<revision>.<ext>"
    std::string output_dir;        // one "<entity>.json" per entity
    std::string extension = "json";

    // Processing
    int workers = 1;
    std::string orphans = "drop";  // "drop" | "preamble"
    std::string preamble_title = "preamble";
    bool write_index_text = false;

    // Logging
    std::string log_file;          // empty: console only
    int log_level = 0;             // 0=INFO,1=WARN,2=ERROR

    // keyed by "game" | "school" | "student"
    std::map<std::string, SchemaOverride> schemas;
};

// Apply reasonable defaults.
inline void apply_defaults(Config& c) {
    if (c.extension.empty()) c.extension = "json";
    if (c.workers < 1) c.workers = 1;
    if (c.orphans != "drop" && c.orphans != "preamble") c.orphans = "drop";
    if (c.preamble_title.empty()) c.preamble_title = "preamble";
    if (c.log_level < 0) c.log_level = 0;
    if (c.log_level > 2) c.log_level = 2;
}

class Store {
public:
    // Load config from persistent storage (JSON). Always sets 'out' (merged with defaults).
    // Returns true if file existed and was parsed successfully, false if file missing or parse error.
    static bool load(const std::string& path, Config& out);

    // Save config (JSON).
    static bool save(const std::string& path, const Config& cfg);
};

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const SchemaOverride& s) {
    j = nlohmann::json{
        {"sections", s.sections},
        {"field_map", s.field_map},
        {"minor_level", s.minor_level},
        {"skip_names", s.skip_names}
    };
}

inline void from_json(const nlohmann::json& j, SchemaOverride& s) {
    SchemaOverride tmp = s;
    if (j.contains("sections")) j.at("sections").get_to(tmp.sections);
    if (j.contains("field_map")) j.at("field_map").get_to(tmp.field_map);
    if (j.contains("minor_level")) j.at("minor_level").get_to(tmp.minor_level);
    if (j.contains("skip_names")) j.at("skip_names").get_to(tmp.skip_names);
    s = std::move(tmp);
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"input_dir", c.input_dir},
        {"output_dir", c.output_dir},
        {"extension", c.extension},
        {"workers", c.workers},
        {"orphans", c.orphans},
        {"preamble_title", c.preamble_title},
        {"write_index_text", c.write_index_text},
        {"log_file", c.log_file},
        {"log_level", c.log_level},
        {"schemas", c.schemas}
    };
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // keep defaults first
    Config tmp = c;

    if (j.contains("input_dir")) j.at("input_dir").get_to(tmp.input_dir);
    if (j.contains("output_dir")) j.at("output_dir").get_to(tmp.output_dir);
    if (j.contains("extension")) j.at("extension").get_to(tmp.extension);

    if (j.contains("workers")) j.at("workers").get_to(tmp.workers);
    if (j.contains("orphans")) j.at("orphans").get_to(tmp.orphans);
    if (j.contains("preamble_title")) j.at("preamble_title").get_to(tmp.preamble_title);
    if (j.contains("write_index_text")) j.at("write_index_text").get_to(tmp.write_index_text);

    if (j.contains("log_file")) j.at("log_file").get_to(tmp.log_file);
    if (j.contains("log_level")) j.at("log_level").get_to(tmp.log_level);

    if (j.contains("schemas")) j.at("schemas").get_to(tmp.schemas);

    c = std::move(tmp);
}

// --------- Store implementation ----------
inline bool Store::load(const std::string& path, Config& out) {
    // Prepare defaults first
    Config cfg;
    apply_defaults(cfg);

    // Try open file
    std::ifstream in(std::filesystem::u8path(path), std::ios::in);
    if (!in.is_open()) {
        // No file: return false, but 'out' gets defaults
        out = std::move(cfg);
        return false;
    }

    try {
        nlohmann::json j;
        in >> j;
        from_json(j, cfg);
        apply_defaults(cfg);
        out = std::move(cfg);
        return true;
    } catch (const nlohmann::json::exception& e) {
        // Parse error: keep defaults
        logger::warn("settings: " + path + ": " + e.what());
        Config defaults;
        apply_defaults(defaults);
        out = std::move(defaults);
        return false;
    }
}

inline bool Store::save(const std::string& path, const Config& cfg) {
    try {
        nlohmann::json j = cfg;
        std::ofstream out(std::filesystem::u8path(path), std::ios::out | std::ios::trunc);
        if (!out.is_open()) return false;
        out << j.dump(2);
        return out.good();
    } catch (const nlohmann::json::exception& e) {
        logger::error("settings: cannot serialize config: " + std::string(e.what()));
        return false;
    }
}

} // namespace settings
} // namespace app
