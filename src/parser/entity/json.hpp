#pragma once
// JSON output of entity records. Key order follows the record, text is written unescaped UTF-8.

#include <string>
#include <fstream>
#include <filesystem>

#include <nlohmann/json.hpp>

#include "../document/sections.hpp"
#include "../document/profile.hpp"
#include "../document/versions.hpp"
#include "../../types.hpp"
#include "record.hpp"

namespace parser {
namespace document {

// --------- JSON adapters ----------
inline void to_json(nlohmann::ordered_json& j, const QuoteEntry& q) {
    j = nlohmann::ordered_json{{"occasion", q.occasion}, {"line", q.line}};
}

inline void to_json(nlohmann::ordered_json& j, const SubBlock& b) {
    j = nlohmann::ordered_json{{"sub_title", b.title}, {"content", b.content}};
}

inline nlohmann::ordered_json content_to_json(const std::vector<ContentItem>& items) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& item : items) {
        if (const auto* s = std::get_if<std::string>(&item)) {
            arr.push_back(*s);
        } else {
            arr.push_back(nlohmann::ordered_json(std::get<SubBlock>(item)));
        }
    }
    return arr;
}

inline void to_json(nlohmann::ordered_json& j, const Section& s) {
    j = nlohmann::ordered_json{{"title", s.title}, {"content", content_to_json(s.content)}};
    if (!s.subsections.empty()) {
        nlohmann::ordered_json subs = nlohmann::ordered_json::array();
        for (const auto& sub : s.subsections) {
            nlohmann::ordered_json js;
            to_json(js, sub);
            subs.push_back(std::move(js));
        }
        j["subsections"] = std::move(subs);
    }
}

// The relation list travels next to its joined string as "<key>_list".
inline void to_json(nlohmann::ordered_json& j, const Profile& p) {
    j = nlohmann::ordered_json::object();
    for (const auto& kv : p.fields) j[kv.first] = kv.second;
    if (!p.relation_key.empty()) j[p.relation_key + "_list"] = p.relation_names;
}

} // namespace document

namespace entity {

inline nlohmann::ordered_json field_to_json(const FieldValue& value) {
    nlohmann::ordered_json j;
    if (const auto* content = std::get_if<Content>(&value)) {
        j = document::content_to_json(*content);
    } else if (const auto* outline = std::get_if<Outline>(&value)) {
        j = nlohmann::ordered_json::array();
        for (const auto& s : *outline) j.push_back(nlohmann::ordered_json(s));
    } else if (const auto* profile = std::get_if<document::Profile>(&value)) {
        j = *profile;
    } else if (const auto* quotes = std::get_if<document::QuoteBook>(&value)) {
        j = nlohmann::ordered_json::object();
        for (const auto& kv : *quotes) j[kv.first] = kv.second;
    } else if (const auto* blocks = std::get_if<document::VersionedBlocks>(&value)) {
        j = nlohmann::ordered_json::object();
        for (const auto& kv : *blocks) j[kv.first] = kv.second;
    }
    return j;
}

inline nlohmann::ordered_json to_json(const EntityRecord& rec) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& kv : rec.fields) j[kv.first] = field_to_json(kv.second);
    return j;
}

inline std::string dump(const EntityRecord& rec) {
    return to_json(rec).dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

// Writes the record as pretty JSON. Returns false if the file cannot be written.
inline bool save(const std::string& path, const EntityRecord& rec, types::Error* err = nullptr) {
    std::ofstream out(std::filesystem::u8path(path), std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        if (err) err->message = "cannot write " + path;
        return false;
    }
    out << dump(rec) << '\n';
    if (!out.good()) {
        if (err) err->message = "write failed: " + path;
        return false;
    }
    return true;
}

} // namespace entity
} // namespace parser
