#pragma once
// Static per-kind configuration: which sections are read, how they are shaped,
// and under which canonical key each one is stored.

#include <string>
#include <vector>
#include <set>
#include <algorithm>

#include "../parser.hpp"
#include "../../types.hpp"
#include "../document/sections.hpp"
#include "../document/profile.hpp"
#include "../document/table.hpp"

namespace parser {
namespace entity {

struct EntitySchema {
    types::EntityKind kind = types::EntityKind::Game;

    // Section titles of interest at the major heading level.
    std::vector<std::string> sections;
    int major_level = 2;

    // Sub-block level and list handling for flattened sections.
    int minor_level = 3;
    document::ListPolicy lists = document::ListPolicy::Join;

    // Sections kept as a nested outline, grouped from `nested_level` downwards.
    std::set<std::string> nested_sections;
    int nested_level = 3;

    // Synonym section title -> canonical key. Titles not listed are their own key.
    Ordered<std::string> field_map;

    // Profile table; empty key: the kind has no profile.
    std::string profile_key;
    document::ProfileRules profile_rules;

    // Versioned sections (section title doubles as the record key); empty: absent.
    std::string quotes_key;
    int quotes_level = 3;
    std::string occasion_label = document::default_occasion_label();
    std::string game_data_key;
    int game_data_level = 3;

    // Entities that share the page namespace but are not of this kind.
    std::vector<std::string> skip_names;

    std::string canonical(const std::string& title) const {
        if (const std::string* key = lookup(field_map, title)) return *key;
        return title;
    }

    bool skips(const std::string& name) const {
        return std::find(skip_names.begin(), skip_names.end(), name) != skip_names.end();
    }

    bool is_nested(const std::string& title) const { return nested_sections.count(title) > 0; }

    // Every key a record of this kind carries, in output order.
    std::vector<std::string> canonical_keys() const {
        std::vector<std::string> keys;
        auto add = [&keys](const std::string& k) {
            if (!k.empty() && std::find(keys.begin(), keys.end(), k) == keys.end()) keys.push_back(k);
        };
        for (const auto& s : sections) add(canonical(s));
        add(profile_key);
        add(quotes_key);
        add(game_data_key);
        return keys;
    }

    // Titles handed to the segmenter.
    std::set<std::string> section_targets() const {
        std::set<std::string> t(sections.begin(), sections.end());
        if (!quotes_key.empty()) t.insert(quotes_key);
        if (!game_data_key.empty()) t.insert(game_data_key);
        return t;
    }
};

inline EntitySchema game_schema() {
    EntitySchema s;
    s.kind = types::EntityKind::Game;
    s.sections = {"背景设定（世界观）", "游戏系统"};
    s.minor_level = 4;
    s.lists = document::ListPolicy::Join;
    s.nested_sections = {"游戏系统"};
    s.nested_level = 3;
    return s;
}

inline EntitySchema school_schema() {
    EntitySchema s;
    s.kind = types::EntityKind::School;
    s.sections = {"简介", "校内设施", "社团及学生", "学生", "历史", "概况", "学校设施", "社团、学生与其他势力"};
    s.minor_level = 3;
    s.lists = document::ListPolicy::Expand;
    s.field_map = {
        {"学校设施", "校内设施"},
        {"学生", "学生与社团"},
        {"社团及学生", "学生与社团"},
        {"社团、学生与其他势力", "学生与社团"},
    };
    s.profile_key = "基本资料";
    s.profile_rules.header_labels = {"基本资料"};
    return s;
}

inline EntitySchema student_schema() {
    EntitySchema s;
    s.kind = types::EntityKind::Student;
    s.sections = {"简介", "人物设定", "人物经历", "角色相关"};
    s.minor_level = 3;
    s.lists = document::ListPolicy::Skip;
    s.profile_key = "学生档案";
    s.profile_rules.header_labels = {"学生档案", "基本资料"};
    s.profile_rules.relation_key = "相关人物";
    s.quotes_key = "角色台词";
    s.game_data_key = "游戏数据";
    s.skip_names = {"初音未来"};
    return s;
}

inline EntitySchema schema_for(types::EntityKind kind) {
    switch (kind) {
        case types::EntityKind::Game:    return game_schema();
        case types::EntityKind::School:  return school_schema();
        case types::EntityKind::Student: return student_schema();
    }
    return game_schema();
}

} // namespace entity
} // namespace parser
