#pragma once
// Shared basic types and enums used across modules.

#include <string>
#include <cstdint>

namespace types {

struct Error {
    std::string message;
};

enum class EntityKind : std::uint8_t {
    Game,
    School,
    Student
};

inline const char* to_string(EntityKind k) {
    switch (k) {
        case EntityKind::Game:    return "game";
        case EntityKind::School:  return "school";
        case EntityKind::Student: return "student";
    }
    return "game";
}

inline bool entity_kind_from_string(const std::string& s, EntityKind& out) {
    if (s == "game")    { out = EntityKind::Game;    return true; }
    if (s == "school")  { out = EntityKind::School;  return true; }
    if (s == "student") { out = EntityKind::Student; return true; }
    return false;
}

// What to do with content that appears before the first delimiting heading.
enum class OrphanPolicy : std::uint8_t {
    Drop,
    Preamble
};

} // namespace types
