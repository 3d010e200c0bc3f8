#pragma once
// Revision selection over snapshot file names "<entity>_<revision>.<ext>".
// Only the highest revision of each entity is processed.

#include <string>
#include <vector>
#include <map>
#include <regex>
#include <cstdint>
#include <stdexcept>

#include "../logger.hpp"

namespace parser {
namespace revision {

struct Snapshot {
    std::string name;
    std::uint64_t revision = 0;
    std::string filename;
};

// Parses "<name>_<digits>.<ext>". `extension` restricts the accepted extension
// (without dot); empty accepts any.
inline bool parse_filename(const std::string& filename, Snapshot& out, const std::string& extension = {}) {
    static const std::regex RE_SNAPSHOT(R"re(^(.+)_(\d+)\.([^./\\]+)$)re");
    std::smatch m;
    if (!std::regex_match(filename, m, RE_SNAPSHOT)) return false;
    if (!extension.empty() && m[3].str() != extension) return false;
    try {
        out.revision = std::stoull(m[2].str());
    } catch (const std::out_of_range&) {
        return false;
    }
    out.name = m[1].str();
    out.filename = filename;
    return true;
}

// entity name -> file name of its highest revision.
// Equal revisions resolve to the one seen last.
inline std::map<std::string, std::string> select_latest(const std::vector<std::string>& filenames,
                                                        const std::string& extension = {},
                                                        logger::Sink* log = nullptr) {
    std::map<std::string, Snapshot> best;
    for (const auto& f : filenames) {
        Snapshot s;
        if (!parse_filename(f, s, extension)) {
            if (log) log->warn("revision: ignoring file with unexpected name: " + f);
            continue;
        }
        auto it = best.find(s.name);
        if (it == best.end() || s.revision >= it->second.revision) {
            best[s.name] = std::move(s);
        }
    }

    std::map<std::string, std::string> out;
    for (auto& kv : best) out.emplace(kv.first, kv.second.filename);
    return out;
}

} // namespace revision
} // namespace parser
