#include <iostream>
#include <string>
#include <stdexcept>

#include "app/app.hpp"
#include "app/config.hpp"
#include "app/settings/settings.hpp"
#include "types.hpp"

namespace {

void usage() {
    std::cerr <<
        "usage: wikidigest <game|school|student> [options]\n"
        "  --config FILE     settings file (default: config.json if present)\n"
        "  --input DIR       folder with <entity>_<revision>.<ext> snapshots\n"
        "  --output DIR      folder for <entity>.json records\n"
        "  --workers N       documents processed in parallel\n"
        "  --preamble        keep content before the first heading\n"
        "  --index-text      also write <entity>.txt\n"
        "  --log-file FILE   append log lines to FILE\n"
        "  --verbose         log level INFO (default from settings)\n";
}

bool parse_workers(const std::string& s, int& out) {
    try {
        std::size_t used = 0;
        int n = std::stoi(s, &used);
        if (used != s.size() || n < 1) return false;
        out = n;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    app::config::AppConfig cli;
    if (!types::entity_kind_from_string(argv[1], cli.kind)) {
        std::cerr << "unknown entity kind: " << argv[1] << "\n";
        usage();
        return 1;
    }

    std::string config_path;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--config") {
            ok = value(config_path);
        } else if (arg == "--input") {
            ok = value(cli.input_dir);
        } else if (arg == "--output") {
            ok = value(cli.output_dir);
        } else if (arg == "--workers") {
            std::string n;
            ok = value(n) && parse_workers(n, cli.workers);
        } else if (arg == "--preamble") {
            cli.preamble = true;
        } else if (arg == "--index-text") {
            cli.write_index_text = true;
        } else if (arg == "--log-file") {
            ok = value(cli.log_file);
        } else if (arg == "--verbose") {
            cli.log_level = 0;
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            ok = false;
        }
        if (!ok) {
            std::cerr << "invalid argument: " << arg << "\n";
            usage();
            return 1;
        }
    }

    // Settings file first, command line on top.
    app::settings::Config file_cfg;
    const bool explicit_config = !config_path.empty();
    if (!explicit_config) config_path = "config.json";
    if (!app::settings::Store::load(config_path, file_cfg) && explicit_config) {
        std::cerr << "cannot read settings: " << config_path << "\n";
        return 1;
    }

    app::config::AppConfig effective = app::config::merge(app::config::from_settings(file_cfg, cli.kind), cli);
    if (effective.input_dir.empty() || effective.output_dir.empty()) {
        std::cerr << "input and output folders are required (--input, --output or settings)\n";
        return 1;
    }

    app::App application(effective);
    return application.run();
}
