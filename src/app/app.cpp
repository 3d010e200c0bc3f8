#include "app.hpp"

#include <string>
#include <utility>
#include <functional>

#include "../logger.hpp"
#include "../types.hpp"
#include "runtime.hpp"
#include "settings/helpers/fs_ops.hpp"
#include "../parser/mod.hpp"

namespace app {

namespace fs_ops = settings::helpers::fs_ops;

App::App(config::AppConfig cfg)
    : cfg_(std::move(cfg)),
      schema_(config::effective_schema(cfg_)),
      options_(config::structure_options(cfg_)) {}

void App::process(Result& r) const {
    logger::GlobalSink log(r.name + ": ");
    logger::GlobalSink plain;

    if (schema_.skips(r.name)) {
        r.outcome = Outcome::Skipped;
        r.message = "listed in skip_names";
        log.info("skipped");
        return;
    }

    types::Error err;
    parser::ast::Document doc;
    if (!parser::ast::load_document(fs_ops::join_path(cfg_.input_dir, r.filename), doc, &err, &log)) {
        r.outcome = Outcome::Failed;
        r.message = err.message;
        log.error(err.message);
        return;
    }

    parser::entity::EntityRecord rec = parser::entity::assemble(doc, r.name, schema_, options_, &plain);

    const std::string out_path = fs_ops::join_path(cfg_.output_dir, r.name + ".json");
    if (!parser::entity::save(out_path, rec, &err)) {
        r.outcome = Outcome::Failed;
        r.message = err.message;
        log.error(err.message);
        return;
    }

    if (cfg_.write_index_text) {
        const std::string txt_path = fs_ops::join_path(cfg_.output_dir, r.name + ".txt");
        if (!fs_ops::write_file(txt_path, parser::entity::index_text(rec))) {
            log.warn("cannot write " + txt_path);
        }
    }

    r.outcome = Outcome::Saved;
    r.message = out_path;
}

int App::run() {
    results_.clear();

    // 1) Logger
    logger::set_level(cfg_.log_level);
    if (!cfg_.log_file.empty()) {
        logger::set_log_file(cfg_.log_file);
        logger::info("Logging to file: " + cfg_.log_file);
    }
    logger::info(std::string("Startup: wikidigest (") + types::to_string(cfg_.kind) + ")");

    // 2) Folders
    if (!fs_ops::is_dir(cfg_.input_dir)) {
        logger::error("input folder not found: " + cfg_.input_dir);
        return 1;
    }
    if (cfg_.output_dir.empty() || !fs_ops::ensure_dir(cfg_.output_dir)) {
        logger::error("cannot create output folder: " + cfg_.output_dir);
        return 1;
    }

    // 3) Latest revision per entity
    std::vector<std::string> files;
    if (!fs_ops::list_files(cfg_.input_dir, files)) {
        logger::error("cannot list input folder: " + cfg_.input_dir);
        return 1;
    }
    logger::GlobalSink selector_log;
    auto latest = parser::revision::select_latest(files, cfg_.extension, &selector_log);
    if (latest.empty()) {
        logger::error("no documents named <entity>_<revision>." + cfg_.extension + " in " + cfg_.input_dir);
        return 1;
    }
    logger::info("Selected " + std::to_string(latest.size()) + " of " + std::to_string(files.size()) + " files");

    // 4) One task per document; each task owns its result slot
    results_.reserve(latest.size());
    for (const auto& kv : latest) {
        Result r;
        r.name = kv.first;
        r.filename = kv.second;
        results_.push_back(std::move(r));
    }
    std::vector<runtime::Task> tasks;
    tasks.reserve(results_.size());
    for (auto& r : results_) {
        tasks.emplace_back([this, &r]() { process(r); });
    }
    runtime::run_all(tasks, static_cast<std::size_t>(cfg_.workers));

    // 5) Summary
    std::size_t saved = 0, skipped = 0, failed = 0;
    for (const auto& r : results_) {
        switch (r.outcome) {
            case Outcome::Saved:   ++saved; break;
            case Outcome::Skipped: ++skipped; break;
            case Outcome::Failed:
                ++failed;
                logger::warn("failed: " + r.filename + " (" + r.message + ")");
                break;
        }
    }
    logger::info("====== summary ======");
    logger::info("saved: " + std::to_string(saved) + ", skipped: " + std::to_string(skipped) +
                 ", failed: " + std::to_string(failed));

    return 0;
}

} // namespace app
