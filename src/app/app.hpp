#pragma once
// Batch driver: latest revision of every document in the input folder -> one record per entity.

#include <string>
#include <vector>

#include "config.hpp"
#include "../parser/entity/schema.hpp"
#include "../parser/document/sections.hpp"

namespace app {

class App {
public:
    enum class Outcome { Saved, Skipped, Failed };

    struct Result {
        std::string name;
        std::string filename;
        Outcome outcome = Outcome::Failed;
        std::string message;
    };

    explicit App(config::AppConfig cfg);

    // Returns the process exit code.
    int run();

    // Per-document outcomes of the last run(), in entity name order.
    const std::vector<Result>& results() const { return results_; }

private:
    void process(Result& r) const;

    config::AppConfig cfg_;
    parser::entity::EntitySchema schema_;
    parser::document::StructureOptions options_;
    std::vector<Result> results_;
};

} // namespace app
