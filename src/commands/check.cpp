#include "commands/check.hpp"
#include "commands/CliArgs.hpp"

#include "extract/CompositeExtractor.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int cmd_check(int argc, char** argv) {
    auto args = cli::positional(argc, argv, {});
    if (args.empty()) {
        std::cerr << "check: expected a collection file\n";
        return 1;
    }

    int rc = 0;
    for (const auto& path : args) {
        model::EntityCollection c;
        try {
            c = io::load_collection(path);
        } catch (const std::exception& e) {
            std::cerr << path << ": " << e.what() << "\n";
            rc = 1;
            continue;
        }

        auto dangling = c.find_dangling_relationships();
        std::cout << path << ": " << c.entities().size() << " entities, "
                  << c.relationships().size() << " relationships, "
                  << dangling.size() << " dangling\n";

        for (const auto& d : dangling) {
            const model::Relationship* r = c.get_relationship_by_id(d.relationship_id);
            std::cout << "  - " << d.relationship_id;
            if (d.source_missing) std::cout << " missing source " << r->source_entity;
            if (d.target_missing) std::cout << " missing target " << r->target_entity;
            std::cout << "\n";
        }
        if (!dangling.empty() && rc == 0) rc = 2;
    }
    return rc;
}

int cmd_merge(int argc, char** argv) {
    const std::string out_path = cli::get_arg(argc, argv, "--out", "");
    auto inputs = cli::positional(argc, argv, {"--out"});
    if (inputs.empty() || out_path.empty()) {
        std::cerr << "merge: usage: merge <a.json> [b.json ...] --out <merged.json>\n";
        return 1;
    }

    model::EntityCollection merged;
    for (const auto& path : inputs) {
        try {
            model::EntityCollection part = io::load_collection(path);
            if (!merged.source_id()) merged.set_source_id(part.source_id());
            for (const auto& conflict : extract::merge_into(merged, part, path)) {
                std::cerr << "warning: " << path << ": entity id " << conflict.entity_id << " ("
                          << conflict.name << ", " << conflict.type << ") already taken, stored as "
                          << conflict.reissued_id << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "merge: " << path << ": " << e.what() << "\n";
            return 1;
        }
    }

    try {
        io::save_collection(fs::path(out_path), merged);
    } catch (const std::exception& e) {
        std::cerr << "merge: " << e.what() << "\n";
        return 1;
    }

    std::cout << "merged " << inputs.size() << " collections: " << merged.entities().size()
              << " entities, " << merged.relationships().size() << " relationships -> " << out_path << "\n";
    return 0;
}
