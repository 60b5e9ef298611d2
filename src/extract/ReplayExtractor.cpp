#include "extract/ReplayExtractor.hpp"
#include "io/JsonIO.hpp"

namespace fs = std::filesystem;

namespace extract {

ReplayExtractor::ReplayExtractor(const std::string& root_dir) : root_(root_dir) {}

fs::path ReplayExtractor::path_for(const std::string& source_id) const {
    // the id names one file directly under root_
    if (source_id.empty() || source_id.find_first_of("/\\") != std::string::npos ||
        source_id.find("..") != std::string::npos) {
        throw ExtractionError("invalid replay source_id '" + source_id + "'");
    }
    return root_ / (source_id + ".json");
}

model::EntityCollection ReplayExtractor::extract_entities(const std::string&, const ExtractParams& params) const {
    if (!params.source_id) {
        throw ExtractionError("ReplayExtractor needs a source_id");
    }

    const fs::path p = path_for(*params.source_id);
    if (!fs::exists(p)) {
        throw ExtractionError("no stored extraction for source '" + *params.source_id + "': " + p.string());
    }

    model::EntityCollection c;
    try {
        c = io::load_collection(p);
    } catch (const std::exception& e) {
        throw ExtractionError("cannot replay " + p.string() + ": " + e.what());
    }

    // the stored file is keyed by source_id; make the result say so
    c.set_source_id(params.source_id);
    return c;
}

} // namespace extract
