#pragma once

#include <filesystem>
#include <string>

#include "extract/EntityExtractor.hpp"

namespace extract {

// Returns the collection stored at <root>/<source_id>.json, ignoring the text.
// Used for fixtures and to fold earlier extractions into a merge.
class ReplayExtractor final : public EntityExtractor {
    std::filesystem::path root_;

public:
    explicit ReplayExtractor(const std::string& root_dir);

    std::string name() const override { return "ReplayExtractor"; }

    // Throws ExtractionError without a valid source_id, or when the file is missing or malformed.
    model::EntityCollection extract_entities(const std::string& text,
                                             const ExtractParams& params) const override;

    // Throws ExtractionError for an empty id or one containing '/', '\\' or "..".
    std::filesystem::path path_for(const std::string& source_id) const;
};

} // namespace extract
