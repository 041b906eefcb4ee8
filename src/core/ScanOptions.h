#pragma once

#include "Types.h"

#include <string>

namespace taggraph {

// ============================================================================
// ScanOptions - naming conventions shared by the tag scanner and the walker
// ============================================================================

struct ScanOptions {
    std::string tagFileExtension = DEFAULT_TAG_FILE_EXTENSION;
    std::string dirTagFileName = DEFAULT_DIR_TAG_FILE_NAME;

    // Print a trace line for every tag file, attach target and tag.
    bool verbose = false;

    // Wildcard a file name must match to count as a tag file.
    std::string tagFilePattern() const { return "*" + tagFileExtension; }

    // True if name has the tag file extension. Callers exclude directories.
    bool isTagFileName(const std::string& name) const;

    // Name with the tag file extension removed ("img.tags" -> "img").
    std::string tagFileStem(const std::string& name) const;
};

} // namespace taggraph
