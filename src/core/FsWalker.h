#pragma once

#include "NodeRegistry.h"
#include "ScanOptions.h"
#include "Types.h"

#include <filesystem>

namespace taggraph {

// ============================================================================
// Walk statistics
// ============================================================================

struct WalkStats {
    int entryCount = 0;         // entries recorded in the graph, root included
    int skippedTagFiles = 0;
    int errorCount = 0;         // entries or directories that could not be read
};

// ============================================================================
// FsWalker - second builder pass
//
// Records Parent/Child edges for every entry under the root except tag
// files. The root itself hangs off RootDirectory. Errors on one entry are
// logged and the walk carries on with the rest.
// ============================================================================

class FsWalker {
public:
    explicit FsWalker(ScanOptions options = ScanOptions());

    // root must be a canonical path.
    void walk(const std::filesystem::path& root, NodeRegistry& registry);

    const WalkStats& stats() const { return stats_; }

private:
    // Adds a File or Directory node for a canonical path.
    NodeIndex addEntry(const std::filesystem::path& canonPath, NodeRegistry& registry);

    // Connects child to parent with the Child/Parent edge pair.
    void link(NodeIndex parent, NodeIndex child, NodeRegistry& registry);

    void logError(const std::filesystem::path& path, const std::error_code& ec);

    ScanOptions options_;
    WalkStats stats_{};
};

} // namespace taggraph
