#pragma once

#include "GraphNode.h"
#include "NodeRegistry.h"
#include "ScanOptions.h"
#include "Types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace taggraph {

// ============================================================================
// Tag scan statistics
// ============================================================================

struct TagScanStats {
    int tagFileCount = 0;
    int tagCount = 0;               // lines read, duplicates included
    int attachmentCount = 0;        // (tag, target) pairs recorded
    int orphanTagFileCount = 0;     // tag files with no matching sibling
};

// ============================================================================
// TagFileScanner - first builder pass
//
// Finds every tag file under the root, works out what each one attaches
// to (its directory for dir.tags, otherwise the siblings matching its
// stem) and records RootTag -> Tag, target -> Tag and Tag -> target edges.
// Any IO failure aborts the scan with TagGraphError(ERR_IO).
// ============================================================================

class TagFileScanner {
public:
    explicit TagFileScanner(ScanOptions options = ScanOptions());

    // root must be a canonical path.
    void scan(const std::filesystem::path& root, NodeRegistry& registry);

    // All tag files below root (root included), sorted by path.
    std::vector<std::filesystem::path> findTagFiles(const std::filesystem::path& root) const;

    // Siblings in dir whose name or stem equals the tag file's stem, as
    // canonical File/Directory nodes. Other tag files are never targets.
    std::vector<GraphNode> matchSiblings(const std::filesystem::path& tagFile,
                                         const std::filesystem::path& dir) const;

    const TagScanStats& stats() const { return stats_; }

private:
    void processTagFile(const std::filesystem::path& tagFile, NodeIndex tagRoot,
                        NodeRegistry& registry);

    ScanOptions options_;
    TagScanStats stats_{};
};

// Reads a tag file: one tag per line, in file order, untrimmed. An empty
// line is an empty tag. Throws TagGraphError(ERR_IO) if the file cannot
// be read or is not UTF-8.
std::vector<std::string> readTagFile(const std::filesystem::path& file);

} // namespace taggraph
