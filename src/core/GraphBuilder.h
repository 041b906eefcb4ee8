#pragma once

#include "FsWalker.h"
#include "NodeRegistry.h"
#include "ScanOptions.h"
#include "TagFileScanner.h"

#include <string>

namespace taggraph {

// ============================================================================
// GraphBuilder - runs the tag scan, then the filesystem walk, into one
// shared NodeRegistry
//
// Throws TagGraphError if the root cannot be canonicalized or if the tag
// scan fails. The returned registry owns the finished graph and is not
// modified afterwards.
// ============================================================================

class GraphBuilder {
public:
    explicit GraphBuilder(ScanOptions options = ScanOptions());

    NodeRegistry build(const std::string& rootPath);

    // Statistics of the last build.
    const TagScanStats& tagStats() const { return scanner_.stats(); }
    const WalkStats& walkStats() const { return walker_.stats(); }
    double elapsedSeconds() const { return elapsed_; }

private:
    ScanOptions options_;
    TagFileScanner scanner_;
    FsWalker walker_;
    double elapsed_ = 0.0;
};

// Convenience wrapper around GraphBuilder::build.
NodeRegistry buildTagGraph(const std::string& rootPath, const ScanOptions& options = ScanOptions());

} // namespace taggraph
