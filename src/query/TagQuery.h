#pragma once

#include "core/NodeRegistry.h"
#include "core/Types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace taggraph {

// ============================================================================
// TagQuery - read-only questions against a finished graph
// ============================================================================

class TagQuery {
public:
    explicit TagQuery(const NodeRegistry& registry);

    // File or Directory node for a path, canonicalized first.
    // INVALID_NODE if the path is unknown or cannot be canonicalized.
    NodeIndex findPath(const std::filesystem::path& path) const;

    // Tags of a path, sorted. With inherited set, tags of every enclosing
    // directory are included as well (HasTag and Parent edges only).
    std::vector<std::string> tagsOf(const std::filesystem::path& path, bool inherited) const;

    // Paths a tag was assigned to, sorted. With recursive set, everything
    // below a tagged directory is included.
    std::vector<std::filesystem::path> pathsTagged(const std::string& tag, bool recursive) const;

    // Every known tag, sorted.
    std::vector<std::string> allTags() const;

    // Known tags matching a wildcard pattern (* and ?).
    std::vector<std::string> matchTags(const std::string& pattern) const;

private:
    std::vector<std::string> tagNames(const std::vector<NodeIndex>& nodes) const;

    const NodeRegistry& registry_;
};

} // namespace taggraph
