#pragma once

#include "Types.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>

namespace taggraph {

// ============================================================================
// Node alternatives
//
// Path-bearing nodes hold absolute, canonical paths. Identity is plain
// value equality, so callers must canonicalize before building a node.
// ============================================================================

struct FileNode {
    std::filesystem::path path;

    bool operator==(const FileNode& other) const { return path == other.path; }
    bool operator!=(const FileNode& other) const { return !(*this == other); }
};

struct DirectoryNode {
    std::filesystem::path path;

    bool operator==(const DirectoryNode& other) const { return path == other.path; }
    bool operator!=(const DirectoryNode& other) const { return !(*this == other); }
};

// Anchor above the walked root.
struct RootDirectoryNode {
    bool operator==(const RootDirectoryNode&) const { return true; }
    bool operator!=(const RootDirectoryNode&) const { return false; }
};

// Anchor owning every known tag.
struct RootTagNode {
    bool operator==(const RootTagNode&) const { return true; }
    bool operator!=(const RootTagNode&) const { return false; }
};

struct TagNode {
    std::string name;

    bool operator==(const TagNode& other) const { return name == other.name; }
    bool operator!=(const TagNode& other) const { return !(*this == other); }
};

using GraphNode = std::variant<FileNode, DirectoryNode, RootDirectoryNode, RootTagNode, TagNode>;

// ============================================================================
// Helpers
// ============================================================================

struct GraphNodeHash {
    size_t operator()(const GraphNode& node) const;
};

NodeType nodeType(const GraphNode& node);

// Returns the path of a File or Directory node, nullptr for the others.
const std::filesystem::path* nodePath(const GraphNode& node);

// Debug representation, e.g. File(/a/b.txt), Tag(red), RootTag.
std::string nodeToString(const GraphNode& node);

} // namespace taggraph
