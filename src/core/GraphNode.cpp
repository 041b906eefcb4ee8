#include "GraphNode.h"

#include <functional>

namespace taggraph {

namespace {

// Mixes the alternative index into the payload hash so that File(p) and
// Directory(p) land in different buckets.
size_t combine(size_t seed, size_t value) {
    return seed ^ (value + static_cast<size_t>(0x9e3779b97f4a7c15ULL) + (seed << 6) + (seed >> 2));
}

struct HashVisitor {
    size_t operator()(const FileNode& n) const { return std::filesystem::hash_value(n.path); }
    size_t operator()(const DirectoryNode& n) const { return std::filesystem::hash_value(n.path); }
    size_t operator()(const RootDirectoryNode&) const { return 0; }
    size_t operator()(const RootTagNode&) const { return 0; }
    size_t operator()(const TagNode& n) const { return std::hash<std::string>{}(n.name); }
};

struct TypeVisitor {
    NodeType operator()(const FileNode&) const { return NODE_FILE; }
    NodeType operator()(const DirectoryNode&) const { return NODE_DIRECTORY; }
    NodeType operator()(const RootDirectoryNode&) const { return NODE_ROOT_DIRECTORY; }
    NodeType operator()(const RootTagNode&) const { return NODE_ROOT_TAG; }
    NodeType operator()(const TagNode&) const { return NODE_TAG; }
};

struct PathVisitor {
    const std::filesystem::path* operator()(const FileNode& n) const { return &n.path; }
    const std::filesystem::path* operator()(const DirectoryNode& n) const { return &n.path; }
    const std::filesystem::path* operator()(const RootDirectoryNode&) const { return nullptr; }
    const std::filesystem::path* operator()(const RootTagNode&) const { return nullptr; }
    const std::filesystem::path* operator()(const TagNode&) const { return nullptr; }
};

struct StringVisitor {
    std::string operator()(const FileNode& n) const { return "File(" + n.path.string() + ")"; }
    std::string operator()(const DirectoryNode& n) const { return "Directory(" + n.path.string() + ")"; }
    std::string operator()(const RootDirectoryNode&) const { return "RootDirectory"; }
    std::string operator()(const RootTagNode&) const { return "RootTag"; }
    std::string operator()(const TagNode& n) const { return "Tag(" + n.name + ")"; }
};

} // namespace

size_t GraphNodeHash::operator()(const GraphNode& node) const {
    return combine(std::hash<size_t>{}(node.index()), std::visit(HashVisitor{}, node));
}

NodeType nodeType(const GraphNode& node) {
    return std::visit(TypeVisitor{}, node);
}

const std::filesystem::path* nodePath(const GraphNode& node) {
    return std::visit(PathVisitor{}, node);
}

std::string nodeToString(const GraphNode& node) {
    return std::visit(StringVisitor{}, node);
}

} // namespace taggraph
