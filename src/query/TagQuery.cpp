#include "query/TagQuery.h"
#include "core/PlatformUtils.h"

#include <algorithm>
#include <variant>

namespace taggraph {

namespace fs = std::filesystem;

namespace {

template <typename T>
void sortUnique(std::vector<T>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

} // namespace

TagQuery::TagQuery(const NodeRegistry& registry)
    : registry_(registry) {}

NodeIndex TagQuery::findPath(const fs::path& path) const {
    std::error_code ec;
    fs::path canon = fs::canonical(path, ec);
    if (ec) {
        return INVALID_NODE;
    }

    NodeIndex idx = registry_.findNode(FileNode{canon});
    if (idx == INVALID_NODE) {
        idx = registry_.findNode(DirectoryNode{canon});
    }
    return idx;
}

std::vector<std::string> TagQuery::tagsOf(const fs::path& path, bool inherited) const {
    NodeIndex start = findPath(path);
    if (start == INVALID_NODE) {
        return {};
    }

    const TagGraph& graph = registry_.graph();
    std::vector<NodeIndex> nodes = inherited
        ? graph.reachable(start, relationFilter({REL_HAS_TAG, REL_PARENT}))
        : graph.neighbors(start, relationFilter({REL_HAS_TAG}));
    return tagNames(nodes);
}

std::vector<fs::path> TagQuery::pathsTagged(const std::string& tag, bool recursive) const {
    std::vector<fs::path> result;

    NodeIndex tagNode = registry_.findNode(TagNode{tag});
    if (tagNode == INVALID_NODE) {
        return result;
    }

    const TagGraph& graph = registry_.graph();
    std::vector<NodeIndex> targets = graph.neighbors(tagNode, relationFilter({REL_TAG_ASSIGNED_TO}));
    if (recursive) {
        RelationFilter down = relationFilter({REL_CHILD});
        std::vector<NodeIndex> below;
        for (NodeIndex t : targets) {
            auto sub = graph.reachable(t, down);
            below.insert(below.end(), sub.begin(), sub.end());
        }
        targets.insert(targets.end(), below.begin(), below.end());
    }

    for (NodeIndex t : targets) {
        const GraphNode* n = registry_.node(t);
        if (n == nullptr) continue;
        if (const fs::path* p = nodePath(*n)) {
            result.push_back(*p);
        }
    }
    sortUnique(result);
    return result;
}

std::vector<std::string> TagQuery::allTags() const {
    NodeIndex root = registry_.findNode(RootTagNode{});
    if (root == INVALID_NODE) {
        return {};
    }
    return tagNames(registry_.graph().neighbors(root, relationFilter({REL_HAS_TAG})));
}

std::vector<std::string> TagQuery::matchTags(const std::string& pattern) const {
    std::vector<std::string> result;
    for (auto& tag : allTags()) {
        if (PlatformUtils::wildcardMatch(pattern, tag)) {
            result.push_back(std::move(tag));
        }
    }
    return result;
}

std::vector<std::string> TagQuery::tagNames(const std::vector<NodeIndex>& nodes) const {
    std::vector<std::string> names;
    for (NodeIndex idx : nodes) {
        const GraphNode* n = registry_.node(idx);
        if (n == nullptr) continue;
        if (const auto* tag = std::get_if<TagNode>(n)) {
            names.push_back(tag->name);
        }
    }
    sortUnique(names);
    return names;
}

} // namespace taggraph
