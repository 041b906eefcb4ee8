#include "NodeRegistry.h"

#include <utility>

namespace taggraph {

NodeIndex NodeRegistry::getNode(const GraphNode& node) {
    auto it = index_.find(node);
    if (it != index_.end()) {
        return it->second;
    }

    NodeIndex idx = graph_.addNode(node);
    index_.emplace(node, idx);
    return idx;
}

NodeIndex NodeRegistry::getNode(GraphNode&& node) {
    auto it = index_.find(node);
    if (it != index_.end()) {
        return it->second;
    }

    // The map keeps its own copy; the graph takes the moved value.
    NodeIndex idx = static_cast<NodeIndex>(graph_.nodeCount());
    index_.emplace(node, idx);
    graph_.addNode(std::move(node));
    return idx;
}

NodeIndex NodeRegistry::findNode(const GraphNode& node) const {
    auto it = index_.find(node);
    if (it != index_.end()) {
        return it->second;
    }
    return INVALID_NODE;
}

EdgeIndex NodeRegistry::updateEdge(const GraphNode& a, const GraphNode& b, Relation relation) {
    NodeIndex ax = getNode(a);
    NodeIndex bx = getNode(b);
    return graph_.updateEdge(ax, bx, relation);
}

EdgeIndex NodeRegistry::updateEdge(NodeIndex a, NodeIndex b, Relation relation) {
    return graph_.updateEdge(a, b, relation);
}

} // namespace taggraph
