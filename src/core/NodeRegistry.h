#pragma once

#include "GraphNode.h"
#include "TagGraph.h"
#include "Types.h"

#include <unordered_map>

namespace taggraph {

// ============================================================================
// NodeRegistry - deduplicating front end of a TagGraph
//
// Maps each node value to exactly one handle in the owned graph. Node
// values must already be in canonical form: the registry compares them
// as given.
// ============================================================================

class NodeRegistry {
public:
    NodeRegistry() = default;
    NodeRegistry(NodeRegistry&&) = default;
    NodeRegistry& operator=(NodeRegistry&&) = default;

    // Get the handle of a node, adding it to the graph if it didn't exist.
    NodeIndex getNode(const GraphNode& node);
    NodeIndex getNode(GraphNode&& node);

    // Lookup without creating. Returns INVALID_NODE if unknown.
    NodeIndex findNode(const GraphNode& node) const;

    // Handle back to value; nullptr for an unknown handle.
    const GraphNode* node(NodeIndex index) const { return graph_.node(index); }

    // Resolve (or create) both endpoints, then update the a -> b edge.
    EdgeIndex updateEdge(const GraphNode& a, const GraphNode& b, Relation relation);
    EdgeIndex updateEdge(NodeIndex a, NodeIndex b, Relation relation);

    size_t size() const { return index_.size(); }

    const TagGraph& graph() const { return graph_; }

private:
    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    TagGraph graph_;
    std::unordered_map<GraphNode, NodeIndex, GraphNodeHash> index_;
};

} // namespace taggraph
