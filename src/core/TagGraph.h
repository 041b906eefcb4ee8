#pragma once

#include "GraphNode.h"
#include "Types.h"

#include <functional>
#include <initializer_list>
#include <vector>

namespace taggraph {

struct GraphEdge {
    EdgeIndex id = INVALID_EDGE;
    NodeIndex source = INVALID_NODE;
    NodeIndex target = INVALID_NODE;
    Relation relation = REL_PARENT;
};

// Predicate selecting the edge subset a traversal may follow.
using RelationFilter = std::function<bool(Relation)>;

// Filter accepting exactly the listed relations.
RelationFilter relationFilter(std::initializer_list<Relation> accepted);

// ============================================================================
// TagGraph - directed multi-relation graph backed by node and edge arenas
//
// Node and edge handles are dense indices that never change: nothing is
// ever removed. Two edges between the same ordered pair of nodes are
// distinct as long as their relations differ.
// ============================================================================

class TagGraph {
public:
    NodeIndex addNode(GraphNode node);

    // Always appends a new edge, even if an identical one exists.
    EdgeIndex addEdge(NodeIndex source, NodeIndex target, Relation relation);

    // Adds the edge unless one with the same (source, target, relation)
    // already exists; returns the handle of that edge either way.
    EdgeIndex updateEdge(NodeIndex source, NodeIndex target, Relation relation);

    // Returns INVALID_EDGE if no such edge exists.
    EdgeIndex findEdge(NodeIndex source, NodeIndex target, Relation relation) const;

    // nullptr for an out-of-range handle.
    const GraphNode* node(NodeIndex index) const;
    const GraphEdge* edge(EdgeIndex index) const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    const std::vector<GraphEdge>& edges() const { return edges_; }

    const std::vector<EdgeIndex>& outgoing(NodeIndex index) const;
    const std::vector<EdgeIndex>& incoming(NodeIndex index) const;

    // Targets of outgoing edges whose relation passes the filter, in
    // edge insertion order. A target reached by several edges is listed once.
    std::vector<NodeIndex> neighbors(NodeIndex index, const RelationFilter& filter) const;

    // Breadth-first closure over outgoing edges passing the filter. The
    // start node is not included unless it is reachable from itself.
    std::vector<NodeIndex> reachable(NodeIndex start, const RelationFilter& filter) const;

    void forEachNode(const std::function<void(NodeIndex, const GraphNode&)>& fn) const;
    void forEachEdge(const std::function<void(const GraphEdge&)>& fn) const;

private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;

    // Adjacency lists: node index -> edge indices
    std::vector<std::vector<EdgeIndex>> outgoing_;
    std::vector<std::vector<EdgeIndex>> incoming_;
};

} // namespace taggraph
