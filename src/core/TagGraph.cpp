#include "TagGraph.h"
#include "TagGraphError.h"

#include <deque>
#include <string>

namespace taggraph {

RelationFilter relationFilter(std::initializer_list<Relation> accepted) {
    std::vector<bool> accept(NUM_RELATIONS, false);
    for (Relation r : accepted) {
        accept[r] = true;
    }
    return [accept](Relation r) { return accept[r]; };
}

NodeIndex TagGraph::addNode(GraphNode node) {
    NodeIndex index = static_cast<NodeIndex>(nodes_.size());
    nodes_.push_back(std::move(node));
    outgoing_.emplace_back();
    incoming_.emplace_back();
    return index;
}

EdgeIndex TagGraph::addEdge(NodeIndex source, NodeIndex target, Relation relation) {
    if (source >= nodes_.size() || target >= nodes_.size()) {
        throw TagGraphError(TagGraphError::ERR_MESSAGE,
            "edge endpoint out of range: " + std::to_string(source) + " -> " +
            std::to_string(target));
    }

    GraphEdge e;
    e.id = static_cast<EdgeIndex>(edges_.size());
    e.source = source;
    e.target = target;
    e.relation = relation;
    edges_.push_back(e);

    outgoing_[source].push_back(e.id);
    incoming_[target].push_back(e.id);
    return e.id;
}

EdgeIndex TagGraph::updateEdge(NodeIndex source, NodeIndex target, Relation relation) {
    EdgeIndex existing = findEdge(source, target, relation);
    if (existing != INVALID_EDGE) {
        return existing;
    }
    return addEdge(source, target, relation);
}

EdgeIndex TagGraph::findEdge(NodeIndex source, NodeIndex target, Relation relation) const {
    if (source >= outgoing_.size()) {
        return INVALID_EDGE;
    }
    // Keyed on the relation as well as the endpoints.
    for (EdgeIndex id : outgoing_[source]) {
        const GraphEdge& e = edges_[id];
        if (e.target == target && e.relation == relation) {
            return id;
        }
    }
    return INVALID_EDGE;
}

const GraphNode* TagGraph::node(NodeIndex index) const {
    if (index < nodes_.size()) {
        return &nodes_[index];
    }
    return nullptr;
}

const GraphEdge* TagGraph::edge(EdgeIndex index) const {
    if (index < edges_.size()) {
        return &edges_[index];
    }
    return nullptr;
}

const std::vector<EdgeIndex>& TagGraph::outgoing(NodeIndex index) const {
    static const std::vector<EdgeIndex> empty;
    return index < outgoing_.size() ? outgoing_[index] : empty;
}

const std::vector<EdgeIndex>& TagGraph::incoming(NodeIndex index) const {
    static const std::vector<EdgeIndex> empty;
    return index < incoming_.size() ? incoming_[index] : empty;
}

std::vector<NodeIndex> TagGraph::neighbors(NodeIndex index, const RelationFilter& filter) const {
    std::vector<NodeIndex> result;
    std::vector<bool> seen(nodes_.size(), false);
    for (EdgeIndex id : outgoing(index)) {
        const GraphEdge& e = edges_[id];
        if (filter && !filter(e.relation)) continue;
        if (seen[e.target]) continue;
        seen[e.target] = true;
        result.push_back(e.target);
    }
    return result;
}

std::vector<NodeIndex> TagGraph::reachable(NodeIndex start, const RelationFilter& filter) const {
    std::vector<NodeIndex> result;
    if (start >= nodes_.size()) {
        return result;
    }

    std::vector<bool> visited(nodes_.size(), false);
    std::deque<NodeIndex> queue;
    queue.push_back(start);

    while (!queue.empty()) {
        NodeIndex current = queue.front();
        queue.pop_front();

        for (EdgeIndex id : outgoing_[current]) {
            const GraphEdge& e = edges_[id];
            if (filter && !filter(e.relation)) continue;
            if (visited[e.target]) continue;
            visited[e.target] = true;
            result.push_back(e.target);
            queue.push_back(e.target);
        }
    }
    return result;
}

void TagGraph::forEachNode(const std::function<void(NodeIndex, const GraphNode&)>& fn) const {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        fn(static_cast<NodeIndex>(i), nodes_[i]);
    }
}

void TagGraph::forEachEdge(const std::function<void(const GraphEdge&)>& fn) const {
    for (const auto& e : edges_) {
        fn(e);
    }
}

} // namespace taggraph
