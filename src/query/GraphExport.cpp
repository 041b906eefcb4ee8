#include "query/GraphExport.h"

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

namespace taggraph {

nlohmann::json graphToJson(const TagGraph& graph) {
    nlohmann::json j;

    nlohmann::json jNodes = nlohmann::json::array();
    graph.forEachNode([&](NodeIndex idx, const GraphNode& node) {
        nlohmann::json jn;
        jn["id"] = idx;
        jn["type"] = nodeTypeNames[nodeType(node)];
        if (const auto* p = nodePath(node)) {
            jn["path"] = p->string();
        } else if (const auto* tag = std::get_if<TagNode>(&node)) {
            jn["name"] = tag->name;
        }
        jNodes.push_back(jn);
    });
    j["nodes"] = jNodes;

    nlohmann::json jEdges = nlohmann::json::array();
    graph.forEachEdge([&](const GraphEdge& e) {
        nlohmann::json je;
        je["source"] = e.source;
        je["target"] = e.target;
        je["relation"] = relationNames[e.relation];
        jEdges.push_back(je);
    });
    j["edges"] = jEdges;

    return j;
}

std::string dumpGraph(const TagGraph& graph, int indent) {
    return graphToJson(graph).dump(indent, ' ', false,
                                   nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> edgeSignature(const TagGraph& graph) {
    std::vector<std::string> sig;
    sig.reserve(graph.edgeCount());
    graph.forEachEdge([&](const GraphEdge& e) {
        sig.push_back(nodeToString(*graph.node(e.source)) + " -" +
                      relationNames[e.relation] + "-> " +
                      nodeToString(*graph.node(e.target)));
    });
    std::sort(sig.begin(), sig.end());
    return sig;
}

} // namespace taggraph
