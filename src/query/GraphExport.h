#pragma once

#include "core/TagGraph.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace taggraph {

// Serializes every node (id, type, path or name) and every edge
// (source, target, relation) for external viewers:
//   { "nodes": [...], "edges": [...] }
nlohmann::json graphToJson(const TagGraph& graph);

// graphToJson as text. Paths are raw bytes on Linux; bytes that are not
// UTF-8 are written as U+FFFD instead of failing the dump.
std::string dumpGraph(const TagGraph& graph, int indent = 2);

// Edges as (source, relation, target) strings built from node values
// instead of handles, sorted. Two builds of the same tree give equal
// results regardless of handle numbering.
std::vector<std::string> edgeSignature(const TagGraph& graph);

} // namespace taggraph
