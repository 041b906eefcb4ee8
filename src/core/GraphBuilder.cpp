#include "GraphBuilder.h"
#include "PlatformUtils.h"
#include "TagGraphError.h"

#include <filesystem>
#include <iostream>

namespace taggraph {

GraphBuilder::GraphBuilder(ScanOptions options)
    : options_(options), scanner_(options), walker_(options) {}

NodeRegistry GraphBuilder::build(const std::string& rootPath) {
    double start = PlatformUtils::getTime();

    if (rootPath.empty()) {
        throw TagGraphError(TagGraphError::ERR_MESSAGE, "empty root path");
    }

    std::error_code ec;
    std::filesystem::path root = std::filesystem::canonical(rootPath, ec);
    if (ec) {
        throw TagGraphError::io("cannot canonicalize root", rootPath, ec);
    }

    NodeRegistry registry;
    scanner_.scan(root, registry);
    walker_.walk(root, registry);

    elapsed_ = PlatformUtils::getTime() - start;
    if (options_.verbose) {
        std::cout << "GraphBuilder: " << registry.graph().nodeCount() << " nodes, "
                  << registry.graph().edgeCount() << " edges in " << elapsed_ << " s"
                  << std::endl;
    }
    return registry;
}

NodeRegistry buildTagGraph(const std::string& rootPath, const ScanOptions& options) {
    GraphBuilder builder(options);
    return builder.build(rootPath);
}

} // namespace taggraph
