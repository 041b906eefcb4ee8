#include "app/App.h"

#include "app/Config.h"
#include "core/GraphBuilder.h"
#include "core/NodeRegistry.h"
#include "core/PlatformUtils.h"
#include "core/TagGraphError.h"
#include "query/GraphExport.h"
#include "query/TagQuery.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>

namespace taggraph {

namespace {

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

// First argument that is not a --flag.
std::string firstPositional(const std::vector<std::string>& args) {
    for (const auto& a : args) {
        if (a.rfind("--", 0) != 0) {
            return a;
        }
    }
    return std::string();
}

} // namespace

bool App::init(int argc, char* argv[]) {
    if (!parseArgs(argc, argv)) {
        printUsage();
        return false;
    }
    if (helpRequested_) {
        printUsage();
        return true;
    }

    // Load config
    if (configPath_.empty()) {
        Config::instance().load();
    } else {
        Config::instance().loadFrom(configPath_);
    }
    if (verboseFlag_) {
        Config::instance().verbose = true;
    }

    // Root: CLI arg > default path > current dir
    if (rootPath_.empty()) {
        const std::string& dp = Config::instance().defaultRootPath;
        rootPath_ = dp.empty() ? "." : dp;
    }
    return true;
}

bool App::parseArgs(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!command_.empty()) {
            args_.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            helpRequested_ = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verboseFlag_ = true;
        } else if (arg == "--root" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "taggraph: " << arg << " requires a value" << std::endl;
                return false;
            }
            (arg == "--root" ? rootPath_ : configPath_) = argv[++i];
        } else if (arg.rfind("-", 0) == 0) {
            std::cerr << "taggraph: unknown option " << arg << std::endl;
            return false;
        } else {
            command_ = arg;
        }
    }

    if (command_.empty() && !helpRequested_) {
        std::cerr << "taggraph: no command given" << std::endl;
        return false;
    }
    return true;
}

void App::printUsage() const {
    std::cout <<
        "usage: taggraph [--root DIR] [--config FILE] [--verbose] <command> [args]\n"
        "\n"
        "commands:\n"
        "  stats                            node, edge and scan counts\n"
        "  tags <path> [--inherited|--direct]\n"
        "                                   tags applying to a path\n"
        "  tagged <pattern> [--recursive]   paths carrying tags matching pattern\n"
        "  list-tags                        every known tag\n"
        "  export [FILE]                    graph as JSON (stdout by default)\n";
}

int App::run() {
    if (helpRequested_) {
        return 0;
    }

    static const char* const commands[] = {"stats", "tags", "tagged", "list-tags", "export"};
    if (std::find(std::begin(commands), std::end(commands), command_) == std::end(commands)) {
        std::cerr << "taggraph: unknown command " << command_ << std::endl;
        printUsage();
        return 2;
    }

    const Config& config = Config::instance();
    GraphBuilder builder(config.scanOptions());

    try {
        NodeRegistry registry = builder.build(rootPath_);

        if (command_ == "stats")     return cmdStats(registry, builder);
        if (command_ == "tags")      return cmdTags(registry);
        if (command_ == "tagged")    return cmdTagged(registry);
        if (command_ == "list-tags") return cmdListTags(registry);
        return cmdExport(registry);
    } catch (const TagGraphError& e) {
        std::cerr << "taggraph: error: " << e.what() << std::endl;
        return 1;
    }
}

void App::shutdown() {
    if (helpRequested_) {
        return;
    }
    Config& config = Config::instance();
    config.lastRootPath = rootPath_;
    bool saved = configPath_.empty() ? config.save() : config.saveTo(configPath_);
    if (!saved && config.verbose) {
        std::cout << "App: last root not remembered" << std::endl;
    }
}

int App::cmdStats(const NodeRegistry& registry, const GraphBuilder& builder) const {
    const TagGraph& graph = registry.graph();

    int nodeCounts[NUM_NODE_TYPES] = {};
    graph.forEachNode([&](NodeIndex, const GraphNode& node) {
        nodeCounts[nodeType(node)]++;
    });
    int relationCounts[NUM_RELATIONS] = {};
    graph.forEachEdge([&](const GraphEdge& e) {
        relationCounts[e.relation]++;
    });

    std::cout << "Nodes: " << PlatformUtils::formatNumber(static_cast<int64_t>(graph.nodeCount())) << "\n";
    for (int i = 0; i < NUM_NODE_TYPES; ++i) {
        std::cout << "  " << nodeTypeNames[i] << ": " << PlatformUtils::formatNumber(nodeCounts[i]) << "\n";
    }
    std::cout << "Edges: " << PlatformUtils::formatNumber(static_cast<int64_t>(graph.edgeCount())) << "\n";
    for (int i = 0; i < NUM_RELATIONS; ++i) {
        std::cout << "  " << relationNames[i] << ": " << PlatformUtils::formatNumber(relationCounts[i]) << "\n";
    }

    const TagScanStats& ts = builder.tagStats();
    std::cout << "Tag files: " << ts.tagFileCount
              << " (" << ts.orphanTagFileCount << " without targets), "
              << ts.tagCount << " tag lines, "
              << ts.attachmentCount << " attachments\n";

    const WalkStats& ws = builder.walkStats();
    std::cout << "Walked entries: " << PlatformUtils::formatNumber(ws.entryCount)
              << ", skipped tag files: " << ws.skippedTagFiles
              << ", errors: " << ws.errorCount << "\n";
    std::cout << "Build time: " << builder.elapsedSeconds() << " s" << std::endl;
    return 0;
}

int App::cmdTags(const NodeRegistry& registry) const {
    std::string path = firstPositional(args_);
    if (path.empty()) {
        std::cerr << "taggraph: tags requires a path" << std::endl;
        return 2;
    }

    bool inherited = Config::instance().inheritTags;
    if (hasFlag(args_, "--inherited")) inherited = true;
    if (hasFlag(args_, "--direct")) inherited = false;

    TagQuery query(registry);
    if (query.findPath(path) == INVALID_NODE) {
        std::cerr << "taggraph: " << path << " is not in the graph" << std::endl;
        return 1;
    }
    for (const auto& tag : query.tagsOf(path, inherited)) {
        std::cout << tag << "\n";
    }
    std::cout.flush();
    return 0;
}

int App::cmdTagged(const NodeRegistry& registry) const {
    std::string pattern = firstPositional(args_);
    if (pattern.empty()) {
        std::cerr << "taggraph: tagged requires a tag pattern" << std::endl;
        return 2;
    }
    bool recursive = hasFlag(args_, "--recursive");

    TagQuery query(registry);
    for (const auto& tag : query.matchTags(pattern)) {
        for (const auto& p : query.pathsTagged(tag, recursive)) {
            std::cout << tag << "\t" << p.string() << "\n";
        }
    }
    std::cout.flush();
    return 0;
}

int App::cmdListTags(const NodeRegistry& registry) const {
    TagQuery query(registry);
    for (const auto& tag : query.allTags()) {
        std::cout << tag << "\n";
    }
    std::cout.flush();
    return 0;
}

int App::cmdExport(const NodeRegistry& registry) const {
    std::string out = firstPositional(args_);
    const std::string text = dumpGraph(registry.graph());

    if (out.empty() || out == "-") {
        std::cout << text << std::endl;
        return 0;
    }

    std::ofstream ofs(out);
    if (!ofs.is_open()) {
        std::cerr << "taggraph: failed to write " << out << std::endl;
        return 1;
    }
    ofs << text << std::endl;
    if (!ofs) {
        std::cerr << "taggraph: failed to write " << out << std::endl;
        return 1;
    }
    return 0;
}

} // namespace taggraph
