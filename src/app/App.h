#pragma once

#include <string>
#include <vector>

namespace taggraph {

class NodeRegistry;
class GraphBuilder;

// ============================================================================
// App - command line front end
//
//   taggraph [--root DIR] [--config FILE] [--verbose] <command> [args]
// ============================================================================

class App {
public:
    bool init(int argc, char* argv[]);

    // Builds the graph and runs the command. Returns the process exit code.
    int run();

    void shutdown();

    bool helpRequested() const { return helpRequested_; }

private:
    bool parseArgs(int argc, char* argv[]);
    void printUsage() const;

    int cmdStats(const NodeRegistry& registry, const GraphBuilder& builder) const;
    int cmdTags(const NodeRegistry& registry) const;
    int cmdTagged(const NodeRegistry& registry) const;
    int cmdListTags(const NodeRegistry& registry) const;
    int cmdExport(const NodeRegistry& registry) const;

    std::string rootPath_;
    std::string configPath_;
    std::string command_;
    std::vector<std::string> args_;
    bool verboseFlag_ = false;
    bool helpRequested_ = false;
};

} // namespace taggraph
