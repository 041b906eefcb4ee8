#include "FsWalker.h"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

namespace taggraph {

namespace fs = std::filesystem;

FsWalker::FsWalker(ScanOptions options)
    : options_(std::move(options)) {}

void FsWalker::walk(const fs::path& root, NodeRegistry& registry) {
    stats_ = WalkStats{};

    NodeIndex dirRoot = registry.getNode(RootDirectoryNode{});
    std::error_code ec;

    // Depth zero: the root entry itself.
    fs::file_status rootStatus = fs::status(root, ec);
    if (ec) {
        logError(root, ec);
        return;
    }
    if (!fs::is_directory(rootStatus) && options_.isTagFileName(root.filename().string())) {
        stats_.skippedTagFiles++;
        return;
    }

    fs::path canonRoot = fs::canonical(root, ec);
    if (ec) {
        logError(root, ec);
        return;
    }
    if (!fs::is_directory(rootStatus) && options_.isTagFileName(canonRoot.filename().string())) {
        stats_.skippedTagFiles++;
        return;
    }

    NodeIndex rootNode = addEntry(canonRoot, registry);
    link(dirRoot, rootNode, registry);
    if (!fs::is_directory(rootStatus)) {
        return;
    }

    struct PendingDir {
        fs::path path;
        NodeIndex node;
    };
    std::vector<PendingDir> pending;
    pending.push_back({canonRoot, rootNode});

    while (!pending.empty()) {
        PendingDir dir = std::move(pending.back());
        pending.pop_back();

        auto dirIt = fs::directory_iterator(dir.path, ec);
        if (ec) {
            logError(dir.path, ec);
            ec.clear();
            continue;
        }

        std::vector<fs::directory_entry> entries;
        while (dirIt != fs::directory_iterator()) {
            entries.push_back(*dirIt);
            dirIt.increment(ec);
            if (ec) {
                logError(dir.path, ec);
                ec.clear();
                break;
            }
        }
        std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry& a, const fs::directory_entry& b) {
                return a.path().filename() < b.path().filename();
            });

        // Pushed in reverse so the stack pops subdirectories in name order.
        std::vector<PendingDir> subdirs;

        for (const auto& entry : entries) {
            bool isDir = entry.is_directory(ec);
            ec.clear();
            bool isLink = entry.is_symlink(ec);
            ec.clear();

            if (!isDir && options_.isTagFileName(entry.path().filename().string())) {
                stats_.skippedTagFiles++;
                continue;
            }

            fs::path canon = fs::canonical(entry.path(), ec);
            if (ec) {
                logError(entry.path(), ec);
                ec.clear();
                continue;
            }
            // Links resolving to a tag file are skipped like the file itself.
            if (!isDir && options_.isTagFileName(canon.filename().string())) {
                stats_.skippedTagFiles++;
                continue;
            }

            NodeIndex node = addEntry(canon, registry);
            link(dir.node, node, registry);

            // Symlinked directories are recorded but not entered.
            if (isDir && !isLink) {
                subdirs.push_back({canon, node});
            }
        }

        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
            pending.push_back(std::move(*it));
        }
    }
}

NodeIndex FsWalker::addEntry(const fs::path& canonPath, NodeRegistry& registry) {
    stats_.entryCount++;

    std::error_code ec;
    if (fs::is_directory(canonPath, ec)) {
        return registry.getNode(DirectoryNode{canonPath});
    }
    return registry.getNode(FileNode{canonPath});
}

void FsWalker::link(NodeIndex parent, NodeIndex child, NodeRegistry& registry) {
    registry.updateEdge(parent, child, REL_CHILD);
    registry.updateEdge(child, parent, REL_PARENT);
}

void FsWalker::logError(const fs::path& path, const std::error_code& ec) {
    stats_.errorCount++;
    std::cerr << "FsWalker: error when walking file structure: " << path.string()
              << ": " << ec.message() << std::endl;
}

} // namespace taggraph
