#include "TagFileScanner.h"
#include "PlatformUtils.h"
#include "TagGraphError.h"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <utility>

namespace taggraph {

namespace fs = std::filesystem;

namespace {

// Lists a directory sorted by file name. Throws on any listing error.
std::vector<fs::directory_entry> listDirectory(const fs::path& dir) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;

    auto dirIt = fs::directory_iterator(dir, ec);
    if (ec) {
        throw TagGraphError::io("cannot list directory", dir, ec);
    }

    while (dirIt != fs::directory_iterator()) {
        entries.push_back(*dirIt);
        dirIt.increment(ec);
        if (ec) {
            throw TagGraphError::io("cannot list directory", dir, ec);
        }
    }

    std::sort(entries.begin(), entries.end(),
        [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename() < b.path().filename();
        });
    return entries;
}

fs::path canonicalOrThrow(const fs::path& p) {
    std::error_code ec;
    fs::path canon = fs::canonical(p, ec);
    if (ec) {
        throw TagGraphError::io("cannot canonicalize", p, ec);
    }
    return canon;
}

} // namespace

TagFileScanner::TagFileScanner(ScanOptions options)
    : options_(std::move(options)) {}

void TagFileScanner::scan(const fs::path& root, NodeRegistry& registry) {
    stats_ = TagScanStats{};

    NodeIndex tagRoot = registry.getNode(RootTagNode{});

    if (options_.verbose) {
        std::cout << "TagFileScanner: searching for " << options_.tagFilePattern()
                  << " under " << root.string() << std::endl;
    }

    for (const auto& tagFile : findTagFiles(root)) {
        processTagFile(tagFile, tagRoot, registry);
    }
}

std::vector<fs::path> TagFileScanner::findTagFiles(const fs::path& root) const {
    std::vector<fs::path> result;
    std::error_code ec;

    if (!fs::is_directory(fs::symlink_status(root, ec))) {
        if (ec) {
            throw TagGraphError::io("cannot stat", root, ec);
        }
        return result;
    }

    // Explicit worklist instead of recursive_directory_iterator so every
    // listing failure surfaces with its directory.
    std::vector<fs::path> pending;
    pending.push_back(root);

    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        for (const auto& entry : listDirectory(dir)) {
            bool isDir = entry.is_directory(ec);
            ec.clear();
            bool isLink = entry.is_symlink(ec);
            ec.clear();

            if (isDir) {
                // Symlinked directories are not followed.
                if (!isLink) {
                    pending.push_back(entry.path());
                }
                continue;
            }
            if (options_.isTagFileName(entry.path().filename().string())) {
                result.push_back(entry.path());
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::vector<GraphNode> TagFileScanner::matchSiblings(const fs::path& tagFile,
                                                     const fs::path& dir) const {
    std::vector<GraphNode> targets;
    const std::string stem = options_.tagFileStem(tagFile.filename().string());

    for (const auto& entry : listDirectory(dir)) {
        std::error_code ec;
        bool isDir = entry.is_directory(ec);
        const std::string name = entry.path().filename().string();

        // Don't associate a tag file with itself or another tag file.
        if (!isDir && options_.isTagFileName(name)) {
            continue;
        }

        if (name != stem && entry.path().stem().string() != stem) {
            continue;
        }

        fs::path canon = canonicalOrThrow(entry.path());
        bool canonIsDir = fs::is_directory(canon, ec);

        // A link resolving to a tag file is a tag file too.
        if (!canonIsDir && options_.isTagFileName(canon.filename().string())) {
            continue;
        }

        if (options_.verbose) {
            std::cout << "TagFileScanner: found target " << canon.string() << std::endl;
        }
        if (canonIsDir) {
            targets.emplace_back(DirectoryNode{canon});
        } else {
            targets.emplace_back(FileNode{canon});
        }
    }
    return targets;
}

void TagFileScanner::processTagFile(const fs::path& tagFile, NodeIndex tagRoot,
                                    NodeRegistry& registry) {
    if (options_.verbose) {
        std::cout << "TagFileScanner: visiting tag file " << tagFile.string() << std::endl;
    }
    stats_.tagFileCount++;

    // Siblings are looked up next to the resolved tag file; the stem still
    // comes from the name the tag file was found under.
    fs::path dirPath = canonicalOrThrow(tagFile).parent_path();
    NodeIndex dir = registry.getNode(DirectoryNode{dirPath});

    // Collect the attach targets.
    std::vector<NodeIndex> attachTargets;
    if (tagFile.filename().string() == options_.dirTagFileName) {
        attachTargets.push_back(dir);
    } else {
        for (auto& target : matchSiblings(tagFile, dirPath)) {
            attachTargets.push_back(registry.getNode(std::move(target)));
        }
        if (attachTargets.empty()) {
            std::cerr << "TagFileScanner: warning: tag file " << tagFile.string()
                      << " has no associated files" << std::endl;
            stats_.orphanTagFileCount++;
        }
    }

    // Attach the tags to the targets.
    for (auto& tag : readTagFile(tagFile)) {
        if (options_.verbose) {
            std::cout << "TagFileScanner: tag '" << tag << "'" << std::endl;
        }
        stats_.tagCount++;

        NodeIndex t = registry.getNode(TagNode{std::move(tag)});
        registry.updateEdge(tagRoot, t, REL_HAS_TAG);
        for (NodeIndex target : attachTargets) {
            registry.updateEdge(target, t, REL_HAS_TAG);
            registry.updateEdge(t, target, REL_TAG_ASSIGNED_TO);
            stats_.attachmentCount++;
        }
    }
}

std::vector<std::string> readTagFile(const fs::path& file) {
    std::string content;
    {
        errno = 0;
        std::ifstream ifs(file, std::ios::in | std::ios::binary);
        if (!ifs.is_open()) {
            std::error_code ec = errno != 0 ? std::error_code(errno, std::generic_category())
                                            : std::make_error_code(std::errc::io_error);
            throw TagGraphError::io("cannot open tag file", file, ec);
        }

        content.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        if (ifs.bad()) {
            throw TagGraphError::io("cannot read tag file", file,
                                    std::make_error_code(std::errc::io_error));
        }
    }

    if (!PlatformUtils::isValidUtf8(content)) {
        throw TagGraphError::io("tag file is not valid UTF-8", file,
                                std::make_error_code(std::errc::illegal_byte_sequence));
    }

    std::vector<std::string> tags;
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        // Only a \r\n pair ends a line; a lone \r at end of file is kept.
        bool terminated = !lines.eof();
        if (terminated && !line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        tags.push_back(std::move(line));
        line.clear();
    }
    return tags;
}

} // namespace taggraph
