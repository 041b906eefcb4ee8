#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace taggraph {

// ============================================================================
// Handles
// ============================================================================

using NodeIndex = uint32_t;
using EdgeIndex = uint32_t;

inline constexpr NodeIndex INVALID_NODE = std::numeric_limits<NodeIndex>::max();
inline constexpr EdgeIndex INVALID_EDGE = std::numeric_limits<EdgeIndex>::max();

// ============================================================================
// Enumerations
// ============================================================================

// Order must match the alternatives of GraphNode (see GraphNode.h).
enum NodeType {
    NODE_FILE = 0,
    NODE_DIRECTORY,
    NODE_ROOT_DIRECTORY,
    NODE_ROOT_TAG,
    NODE_TAG,
    NUM_NODE_TYPES
};

enum Relation {
    REL_PARENT = 0,         // A's containing directory is B
    REL_CHILD,              // directory A contains B
    REL_HAS_TAG,            // A (RootTag, file or directory) has tag B
    REL_TAG_ASSIGNED_TO,    // tag A has been assigned to B
    NUM_RELATIONS
};

// ============================================================================
// Tag file conventions
// ============================================================================

inline constexpr const char* DEFAULT_TAG_FILE_EXTENSION = ".tags";
inline constexpr const char* DEFAULT_DIR_TAG_FILE_NAME  = "dir.tags";

// ============================================================================
// Name arrays
// ============================================================================

inline const char* const nodeTypeNames[] = {
    "File",             // NODE_FILE
    "Directory",        // NODE_DIRECTORY
    "RootDirectory",    // NODE_ROOT_DIRECTORY
    "RootTag",          // NODE_ROOT_TAG
    "Tag"               // NODE_TAG
};

inline const char* const relationNames[] = {
    "Parent",           // REL_PARENT
    "Child",            // REL_CHILD
    "HasTag",           // REL_HAS_TAG
    "TagAssignedTo"     // REL_TAG_ASSIGNED_TO
};

// Reverse lookup of relationNames. Returns false if name is unknown.
inline bool relationFromName(const std::string& name, Relation& out) {
    for (int i = 0; i < NUM_RELATIONS; ++i) {
        if (name == relationNames[i]) {
            out = static_cast<Relation>(i);
            return true;
        }
    }
    return false;
}

} // namespace taggraph
