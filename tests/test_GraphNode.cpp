#include <gtest/gtest.h>
#include "core/GraphNode.h"

#include <unordered_set>

using namespace taggraph;

TEST(GraphNodeTest, ValueEquality) {
    GraphNode a = FileNode{"/data/img.png"};
    GraphNode b = FileNode{"/data/img.png"};
    GraphNode c = FileNode{"/data/image.png"};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);

    EXPECT_EQ(GraphNode(TagNode{"red"}), GraphNode(TagNode{"red"}));
    EXPECT_NE(GraphNode(TagNode{"red"}), GraphNode(TagNode{"Red"}));
    EXPECT_EQ(GraphNode(RootTagNode{}), GraphNode(RootTagNode{}));
}

TEST(GraphNodeTest, SamePathDifferentKindIsDifferentNode) {
    GraphNode file = FileNode{"/data/img"};
    GraphNode dir = DirectoryNode{"/data/img"};
    EXPECT_NE(file, dir);
    EXPECT_NE(GraphNode(RootTagNode{}), GraphNode(RootDirectoryNode{}));
}

TEST(GraphNodeTest, HashSupportsSetMembership) {
    std::unordered_set<GraphNode, GraphNodeHash> set;
    set.insert(FileNode{"/a"});
    set.insert(FileNode{"/a"});
    set.insert(DirectoryNode{"/a"});
    set.insert(TagNode{""});
    set.insert(RootTagNode{});
    set.insert(RootDirectoryNode{});
    set.insert(RootTagNode{});
    EXPECT_EQ(set.size(), 5u);
}

TEST(GraphNodeTest, TypeAndPath) {
    GraphNode file = FileNode{"/a/b.txt"};
    EXPECT_EQ(nodeType(file), NODE_FILE);
    ASSERT_NE(nodePath(file), nullptr);
    EXPECT_EQ(*nodePath(file), std::filesystem::path("/a/b.txt"));

    EXPECT_EQ(nodeType(GraphNode(DirectoryNode{"/a"})), NODE_DIRECTORY);
    EXPECT_EQ(nodeType(GraphNode(RootDirectoryNode{})), NODE_ROOT_DIRECTORY);
    EXPECT_EQ(nodeType(GraphNode(RootTagNode{})), NODE_ROOT_TAG);
    EXPECT_EQ(nodeType(GraphNode(TagNode{"x"})), NODE_TAG);
    EXPECT_EQ(nodePath(GraphNode(TagNode{"x"})), nullptr);
    EXPECT_EQ(nodePath(GraphNode(RootTagNode{})), nullptr);
}

TEST(GraphNodeTest, ToString) {
    EXPECT_EQ(nodeToString(FileNode{"/a/b.txt"}), "File(/a/b.txt)");
    EXPECT_EQ(nodeToString(DirectoryNode{"/a"}), "Directory(/a)");
    EXPECT_EQ(nodeToString(TagNode{"red"}), "Tag(red)");
    EXPECT_EQ(nodeToString(RootTagNode{}), "RootTag");
    EXPECT_EQ(nodeToString(RootDirectoryNode{}), "RootDirectory");
}

TEST(GraphNodeTest, RelationNames) {
    Relation r = REL_PARENT;
    EXPECT_TRUE(relationFromName("TagAssignedTo", r));
    EXPECT_EQ(r, REL_TAG_ASSIGNED_TO);
    EXPECT_STREQ(relationNames[REL_HAS_TAG], "HasTag");
    EXPECT_FALSE(relationFromName("Sibling", r));
}
