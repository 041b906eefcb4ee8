#include <gtest/gtest.h>
#include "core/NodeRegistry.h"
#include "query/GraphExport.h"

using namespace taggraph;

TEST(GraphExportTest, NodesAndEdgesAreSerialized) {
    NodeRegistry registry;
    registry.updateEdge(RootTagNode{}, TagNode{"red"}, REL_HAS_TAG);
    registry.updateEdge(DirectoryNode{"/d"}, TagNode{"red"}, REL_HAS_TAG);
    registry.updateEdge(TagNode{"red"}, DirectoryNode{"/d"}, REL_TAG_ASSIGNED_TO);

    nlohmann::json j = graphToJson(registry.graph());
    ASSERT_TRUE(j["nodes"].is_array());
    ASSERT_TRUE(j["edges"].is_array());
    EXPECT_EQ(j["nodes"].size(), 3u);
    EXPECT_EQ(j["edges"].size(), 3u);

    EXPECT_EQ(j["nodes"][0]["type"], "RootTag");
    EXPECT_FALSE(j["nodes"][0].contains("path"));
    EXPECT_EQ(j["nodes"][1]["type"], "Tag");
    EXPECT_EQ(j["nodes"][1]["name"], "red");
    EXPECT_EQ(j["nodes"][2]["type"], "Directory");
    EXPECT_EQ(j["nodes"][2]["path"], "/d");

    EXPECT_EQ(j["edges"][2]["source"], 1);
    EXPECT_EQ(j["edges"][2]["target"], 2);
    EXPECT_EQ(j["edges"][2]["relation"], "TagAssignedTo");
}

TEST(GraphExportTest, EdgeSignatureIgnoresHandleOrder) {
    NodeRegistry a;
    a.updateEdge(DirectoryNode{"/d"}, FileNode{"/d/f"}, REL_CHILD);
    a.updateEdge(TagNode{"t"}, FileNode{"/d/f"}, REL_TAG_ASSIGNED_TO);

    NodeRegistry b;
    b.getNode(GraphNode(TagNode{"t"}));
    b.updateEdge(TagNode{"t"}, FileNode{"/d/f"}, REL_TAG_ASSIGNED_TO);
    b.updateEdge(DirectoryNode{"/d"}, FileNode{"/d/f"}, REL_CHILD);

    EXPECT_EQ(edgeSignature(a.graph()), edgeSignature(b.graph()));

    b.updateEdge(DirectoryNode{"/d"}, FileNode{"/d/f"}, REL_HAS_TAG);
    EXPECT_NE(edgeSignature(a.graph()), edgeSignature(b.graph()));
}

TEST(GraphExportTest, NonUtf8PathIsReplacedInDump) {
    NodeRegistry registry;
    registry.updateEdge(DirectoryNode{"/d"}, FileNode{std::string("/d/\xFF.bin")}, REL_CHILD);

    std::string text;
    ASSERT_NO_THROW(text = dumpGraph(registry.graph()));
    EXPECT_NE(text.find("/d/\xEF\xBF\xBD.bin"), std::string::npos);

    nlohmann::json j = nlohmann::json::parse(text);
    ASSERT_EQ(j["edges"].size(), 1u);
    Relation r = REL_PARENT;
    ASSERT_TRUE(relationFromName(j["edges"][0]["relation"].get<std::string>(), r));
    EXPECT_EQ(r, REL_CHILD);
}
