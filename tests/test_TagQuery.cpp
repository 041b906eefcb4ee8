#include <gtest/gtest.h>
#include "core/GraphBuilder.h"
#include "query/TagQuery.h"
#include "TestHelpers.h"

using namespace taggraph;
namespace fs = std::filesystem;

namespace {

class TagQueryTest : public test::TempTreeTest {
protected:
    void SetUp() override {
        TempTreeTest::SetUp();
        writeFile("photos/dir.tags", "media\n");
        writeFile("photos/beach.jpg", "");
        writeFile("photos/beach.tags", "holiday\nsummer\n");
        writeFile("photos/2023/dir.tags", "archive\n");
        writeFile("photos/2023/old.jpg", "");
        writeFile("docs/cv.pdf", "");
        registry_ = buildTagGraph(root_.string());
    }

    NodeRegistry registry_;
};

} // namespace

TEST_F(TagQueryTest, DirectTags) {
    TagQuery q(registry_);
    std::vector<std::string> expected{"holiday", "summer"};
    EXPECT_EQ(q.tagsOf(root_ / "photos" / "beach.jpg", false), expected);
    EXPECT_TRUE(q.tagsOf(root_ / "docs" / "cv.pdf", false).empty());
}

TEST_F(TagQueryTest, InheritedTagsFollowParentsOnly) {
    TagQuery q(registry_);
    std::vector<std::string> expected{"archive", "media"};
    EXPECT_EQ(q.tagsOf(root_ / "photos" / "2023" / "old.jpg", true), expected);

    // Sibling tags are not pulled in through TagAssignedTo or Child edges.
    std::vector<std::string> beach{"holiday", "media", "summer"};
    EXPECT_EQ(q.tagsOf(root_ / "photos" / "beach.jpg", true), beach);
}

TEST_F(TagQueryTest, UnknownPathHasNoTags) {
    TagQuery q(registry_);
    EXPECT_EQ(q.findPath(root_ / "nowhere"), INVALID_NODE);
    EXPECT_TRUE(q.tagsOf(root_ / "nowhere", true).empty());
    // Tag files exist on disk but are not graph nodes.
    EXPECT_EQ(q.findPath(root_ / "photos" / "beach.tags"), INVALID_NODE);
}

TEST_F(TagQueryTest, PathsTagged) {
    TagQuery q(registry_);
    std::vector<fs::path> direct{root_ / "photos"};
    EXPECT_EQ(q.pathsTagged("media", false), direct);

    auto all = q.pathsTagged("media", true);
    std::vector<fs::path> expected{
        root_ / "photos",
        root_ / "photos" / "2023",
        root_ / "photos" / "2023" / "old.jpg",
        root_ / "photos" / "beach.jpg",
    };
    EXPECT_EQ(all, expected);

    EXPECT_TRUE(q.pathsTagged("missing", true).empty());
}

TEST_F(TagQueryTest, AllAndMatchingTags) {
    TagQuery q(registry_);
    std::vector<std::string> all{"archive", "holiday", "media", "summer"};
    EXPECT_EQ(q.allTags(), all);

    std::vector<std::string> s{"summer"};
    EXPECT_EQ(q.matchTags("s*"), s);
    EXPECT_EQ(q.matchTags("*"), all);
    EXPECT_TRUE(q.matchTags("x?").empty());
}
