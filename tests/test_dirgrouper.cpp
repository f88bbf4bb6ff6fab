/**
 * @file test_dirgrouper.cpp
 * @brief Unit tests for the DirGrouper class
 *
 * Verifies first-seen group order, stable member order and the fallback for
 * nodes without a signature.
 *
 * @see DirGrouper
 */

#include <gtest/gtest.h>
#include "dirgrouper.hpp"

/**
 * @class DirGrouperTest
 * @brief Fixture with a sibling list that is cleared before each test
 */
class DirGrouperTest : public ::testing::Test {
protected:
    std::vector<DirectoryNode> siblings;

    void SetUp() override {
        siblings.clear();
    }

    void addDir(const std::string &name, const std::string &signature,
                std::size_t depth = 1) {
        DirectoryNode node;
        node.name = name;
        node.depth = depth;
        node.signature = signature;
        siblings.push_back(node);
    }
};

TEST_F(DirGrouperTest, EmptyInputGivesNoGroups) {
    EXPECT_TRUE(DirGrouper::groupIdentical(siblings).empty());
}

TEST_F(DirGrouperTest, PreservesFirstSeenOrder) {
    addDir("A", "s1");
    addDir("B", "s2");
    addDir("C", "s1");
    addDir("D", "s1");

    auto groups = DirGrouper::groupIdentical(siblings);

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].signature, "s1");
    ASSERT_EQ(groups[0].members.size(), 3u);
    EXPECT_EQ(groups[0].members[0]->name, "A");
    EXPECT_EQ(groups[0].members[1]->name, "C");
    EXPECT_EQ(groups[0].members[2]->name, "D");

    EXPECT_EQ(groups[1].signature, "s2");
    ASSERT_EQ(groups[1].members.size(), 1u);
    EXPECT_EQ(groups[1].members[0]->name, "B");
}

TEST_F(DirGrouperTest, GroupOrderIgnoresSignatureValue) {
    addDir("first", "zzz");
    addDir("second", "aaa");

    auto groups = DirGrouper::groupIdentical(siblings);

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].members[0]->name, "first");
    EXPECT_EQ(groups[1].members[0]->name, "second");
}

TEST_F(DirGrouperTest, MembersPointIntoSiblings) {
    addDir("A", "s1");
    addDir("B", "s1");

    auto groups = DirGrouper::groupIdentical(siblings);

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].members[0], &siblings[0]);
    EXPECT_EQ(groups[0].members[1], &siblings[1]);
}

TEST_F(DirGrouperTest, EmptySignatureFallsBackToNameAndDepth) {
    addDir("x", "");
    addDir("y", "");
    addDir("z", "s1");

    auto groups = DirGrouper::groupIdentical(siblings);

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].signature, "name:x:level:1");
    EXPECT_EQ(groups[1].signature, "name:y:level:1");
}
