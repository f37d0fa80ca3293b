#include <gtest/gtest.h>
#include "dosrestore/NameFilter.hpp"
#include <vector>

using namespace dosrestore;

TEST(WildcardMatch, Literals) {
    EXPECT_TRUE(wildcardMatch("A.TXT", "A.TXT"));
    EXPECT_TRUE(wildcardMatch("a.txt", "A.TXT"));
    EXPECT_FALSE(wildcardMatch("A.TXT", "A.TX"));
    EXPECT_FALSE(wildcardMatch("A.TX", "A.TXT"));
}

TEST(WildcardMatch, Star) {
    EXPECT_TRUE(wildcardMatch("*", "ANYTHING.DAT"));
    EXPECT_TRUE(wildcardMatch("*", ""));
    EXPECT_TRUE(wildcardMatch("*.COM", "COMMAND.COM"));
    EXPECT_FALSE(wildcardMatch("*.COM", "COMMAND.EXE"));
    EXPECT_TRUE(wildcardMatch("C*D.*", "COMMAND.COM"));
    EXPECT_TRUE(wildcardMatch("*A*A*", "BANANA"));
    EXPECT_FALSE(wildcardMatch("*A*A*A*A", "BANANA"));
}

TEST(WildcardMatch, QuestionMark) {
    EXPECT_TRUE(wildcardMatch("FILE?.TXT", "FILE1.TXT"));
    EXPECT_FALSE(wildcardMatch("FILE?.TXT", "FILE.TXT"));
    EXPECT_FALSE(wildcardMatch("FILE?.TXT", "FILE12.TXT"));
    EXPECT_TRUE(wildcardMatch("??", "AB"));
}

TEST(FilterActions, MatchesLastComponentOnly) {
    std::vector<PlannedAction> actions(4);
    actions[0].destination = "A.TXT";
    actions[1].destination = "DOS/X.COM";
    actions[2].destination = "COM/README";
    actions[3].destination = "DOS/Y.COM";

    auto kept = filterActions(actions, "*.COM");
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].destination, "DOS/X.COM");
    EXPECT_EQ(kept[1].destination, "DOS/Y.COM");

    EXPECT_TRUE(filterActions(actions, "DOS*").empty());
}

// All chunks of a selected file are kept
TEST(FilterActions, KeepsEveryFragment) {
    std::vector<PlannedAction> actions(3);
    actions[0].destination = "BIG.DAT";
    actions[0].fragment_sequence = 1;
    actions[1].destination = "OTHER.DAT";
    actions[2].destination = "BIG.DAT";
    actions[2].fragment_sequence = 2;

    auto kept = filterActions(actions, "BIG.*");
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[1].fragment_sequence, 2);
}
