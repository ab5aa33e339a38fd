#include <gtest/gtest.h>

#include "SubsequenceAligner.h"

TEST(SubsequenceAligner, ToleratesWrongWordInTheMiddle) {
    SubsequenceAligner aligner;
    auto r = aligner.getSubsequenceWordMatch("one two three four five", "one WRONG three four five");
    EXPECT_EQ(r.matchedIndices, std::set<int>({ 0, 2, 3, 4 }));
    EXPECT_EQ(r.matchedCount, 4);
    EXPECT_DOUBLE_EQ(r.coverage, 0.8);
}

TEST(SubsequenceAligner, SkippableWordsAreAutoMatched) {
    SubsequenceAligner aligner;
    auto r = aligner.getSubsequenceWordMatch("sighs I--I know", "I know");
    EXPECT_EQ(r.matchedIndices, std::set<int>({ 0, 1, 2, 3 }));
    EXPECT_EQ(r.matchedCount, 2);
    EXPECT_DOUBLE_EQ(r.coverage, 1.0);
}

TEST(SubsequenceAligner, NothingSpoken) {
    SubsequenceAligner aligner;
    auto r = aligner.getSubsequenceWordMatch("sighs I know", "");
    EXPECT_EQ(r.matchedIndices, std::set<int>({ 0 }));
    EXPECT_EQ(r.matchedCount, 0);
    EXPECT_DOUBLE_EQ(r.coverage, 0.0);
}

TEST(SubsequenceAligner, OnlySkippableWordsInLine) {
    SubsequenceAligner aligner;
    auto r = aligner.getSubsequenceWordMatch("um sighs", "hello");
    EXPECT_EQ(r.matchedCount, 0);
    EXPECT_DOUBLE_EQ(r.coverage, 1.0);

    auto empty = aligner.getSubsequenceWordMatch("", "");
    EXPECT_DOUBLE_EQ(empty.coverage, 1.0);
}

TEST(SubsequenceAligner, FillersAreRemovedFirst) {
    SubsequenceAligner aligner;
    auto r = aligner.getSubsequenceWordMatch("I know", "um I uh know");
    EXPECT_EQ(r.matchedCount, 2);
    EXPECT_DOUBLE_EQ(r.coverage, 1.0);

    auto onlyFillers = aligner.getSubsequenceWordMatch("I know", "um uh");
    EXPECT_EQ(onlyFillers.matchedCount, 0);
    EXPECT_DOUBLE_EQ(onlyFillers.coverage, 0.0);
}

TEST(SubsequenceAligner, KeepsOrder) {
    SubsequenceAligner aligner;
    auto r = aligner.getSubsequenceWordMatch("one two three", "three two one");
    EXPECT_EQ(r.matchedCount, 1);
    EXPECT_NEAR(r.coverage, 1.0 / 3.0, 1e-9);
}

TEST(SubsequenceAligner, PartialProgress) {
    SubsequenceAligner aligner;
    auto r = aligner.getSubsequenceWordMatch("I am going home", "I am");
    EXPECT_EQ(r.matchedIndices, std::set<int>({ 0, 1 }));
    EXPECT_DOUBLE_EQ(r.coverage, 0.5);
}
