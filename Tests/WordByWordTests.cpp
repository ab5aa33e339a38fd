#include <gtest/gtest.h>

#include "LineAligner.h"

using V = WordVerdict;

TEST(WordByWord, AllCorrectForExactMatch) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("hello world", "hello world");
    EXPECT_EQ(r.results, std::vector<V>({ V::Correct, V::Correct }));
    EXPECT_EQ(r.spokenWords, std::vector<std::string>({ "hello", "world" }));
}

TEST(WordByWord, MarksWrongWords) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("I love you", "I hate you");
    EXPECT_EQ(r.results, std::vector<V>({ V::Correct, V::Wrong, V::Correct }));
    EXPECT_EQ(r.spokenWords[1], "hate");
}

TEST(WordByWord, MarksMissingWhenSpeakerStopsShort) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("I am going home", "I am");
    EXPECT_EQ(r.results, std::vector<V>({ V::Correct, V::Correct, V::Missing, V::Missing }));
    EXPECT_EQ(r.spokenWords[2], "");
}

TEST(WordByWord, EquivalentsStuttersAndSkippableWordsAreCorrect) {
    LineAligner aligner;
    EXPECT_EQ(aligner.getWordByWordResults("you're my friend", "your my friend").results,
              std::vector<V>({ V::Correct, V::Correct, V::Correct }));
    EXPECT_EQ(aligner.getWordByWordResults("I--I am here", "I am here").results,
              std::vector<V>({ V::Correct, V::Correct, V::Correct, V::Correct }));
    EXPECT_EQ(aligner.getWordByWordResults("sighs I know", "I know").results,
              std::vector<V>({ V::Correct, V::Correct, V::Correct }));
    EXPECT_EQ(aligner.getWordByWordResults("oh I see", "oh I see").results,
              std::vector<V>({ V::Correct, V::Correct, V::Correct }));
}

TEST(WordByWord, MultiWordExpansionBothWays) {
    LineAligner aligner;

    auto expanded = aligner.getWordByWordResults("alright lets go", "all right lets go");
    EXPECT_EQ(expanded.results, std::vector<V>({ V::Correct, V::Correct, V::Correct }));

    auto contracted = aligner.getWordByWordResults("all right lets go", "alright lets go");
    EXPECT_EQ(contracted.results, std::vector<V>({ V::Correct, V::Correct, V::Correct, V::Correct }));
    EXPECT_EQ(contracted.spokenWords[0], "alright");
    EXPECT_EQ(contracted.spokenWords[1], "");
}

TEST(WordByWord, CompoundWordFillsOneSlot) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("Pass me the corkscrew please", "pass me the cork screw please");
    EXPECT_EQ(r.results, std::vector<V>({ V::Correct, V::Correct, V::Correct, V::Correct, V::Correct }));
    EXPECT_EQ(r.spokenWords[3], "corkscrew");
    EXPECT_EQ(r.spokenWords[4], "please");
}

TEST(WordByWord, OneSpokenWordFillsTwoSlots) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("I will see you every day", "I will see you everyday");
    ASSERT_EQ(r.results.size(), 6u);
    EXPECT_EQ(r.results, std::vector<V>(6, V::Correct));
    EXPECT_EQ(r.spokenWords[4], "everyday");
    EXPECT_EQ(r.spokenWords[5], "");
}

TEST(WordByWord, FillersDoNotTakeASlot) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("I am here", "I am like here");
    EXPECT_EQ(r.results, std::vector<V>({ V::Correct, V::Correct, V::Correct }));
    EXPECT_EQ(r.spokenWords, std::vector<std::string>({ "i", "am", "here" }));
}

TEST(WordByWord, NothingSpoken) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("sighs hello", "");
    EXPECT_EQ(r.results, std::vector<V>({ V::Correct, V::Missing }));
}

TEST(WordByWord, OneVerdictPerExpectedWord) {
    LineAligner aligner;
    auto r = aligner.getWordByWordResults("the quick brown fox", "a slow red dog jumps");
    EXPECT_EQ(r.results.size(), 4u);
    EXPECT_EQ(r.spokenWords.size(), 4u);
}
