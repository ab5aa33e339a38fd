#include <gtest/gtest.h>

#include "KnownNames.h"
#include "WordComparator.h"

// ─── Match methods ──────────────────────────────────────────────────────────

TEST(WordComparator, ExactAndEquivalentMatches) {
    WordComparator comparator;
    EXPECT_TRUE(comparator.wordsMatch("home", "home"));
    EXPECT_TRUE(comparator.wordsMatch("their", "there"));
    EXPECT_TRUE(comparator.wordsMatch("there", "their"));
    EXPECT_TRUE(comparator.wordsMatch("won", "1"));
}

TEST(WordComparator, OrdinaryWordsNeverFuzzyMatch) {
    WordComparator comparator;
    EXPECT_FALSE(comparator.wordsMatch("old", "young", "old"));
    EXPECT_FALSE(comparator.wordsMatch("love", "hate", "love"));
    EXPECT_FALSE(comparator.wordsMatch("dog", "cat", "dog"));
}

TEST(WordComparator, ShortWordsAllowOneEdit) {
    WordComparator comparator;
    EXPECT_TRUE(comparator.wordsMatch("cat", "bat"));
    EXPECT_TRUE(comparator.wordsMatch("going", "goin"));
}

TEST(WordComparator, LongWordsAllowTwoEdits) {
    WordComparator comparator;
    EXPECT_TRUE(comparator.wordsMatch("beautiful", "beutifl"));
    EXPECT_TRUE(comparator.wordsMatch("robinavitch", "robinovich"));
}

TEST(WordComparator, PhoneticFallback) {
    WordComparator comparator;
    EXPECT_TRUE(comparator.wordsMatch("scene", "seen"));
}

// "bobbinavich" is three edits from "robinavitch" with a different Soundex
// code, so only the name check can match it.
TEST(WordComparator, ProperNounFuzzyMatch) {
    WordComparator comparator;
    EXPECT_TRUE(comparator.wordsMatch("robinavitch", "bobbinavich", "Robinavitch", false));
    EXPECT_FALSE(comparator.wordsMatch("robinavitch", "bobbinavich", "robinavitch", false));
}

TEST(WordComparator, FirstWordIsNotAProperNoun) {
    WordComparator comparator;
    EXPECT_FALSE(comparator.wordsMatch("robinavitch", "bobbinavich", "Robinavitch", true));
    EXPECT_FALSE(WordComparator::isProperNoun("Hello", true));
    EXPECT_TRUE(WordComparator::isProperNoun("Hello", false));
    EXPECT_FALSE(WordComparator::isProperNoun("hello", false));
    EXPECT_FALSE(WordComparator::isProperNoun("", false));
}

TEST(WordComparator, KnownNamesEnableFuzzyMatch) {
    WordComparator comparator;
    auto names = KnownNames::fromCharacterNames({ "Dr. Frank Robinavitch" });
    EXPECT_TRUE(comparator.wordsMatch("robinavitch", "bobbinavich", "robinavitch", true, &names));
}

TEST(WordComparator, ThresholdComesFromSettings) {
    AlignmentSettings settings;
    settings.nameSimilarityThreshold = 0.9;
    WordComparator strictComparator(WordTables::getDefault(), settings);
    EXPECT_FALSE(strictComparator.wordsMatch("robinavitch", "bobbinavich", "Robinavitch", false));
}

// ─── Similarity primitives ──────────────────────────────────────────────────

TEST(WordComparator, JaroWinklerKnownValues) {
    EXPECT_DOUBLE_EQ(WordComparator::jaroWinklerSimilarity("martha", "martha"), 1.0);
    EXPECT_NEAR(WordComparator::jaroWinklerSimilarity("martha", "marhta"), 0.961, 0.001);
    EXPECT_NEAR(WordComparator::jaroSimilarity("martha", "marhta"), 0.944, 0.001);
    EXPECT_DOUBLE_EQ(WordComparator::jaroSimilarity("", "abc"), 0.0);
    EXPECT_DOUBLE_EQ(WordComparator::jaroSimilarity("abc", "xyz"), 0.0);
}

TEST(WordComparator, LevenshteinDistance) {
    EXPECT_EQ(WordComparator::levenshteinDistance("kitten", "sitting"), 3);
    EXPECT_EQ(WordComparator::levenshteinDistance("", "abc"), 3);
    EXPECT_EQ(WordComparator::levenshteinDistance("same", "same"), 0);
}

TEST(WordComparator, SoundexCodes) {
    EXPECT_EQ(WordComparator::soundexEncode("scene"), "S500");
    EXPECT_EQ(WordComparator::soundexEncode("seen"), "S500");
    EXPECT_EQ(WordComparator::soundexEncode("robert"), "R163");
    EXPECT_EQ(WordComparator::soundexEncode("a"), "A000");
    EXPECT_EQ(WordComparator::soundexEncode(""), "");
}
