/*
  ==============================================================================

    WordComparator.h
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Decides whether an expected script word and a transcribed word count as
    the same word. Checks run in order, first success wins:

    1. Exact match
    2. Equivalence table (either direction)
    3. Jaro-Winkler similarity, for proper nouns and known names only
    4. Bounded Levenshtein distance (1 for short words, 2 for long ones)
    5. Soundex code

  ==============================================================================
*/

#pragma once

#include "AlignmentSettings.h"
#include "KnownNames.h"
#include "Types.h"
#include "WordTables.h"
#include <string>

class WordComparator
{
public:
    /**
        @param tables       Lexicons, must outlive the comparator
        @param settings     Name similarity threshold and prefix scale are used
    */
    explicit WordComparator(const WordTables& tables = WordTables::getDefault(),
                            const AlignmentSettings& settings = AlignmentSettings());

    /**
        Compare an expected word with a spoken word.

        @param expected             Normalized expected word
        @param spoken               Normalized spoken word
        @param expectedOriginal     Expected word with original casing
        @param isFirstPosition      Expected word starts the line
        @param knownNames           Optional character names (may be nullptr)
        @return                     true if the words count as the same word
    */
    bool wordsMatch(const std::string& expected,
                    const std::string& spoken,
                    const std::string& expectedOriginal = std::string(),
                    bool isFirstPosition = false,
                    const KnownNames* knownNames = nullptr) const;

    /**
        Compare an expected token with a spoken word.
    */
    bool tokenMatches(const Token& expected, const std::string& spoken,
                      const KnownNames* knownNames) const
    {
        return wordsMatch(expected.normalized, spoken, expected.original,
                          expected.isFirstPosition, knownNames);
    }

    const WordTables& getTables() const { return tables; }

    /**
        Capitalized and not the first word of the line.
    */
    static bool isProperNoun(const std::string& original, bool isFirstPosition);

    /**
        Jaro similarity (0.0 - 1.0).
    */
    static double jaroSimilarity(const std::string& s1, const std::string& s2);

    /**
        Jaro-Winkler similarity (0.0 - 1.0). Adds a bonus for a common
        prefix of up to 4 characters.
    */
    static double jaroWinklerSimilarity(const std::string& s1, const std::string& s2,
                                        double prefixScale = 0.1);

    /**
        Minimum single-character edits turning a into b.
    */
    static int levenshteinDistance(const std::string& a, const std::string& b);

    /**
        Four-character Soundex code ("scene" and "seen" both give S500).
    */
    static std::string soundexEncode(const std::string& word);

private:
    const WordTables& tables;
    double nameSimilarityThreshold;
    double prefixScale;
};
