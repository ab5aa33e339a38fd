/*
  ==============================================================================

    SubsequenceAligner.h
    Created: 12 Dec 2024
    Author: Explicitly Audio Systems

    Gap-tolerant live progress using longest common subsequence alignment.
    A wrong word in the middle of a line does not stop later correct words
    from being matched, at the cost of allowing jumps.

    The DP table is O(expected x spoken) in time and space. That is fine for
    a dialogue line; paragraph-scale text would need a banded table.

  ==============================================================================
*/

#pragma once

#include "AlignmentSettings.h"
#include "KnownNames.h"
#include "Types.h"
#include "WordComparator.h"
#include "WordTables.h"
#include <string>
#include <vector>

class SubsequenceAligner
{
public:
    explicit SubsequenceAligner(const WordTables& tables = WordTables::getDefault(),
                                const AlignmentSettings& settings = AlignmentSettings());

    /**
        Match the accumulated transcript against the line.

        Skippable words and stutter repeats are auto-matched (their indices
        are in matchedIndices but not in matchedCount). Filler words are
        removed from the transcript first.

        @param expected     Script line
        @param spoken       Accumulated transcript
        @param knownNames   Optional character names (may be nullptr)
        @return             Matched expected indices and coverage
    */
    SubsequenceMatchResult getSubsequenceWordMatch(const std::string& expected,
                                                   const std::string& spoken,
                                                   const KnownNames* knownNames = nullptr) const;

private:
    /**
        LCS length table, (rows + 1) x (cols + 1).
    */
    static std::vector<std::vector<int>> calculateLcsTable(const std::vector<std::vector<bool>>& matches);

    WordComparator comparator;
};
