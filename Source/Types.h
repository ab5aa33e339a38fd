/*
  ==============================================================================

    Types.h
    Created: 9 Dec 2024
    Author: Explicitly Audio Systems

    Shared result records passed between the aligners and their callers.
    All records are created per call; only LockedWordState is held by the
    caller across calls for one line.

  ==============================================================================
*/

#pragma once

#include <set>
#include <string>
#include <vector>

/**
    One comparable word of a line or transcript.
*/
struct Token
{
    std::string normalized;     // Lower-case, punctuation stripped
    std::string original;       // Original casing (proper-noun detection)
    bool isFirstPosition;       // First word of the line

    Token(const std::string& n, const std::string& o, bool first = false)
        : normalized(n), original(o), isFirstPosition(first) {}
};

/**
    End-of-turn verdict for a whole line.
*/
struct AccuracyResult
{
    bool isCorrect = false;
    int accuracy = 0;                       // 0-100
    std::vector<std::string> missingWords;
    std::vector<std::string> extraWords;
    std::vector<std::string> wrongWords;    // "hate" instead of "love"
};

/**
    Stateless single-pass progress.
*/
struct RealtimeMatch
{
    int matched = 0;
    bool hasError = false;
};

/**
    Caller-held monotonic progress for one line.

    lockedCount only ever grows for a fixed line and never exceeds the number
    of expected words. Once hasError is set the state is frozen (unless the
    aligner is configured to re-evaluate after errors).
*/
struct LockedWordState
{
    std::vector<std::string> lockedWords;   // Spoken words locked so far
    int lockedCount = 0;                    // Expected words matched
    bool hasError = false;
    int expectedCursor = 0;                 // Next expected index (skipped words included)

    bool operator== (const LockedWordState& other) const
    {
        return lockedWords == other.lockedWords
            && lockedCount == other.lockedCount
            && hasError == other.hasError
            && expectedCursor == other.expectedCursor;
    }

    bool operator!= (const LockedWordState& other) const { return !(*this == other); }
};

/**
    Gap-tolerant progress from the subsequence aligner.
*/
struct SubsequenceMatchResult
{
    std::set<int> matchedIndices;   // Indices into expected words (auto-matched skips included)
    int matchedCount = 0;           // Real matches only
    double coverage = 0.0;          // 0.0-1.0
};

enum class WordVerdict
{
    Correct,
    Wrong,
    Missing
};

/**
    One verdict per expected word slot, with the spoken word shown for it.
*/
struct WordByWordResult
{
    std::vector<WordVerdict> results;
    std::vector<std::string> spokenWords;   // Empty for Missing / second half of an expansion
};
