/*
  ==============================================================================

    LineAligner.cpp
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Implementation of the greedy line alignment walk and its three callers.

  ==============================================================================
*/

#include "LineAligner.h"
#include "TextNormalizer.h"
#include <algorithm>
#include <cmath>

LineAligner::LineAligner(const WordTables& tables, const AlignmentSettings& s)
    : settings(s),
      comparator(tables, s)
{
}

LineAligner::Tolerance LineAligner::toleranceFor(int effectiveWordCount, bool strictMode)
{
    if (strictMode)
        return { 0, 0, 100 };

    if (effectiveWordCount > 20)
        return { 3, 3, 85 };

    if (effectiveWordCount > 10)
        return { 2, 2, 90 };

    return { 1, 1, 90 };
}

bool LineAligner::matchExpansion(const std::vector<Token>& expected, int e,
                                 const std::vector<Token>& spoken, int s,
                                 int& expectedConsumed, int& spokenConsumed) const
{
    const WordTables& tables = comparator.getTables();

    // Expected "alright", spoken "all right"
    for (const auto& phrase : tables.multiWordEquivalents(expected[e].normalized))
    {
        const int length = (int)TextNormalizer::splitIntoWords(phrase).size();

        if (s + length <= (int)spoken.size()
            && TextNormalizer::joinWords(spoken, s, length) == TextNormalizer::normalizeText(phrase))
        {
            expectedConsumed = 1;
            spokenConsumed = length;
            return true;
        }
    }

    // Expected "all right", spoken "alright"
    for (const auto& phrase : tables.multiWordEquivalents(spoken[s].normalized))
    {
        const int length = (int)TextNormalizer::splitIntoWords(phrase).size();

        if (e + length <= (int)expected.size()
            && TextNormalizer::joinWords(expected, e, length) == TextNormalizer::normalizeText(phrase))
        {
            expectedConsumed = length;
            spokenConsumed = 1;
            return true;
        }
    }

    return false;
}

LineAligner::Pass LineAligner::align(Mode mode,
                                     const std::vector<Token>& expected,
                                     const std::vector<Token>& spoken,
                                     int expectedStart,
                                     int spokenStart,
                                     const KnownNames* knownNames) const
{
    const WordTables& tables = comparator.getTables();
    const int expectedSize = (int)expected.size();
    const int spokenSize = (int)spoken.size();

    Pass pass;
    int e = std::max(0, expectedStart);
    int s = std::max(0, spokenStart);

    auto emit = [&pass, mode](WordVerdict verdict, const std::string& word)
    {
        if (mode == Mode::Diff)
        {
            pass.diff.results.push_back(verdict);
            pass.diff.spokenWords.push_back(word);
        }
    };

    while (e < expectedSize && s < spokenSize)
    {
        const Token& exp = expected[e];
        const std::string& spk = spoken[s].normalized;
        const bool direct = comparator.tokenMatches(exp, spk, knownNames);

        // Script word the actor may drop: not counted in the score
        if (!direct && tables.canSkipExpected(expected, e))
        {
            ++pass.skippedCount;
            emit(WordVerdict::Correct, exp.normalized);
            ++e;
            continue;
        }

        if (direct)
        {
            ++pass.matchedCount;
            if (mode == Mode::IncrementalLock)
                pass.lockedWords.push_back(spk);
            emit(WordVerdict::Correct, spk);
            ++e;
            ++s;
            continue;
        }

        // Live progress stops at the first mismatch
        if (mode == Mode::IncrementalLock)
        {
            pass.hasError = true;
            break;
        }

        // Compound word: spoken "cork screw" -> expected "corkscrew"
        if (s + 1 < spokenSize)
        {
            const std::string joined = spk + spoken[s + 1].normalized;

            if (comparator.tokenMatches(exp, joined, knownNames))
            {
                ++pass.matchedCount;
                emit(WordVerdict::Correct, joined);
                ++e;
                s += 2;
                continue;
            }
        }

        // Split word: two expected words said as one
        if (e + 1 < expectedSize)
        {
            const std::string joinedExpected = exp.normalized + expected[e + 1].normalized;

            if (comparator.wordsMatch(joinedExpected, spk, exp.original, exp.isFirstPosition, knownNames))
            {
                pass.matchedCount += 2;
                emit(WordVerdict::Correct, spk);
                emit(WordVerdict::Correct, std::string());
                e += 2;
                ++s;
                continue;
            }
        }

        // Multi-word equivalents, either direction
        int expectedConsumed = 0;
        int spokenConsumed = 0;

        if (matchExpansion(expected, e, spoken, s, expectedConsumed, spokenConsumed))
        {
            pass.matchedCount += expectedConsumed;
            emit(WordVerdict::Correct, TextNormalizer::joinWords(spoken, s, spokenConsumed));
            for (int i = 1; i < expectedConsumed; ++i)
                emit(WordVerdict::Correct, std::string());
            e += expectedConsumed;
            s += spokenConsumed;
            continue;
        }

        // Filler the actor added mid-line, before look-ahead so it can't shift the alignment
        if (tables.isFiller(spk))
        {
            ++s;
            continue;
        }

        if (mode == Mode::Diff)
        {
            emit(WordVerdict::Wrong, spk);
            ++e;
            ++s;
            continue;
        }

        // Look ahead to classify: substitution, missing or extra word.
        // Spoken word found further on in the script: the script word was dropped.
        // Script word found further on in the transcript: the spoken word was added.
        int foundExpectedAhead = -1;
        int foundSpokenAhead = -1;

        for (int i = 1; i <= settings.lookAheadWindow && e + i < expectedSize; ++i)
        {
            const Token& ahead = expected[e + i];

            if (comparator.wordsMatch(ahead.normalized, spk, ahead.original, false, knownNames))
            {
                foundExpectedAhead = i;
                break;
            }
        }

        for (int i = 1; i <= settings.lookAheadWindow && s + i < spokenSize; ++i)
        {
            if (comparator.tokenMatches(exp, spoken[s + i].normalized, knownNames))
            {
                foundSpokenAhead = i;
                break;
            }
        }

        if (foundExpectedAhead == -1 && foundSpokenAhead == -1)
        {
            pass.wrongWords.push_back("\"" + spk + "\" instead of \"" + exp.normalized + "\"");
            ++e;
            ++s;
        }
        else if (foundExpectedAhead != -1
                 && (foundSpokenAhead == -1 || foundExpectedAhead <= foundSpokenAhead))
        {
            pass.missingWords.push_back(exp.normalized);
            ++e;
        }
        else
        {
            pass.extraWords.push_back(spk);
            ++s;
        }
    }

    pass.expectedIndex = e;
    pass.spokenIndex = s;

    if (mode == Mode::IncrementalLock)
        return pass;

    // Script words never reached
    for (; e < expectedSize; ++e)
    {
        const std::string& word = expected[e].normalized;

        // A stutter repeat only counts as said once something was said
        const bool skip = tables.canSkipExpected(expected, e)
            && (mode == Mode::Batch || tables.isSkippable(word) || s > 0);

        if (skip)
        {
            ++pass.skippedCount;
            emit(WordVerdict::Correct, word);
        }
        else
        {
            pass.missingWords.push_back(word);
            emit(WordVerdict::Missing, std::string());
        }
    }

    // Words said after the line ended
    for (; s < spokenSize; ++s)
    {
        if (!tables.isFiller(spoken[s].normalized))
            pass.extraWords.push_back(spoken[s].normalized);
    }

    return pass;
}

AccuracyResult LineAligner::checkAccuracy(const std::string& expected,
                                          const std::string& spoken,
                                          bool strictMode,
                                          const KnownNames* knownNames) const
{
    const std::vector<Token> expectedTokens = TextNormalizer::tokenizeExpected(expected);
    const std::vector<Token> spokenTokens = TextNormalizer::tokenizeSpoken(spoken);
    const int expectedSize = (int)expectedTokens.size();

    AccuracyResult result;

    // Quick exact match
    if (TextNormalizer::joinWords(expectedTokens, 0, expectedSize)
        == TextNormalizer::joinWords(spokenTokens, 0, (int)spokenTokens.size()))
    {
        result.isCorrect = true;
        result.accuracy = 100;
        return result;
    }

    Pass pass = align(Mode::Batch, expectedTokens, spokenTokens, 0, 0, knownNames);

    const int effectiveWordCount = expectedSize - pass.skippedCount;
    result.accuracy = effectiveWordCount > 0
        ? (int)std::floor((double)pass.matchedCount / effectiveWordCount * 100.0 + 0.5)
        : 100;

    result.missingWords = std::move(pass.missingWords);
    result.extraWords = std::move(pass.extraWords);
    result.wrongWords = std::move(pass.wrongWords);

    // A substituted word always fails the line
    const Tolerance tolerance = toleranceFor(effectiveWordCount, strictMode);
    result.isCorrect = result.wrongWords.empty()
        && result.accuracy >= tolerance.minAccuracy
        && (int)result.missingWords.size() <= tolerance.allowedMissing
        && (int)result.extraWords.size() <= tolerance.allowedExtra;

    return result;
}

RealtimeMatch LineAligner::getRealtimeWordMatch(const std::string& expected,
                                                const std::string& spoken,
                                                const KnownNames* knownNames) const
{
    Pass pass = align(Mode::IncrementalLock,
                      TextNormalizer::tokenizeExpected(expected),
                      TextNormalizer::tokenizeSpoken(spoken),
                      0, 0, knownNames);

    RealtimeMatch match;
    match.matched = pass.matchedCount;
    match.hasError = pass.hasError;
    return match;
}

LockedWordState LineAligner::getLockedWordMatch(const std::string& expected,
                                                const std::string& spoken,
                                                const LockedWordState* previous,
                                                const KnownNames* knownNames) const
{
    LockedWordState state = previous != nullptr ? *previous : createFreshLockedState();

    if (state.hasError && settings.freezeOnError)
        return state;

    const std::vector<Token> expectedTokens = TextNormalizer::tokenizeExpected(expected);
    const std::vector<Token> spokenTokens = TextNormalizer::tokenizeSpoken(spoken);

    // Recognizer dropped words we already locked: keep what we have
    const int lockedSpoken = (int)state.lockedWords.size();
    if ((int)spokenTokens.size() < lockedSpoken)
        return state;

    // Only words beyond the locked prefix are new
    Pass pass = align(Mode::IncrementalLock, expectedTokens, spokenTokens,
                      state.expectedCursor, lockedSpoken, knownNames);

    state.lockedWords.insert(state.lockedWords.end(), pass.lockedWords.begin(), pass.lockedWords.end());
    state.lockedCount += pass.matchedCount;
    state.expectedCursor = pass.expectedIndex;
    state.hasError = pass.hasError;

    return state;
}

bool LineAligner::isLineComplete(const std::string& expected, const LockedWordState& state) const
{
    if (state.hasError)
        return false;

    const std::vector<Token> expectedTokens = TextNormalizer::tokenizeExpected(expected);

    for (int e = state.expectedCursor; e < (int)expectedTokens.size(); ++e)
    {
        if (!comparator.getTables().canSkipExpected(expectedTokens, e))
            return false;
    }

    return true;
}

WordByWordResult LineAligner::getWordByWordResults(const std::string& expected,
                                                   const std::string& spoken,
                                                   const KnownNames* knownNames) const
{
    Pass pass = align(Mode::Diff,
                      TextNormalizer::tokenizeExpected(expected),
                      TextNormalizer::tokenizeSpoken(spoken),
                      0, 0, knownNames);

    return pass.diff;
}
