/*
  ==============================================================================

    LineAligner.h
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Aligns a script line with a transcript of the actor saying it.

    One greedy alignment walk backs three uses:
    - checkAccuracy:          end-of-turn verdict (Batch)
    - getLockedWordMatch:     live progress that never moves backwards (IncrementalLock)
    - getWordByWordResults:   per-word verdicts for display (Diff)

    The walk treats the script as ground truth. Script words an actor may
    drop (reactions, thinking sounds, stutter repeats) are skipped and left
    out of the score; filler words the actor adds are ignored.

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

class LineAligner
{
public:
    /**
        @param tables       Lexicons, must outlive the aligner
        @param settings     Thresholds (copied)
    */
    explicit LineAligner(const WordTables& tables = WordTables::getDefault(),
                         const AlignmentSettings& settings = AlignmentSettings());

    /**
        Check a finished utterance against the expected line.

        Any substituted word fails the line regardless of the accuracy score.
        Allowed missing/extra words and the minimum accuracy scale with line
        length; strict mode allows none and requires 100.

        @param expected     Script line
        @param spoken       Full transcript of the turn
        @param strictMode   Zero tolerance
        @param knownNames   Optional character names (may be nullptr)
        @return             Verdict with diagnostic word lists
    */
    AccuracyResult checkAccuracy(const std::string& expected,
                                 const std::string& spoken,
                                 bool strictMode = false,
                                 const KnownNames* knownNames = nullptr) const;

    /**
        Stateless sequential match from the start of the line. Stops at the
        first mismatch.
    */
    RealtimeMatch getRealtimeWordMatch(const std::string& expected,
                                       const std::string& spoken,
                                       const KnownNames* knownNames = nullptr) const;

    /**
        Extend locked progress with the words spoken beyond the locked prefix.

        Call on every transcript update for the line with the accumulated text.
        If the transcript has fewer words than are already locked (recognizer
        revision) the previous state is returned unchanged. The first mismatch
        sets hasError; with freezeOnError the state is then returned unchanged
        until the caller starts a new line, otherwise the words after the
        locked prefix are re-checked on the next call.

        @param expected     Script line
        @param spoken       Accumulated transcript so far
        @param previous     State from the previous call, or nullptr to start fresh
        @param knownNames   Optional character names (may be nullptr)
        @return             Updated state
    */
    LockedWordState getLockedWordMatch(const std::string& expected,
                                       const std::string& spoken,
                                       const LockedWordState* previous,
                                       const KnownNames* knownNames = nullptr) const;

    /**
        Empty state for a new line.
    */
    static LockedWordState createFreshLockedState() { return LockedWordState(); }

    /**
        True when everything left after the locked position may go unspoken.
    */
    bool isLineComplete(const std::string& expected, const LockedWordState& state) const;

    /**
        One verdict per expected word: Correct, Wrong or Missing.
    */
    WordByWordResult getWordByWordResults(const std::string& expected,
                                          const std::string& spoken,
                                          const KnownNames* knownNames = nullptr) const;

    const AlignmentSettings& getSettings() const { return settings; }

private:
    enum class Mode
    {
        Batch,
        IncrementalLock,
        Diff
    };

    struct Pass
    {
        int expectedIndex = 0;
        int spokenIndex = 0;
        int matchedCount = 0;
        int skippedCount = 0;
        bool hasError = false;

        std::vector<std::string> missingWords;
        std::vector<std::string> extraWords;
        std::vector<std::string> wrongWords;
        std::vector<std::string> lockedWords;
        WordByWordResult diff;
    };

    /**
        Walk expected and spoken tokens from the given positions.
    */
    Pass align(Mode mode,
               const std::vector<Token>& expected,
               const std::vector<Token>& spoken,
               int expectedStart,
               int spokenStart,
               const KnownNames* knownNames) const;

    /**
        Try a multi-word equivalent at the current position, either
        direction ("alright" vs "all right"). Outputs how many words
        were consumed on each side.
    */
    bool matchExpansion(const std::vector<Token>& expected, int e,
                        const std::vector<Token>& spoken, int s,
                        int& expectedConsumed, int& spokenConsumed) const;

    struct Tolerance
    {
        int allowedMissing;
        int allowedExtra;
        int minAccuracy;
    };

    static Tolerance toleranceFor(int effectiveWordCount, bool strictMode);

    AlignmentSettings settings;
    WordComparator comparator;
};
