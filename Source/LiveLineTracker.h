/*
  ==============================================================================

    LiveLineTracker.h
    Created: 12 Dec 2024
    Author: Explicitly Audio Systems

    Tracks one line-practice turn fed by a streaming speech recognizer.

    Recognizers send two kinds of events: partial transcripts (interim
    hypotheses that may be revised) and committed transcripts (final
    segments). The tracker keeps the committed text, aligns
    committed + partial with the locked aligner on every event, and gives
    the end-of-turn verdict when the host stops listening.

    Not thread safe: call from one thread per line.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "AlignmentSettings.h"
#include "KnownNames.h"
#include "LineAligner.h"
#include "Types.h"
#include "WordTables.h"
#include <string>

class LiveLineTracker
{
public:
    /**
        End-of-turn verdict plus per-word verdicts for display.
    */
    struct Outcome
    {
        AccuracyResult accuracy;
        WordByWordResult words;
    };

    explicit LiveLineTracker(const WordTables& tables = WordTables::getDefault(),
                             const AlignmentSettings& settings = AlignmentSettings());
    ~LiveLineTracker() = default;

    /**
        Start a new line. Clears the transcript and the locked progress.

        @param expected     Script line
        @param names        Character names eligible for fuzzy matching
    */
    void setLine(const std::string& expected, const KnownNames& names = KnownNames());

    /**
        Interim hypothesis for the words after the committed transcript.
        Replaces the previous partial.
    */
    const LockedWordState& onPartialTranscript(const std::string& text);

    /**
        Final segment. Non-speech annotations ("(music)", "[noise]") and
        empty segments are ignored.
    */
    const LockedWordState& onCommittedTranscript(const std::string& text);

    const LockedWordState& getState() const { return state; }
    const std::string& getCommittedTranscript() const { return committed; }
    const std::string& getExpectedLine() const { return expectedLine; }

    /**
        True when nothing but skippable words is left to say.
    */
    bool isComplete() const;

    /**
        Verdict for everything heard so far, the pending partial included.
    */
    Outcome finish(bool strictMode) const;

    /**
        Empty text, or a single parenthesized/bracketed recognizer annotation.
    */
    static bool isNonSpeechAnnotation(const std::string& text);

private:
    void update(const std::string& transcript);
    std::string currentTranscript() const;

    LineAligner aligner;
    KnownNames knownNames;

    std::string expectedLine;
    std::string committed;
    std::string pendingPartial;
    LockedWordState state;
    bool completeLogged = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LiveLineTracker)
};
