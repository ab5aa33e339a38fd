/*
  ==============================================================================

    LiveLineTracker.cpp
    Created: 12 Dec 2024
    Author: Explicitly Audio Systems

  ==============================================================================
*/

#include "LiveLineTracker.h"
#include "TextNormalizer.h"

LiveLineTracker::LiveLineTracker(const WordTables& tables, const AlignmentSettings& settings)
    : aligner(tables, settings)
{
}

void LiveLineTracker::setLine(const std::string& expected, const KnownNames& names)
{
    expectedLine = expected;
    knownNames = names;
    committed.clear();
    pendingPartial.clear();
    state = LineAligner::createFreshLockedState();
    completeLogged = false;

    juce::Logger::writeToLog("[LiveLine] New line: \"" + juce::String(expectedLine) + "\" ("
        + juce::String((int)TextNormalizer::tokenizeExpected(expectedLine).size()) + " words)");
}

const LockedWordState& LiveLineTracker::onPartialTranscript(const std::string& text)
{
    pendingPartial = text;
    update(currentTranscript());
    return state;
}

const LockedWordState& LiveLineTracker::onCommittedTranscript(const std::string& text)
{
    if (isNonSpeechAnnotation(text))
    {
        juce::Logger::writeToLog("[LiveLine] Ignoring non-speech segment: \"" + juce::String(text) + "\"");
        return state;
    }

    committed = committed.empty() ? text : committed + " " + text;
    pendingPartial.clear();

    update(committed);
    return state;
}

bool LiveLineTracker::isComplete() const
{
    return aligner.isLineComplete(expectedLine, state);
}

LiveLineTracker::Outcome LiveLineTracker::finish(bool strictMode) const
{
    const std::string transcript = currentTranscript();
    const KnownNames* names = knownNames.isEmpty() ? nullptr : &knownNames;

    Outcome outcome;
    outcome.accuracy = aligner.checkAccuracy(expectedLine, transcript, strictMode, names);
    outcome.words = aligner.getWordByWordResults(expectedLine, transcript, names);

    juce::Logger::writeToLog("[LiveLine] Finished: " + juce::String(outcome.accuracy.accuracy) + "% "
        + (outcome.accuracy.isCorrect ? "PASS" : "FAIL"));

    return outcome;
}

bool LiveLineTracker::isNonSpeechAnnotation(const std::string& text)
{
    const juce::String trimmed = juce::String(text).trim();

    if (trimmed.isEmpty())
        return true;

    // One annotation only: "(laughs) I know (sighs)" still carries speech
    auto isSingleAnnotation = [&trimmed](juce::juce_wchar open, juce::juce_wchar close)
    {
        return trimmed.startsWithChar(open)
            && trimmed.endsWithChar(close)
            && !trimmed.substring(1, trimmed.length() - 1).containsChar(close);
    };

    if (isSingleAnnotation('(', ')') || isSingleAnnotation('[', ']'))
        return true;

    // Punctuation only
    return TextNormalizer::tokenizeSpoken(text).empty();
}

std::string LiveLineTracker::currentTranscript() const
{
    if (pendingPartial.empty())
        return committed;

    if (committed.empty())
        return pendingPartial;

    return committed + " " + pendingPartial;
}

void LiveLineTracker::update(const std::string& transcript)
{
    const LockedWordState previous = state;
    const KnownNames* names = knownNames.isEmpty() ? nullptr : &knownNames;

    state = aligner.getLockedWordMatch(expectedLine, transcript, &previous, names);

    if (state.lockedCount > previous.lockedCount)
    {
        juce::Logger::writeToLog("[LiveLine] Locked " + juce::String(state.lockedCount) + " words");
    }

    if (state.hasError && !previous.hasError)
    {
        juce::Logger::writeToLog("[LiveLine] Mismatch after \"" + juce::String(transcript) + "\""
            + (aligner.getSettings().freezeOnError ? ", progress frozen" : ""));
    }
    else if (!state.hasError && previous.hasError)
    {
        juce::Logger::writeToLog("[LiveLine] Error cleared");
    }

    if (!completeLogged && isComplete())
    {
        completeLogged = true;
        juce::Logger::writeToLog("[LiveLine] Line complete");
    }
}
