/*
  ==============================================================================

    WordTables.h
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Lexicons used by the word comparator and the aligners:
    - Equivalents: words a recognizer may transcribe either way
      (abbreviations, homophones, numerals, filler-sound spellings),
      including multi-word phrases ("alright" <-> "all right")
    - Skippable words: script words an actor may leave unspoken
      (thinking sounds, reactions, beat markers)
    - Filler words: spoken noise ignored when not in the script

    The built-in tables are constructed once and shared read-only.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "Types.h"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class WordTables
{
public:
    WordTables() = default;

    /**
        Built-in tables, constructed on first use.
    */
    static const WordTables& getDefault();

    /**
        Merge overrides from a JSON lexicon file.

        File format:
            {
                "equivalents": { "gonna": ["going to"], "colour": ["color"] },
                "skippable":   ["tuts"],
                "filler":      ["basically"]
            }

        Equivalents are added in both directions. Nothing is changed if the
        file cannot be read or parsed.

        @param lexiconFile      Path to lexicon file
        @return                 true if loaded successfully
    */
    bool loadOverrides(const juce::File& lexiconFile);

    /**
        Merge overrides from a JSON string (same format as loadOverrides).
    */
    bool loadOverridesFromJson(const juce::String& json);

    /**
        All words and phrases interchangeable with word (one direction).
    */
    const std::vector<std::string>& equivalents(const std::string& word) const;

    /**
        Multi-word phrases interchangeable with word, e.g. "alright" -> "all right".
    */
    std::vector<std::string> multiWordEquivalents(const std::string& word) const;

    /**
        Equivalence lookup tried in both directions.
    */
    bool areEquivalent(const std::string& a, const std::string& b) const;

    bool isSkippable(const std::string& word) const;
    bool isFiller(const std::string& word) const;

    /**
        True if the expected word at index may go unspoken: a skippable word
        or a stutter repeat of the previous word.
    */
    bool canSkipExpected(const std::vector<Token>& expected, int index) const;

    /**
        Entries are normalized like tokens ("Mm-hmm" -> "mm hmm") and added in
        both directions. Multi-word alternatives become phrase equivalents.
    */
    void addEquivalents(const std::string& word, const std::vector<std::string>& alternatives);

    /**
        Entries that do not normalize to exactly one word are logged and
        ignored; no token could ever match them.
    */
    void addSkippable(const std::string& word);
    void addFiller(const std::string& word);

    size_t getNumEquivalents() const { return equivalentMap.size(); }
    size_t getNumSkippable() const { return skippableWords.size(); }
    size_t getNumFillers() const { return fillerWords.size(); }

private:
    static WordTables createDefault();
    static std::string normalizeEntry(const std::string& word);
    static bool isSingleWord(const std::string& entry);

    void addOneWay(const std::string& word, const std::string& alternative);

    std::unordered_map<std::string, std::vector<std::string>> equivalentMap;
    std::unordered_set<std::string> skippableWords;
    std::unordered_set<std::string> fillerWords;
};
