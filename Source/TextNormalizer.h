/*
  ==============================================================================

    TextNormalizer.h
    Created: 10 Dec 2024
    Author: Explicitly Audio Systems

    Turns script lines and transcripts into comparable tokens.

  ==============================================================================
*/

#pragma once

#include "Types.h"
#include <string>
#include <vector>

class TextNormalizer
{
public:
    /**
        Replace dash runs with a single space so "I--I" and "I-I" become
        "I I" (stutter notation in scripts).
    */
    static std::string splitStutters(const std::string& text);

    /**
        Normalize text for comparison: split stutters, lowercase, turn
        punctuation except apostrophes into word breaks, collapse whitespace.
        Script lines, transcripts and word table entries all go through here.

        @param text     Input text
        @return         Normalized text
    */
    static std::string normalizeText(const std::string& text);

    /**
        Split normalized text into individual words.
    */
    static std::vector<std::string> splitIntoWords(const std::string& text);

    /**
        Tokenize the expected script line. Stutters are split, punctuation
        becomes a word break, and the original casing of every word is kept
        for proper-noun detection.
    */
    static std::vector<Token> tokenizeExpected(const std::string& line);

    /**
        Tokenize recognizer output the same way as the script, so any line
        spoken exactly tokenizes to the same words.
    */
    static std::vector<Token> tokenizeSpoken(const std::string& transcript);

    /**
        True if the token at index repeats the word right before it.
    */
    static bool isStutterRepeat(const std::vector<Token>& tokens, int index);

    /**
        Join normalized words [start, start + count) with single spaces.
    */
    static std::string joinWords(const std::vector<Token>& tokens, int start, int count);

private:
    static bool isWordChar(char c);
    static std::string replaceTypographicApostrophes(const std::string& text);
};
