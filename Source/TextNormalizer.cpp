/*
  ==============================================================================

    TextNormalizer.cpp
    Created: 10 Dec 2024
    Author: Explicitly Audio Systems

    Implementation of line and transcript tokenization.

  ==============================================================================
*/

#include "TextNormalizer.h"
#include <algorithm>
#include <cctype>
#include <sstream>

// Word characters: ASCII letters, digits, underscore and apostrophe
bool TextNormalizer::isWordChar(char c)
{
    unsigned char uc = static_cast<unsigned char>(c);
    return uc < 128 && (std::isalnum(uc) || c == '_' || c == '\'');
}

// Recognizers often emit U+2019 instead of a plain apostrophe
std::string TextNormalizer::replaceTypographicApostrophes(const std::string& text)
{
    static const std::string rightQuote = "\xE2\x80\x99";

    std::string result = text;
    size_t pos = 0;

    while ((pos = result.find(rightQuote, pos)) != std::string::npos)
    {
        result.replace(pos, rightQuote.length(), "'");
        ++pos;
    }

    return result;
}

std::string TextNormalizer::splitStutters(const std::string& text)
{
    std::string result;
    result.reserve(text.length());

    for (char c : text)
    {
        if (c == '-')
        {
            if (result.empty() || result.back() != ' ')
                result += ' ';
        }
        else
        {
            result += c;
        }
    }

    return result;
}

// Normalize text: split stutters, lowercase, punctuation (apostrophes kept) becomes a word break
std::string TextNormalizer::normalizeText(const std::string& text)
{
    std::string result = replaceTypographicApostrophes(splitStutters(text));

    for (auto& c : result)
    {
        if (!isWordChar(c))
            c = ' ';
        else
            c = (char)std::tolower(static_cast<unsigned char>(c));
    }

    // Remove extra whitespace
    std::istringstream iss(result);
    std::string word;
    std::vector<std::string> words;
    while (iss >> word)
        words.push_back(word);

    result.clear();
    for (size_t i = 0; i < words.size(); ++i)
    {
        if (i > 0) result += " ";
        result += words[i];
    }

    return result;
}

std::vector<std::string> TextNormalizer::splitIntoWords(const std::string& text)
{
    std::string normalized = normalizeText(text);
    std::istringstream iss(normalized);
    std::string word;
    std::vector<std::string> words;

    while (iss >> word)
        words.push_back(word);

    return words;
}

std::vector<Token> TextNormalizer::tokenizeExpected(const std::string& line)
{
    std::string cleaned = replaceTypographicApostrophes(splitStutters(line));

    // Punctuation becomes a word break so "Hello,World" still yields two words
    for (auto& c : cleaned)
    {
        if (!isWordChar(c))
            c = ' ';
    }

    std::istringstream iss(cleaned);
    std::string original;
    std::vector<Token> tokens;

    while (iss >> original)
    {
        tokens.emplace_back(normalizeText(original), original, tokens.empty());
    }

    return tokens;
}

std::vector<Token> TextNormalizer::tokenizeSpoken(const std::string& transcript)
{
    std::vector<Token> tokens;

    for (const auto& word : splitIntoWords(transcript))
        tokens.emplace_back(word, word, tokens.empty());

    return tokens;
}

bool TextNormalizer::isStutterRepeat(const std::vector<Token>& tokens, int index)
{
    return index > 0
        && index < (int)tokens.size()
        && tokens[index].normalized == tokens[index - 1].normalized;
}

std::string TextNormalizer::joinWords(const std::vector<Token>& tokens, int start, int count)
{
    std::string result;
    int end = std::min(start + count, (int)tokens.size());

    for (int i = start; i < end; ++i)
    {
        if (i > start) result += " ";
        result += tokens[i].normalized;
    }

    return result;
}
