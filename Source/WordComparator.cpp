/*
  ==============================================================================

    WordComparator.cpp
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Implementation of word equality, string similarity and phonetic codes.

  ==============================================================================
*/

#include "WordComparator.h"
#include <algorithm>
#include <cctype>
#include <vector>

WordComparator::WordComparator(const WordTables& t, const AlignmentSettings& settings)
    : tables(t),
      nameSimilarityThreshold(settings.nameSimilarityThreshold),
      prefixScale(settings.prefixScale)
{
}

bool WordComparator::wordsMatch(const std::string& expected,
                                const std::string& spoken,
                                const std::string& expectedOriginal,
                                bool isFirstPosition,
                                const KnownNames* knownNames) const
{
    // Method 1: Exact match
    if (expected == spoken)
        return true;

    // Method 2: Equivalents (abbreviations, homophones, numerals)
    if (tables.areEquivalent(expected, spoken))
        return true;

    // Method 3: Fuzzy match, names only. "old" must never match "young".
    bool isName = isProperNoun(expectedOriginal, isFirstPosition)
        || (knownNames != nullptr && knownNames->contains(expected));

    if (isName && jaroWinklerSimilarity(expected, spoken, prefixScale) >= nameSimilarityThreshold)
        return true;

    const int expectedLength = (int)expected.length();
    const int spokenLength = (int)spoken.length();

    // Method 4: Edit distance, one edit for short words
    if (expectedLength <= 5 || spokenLength <= 5)
    {
        if (levenshteinDistance(expected, spoken) <= 1)
            return true;
    }

    // Two edits once both words are long ("corkster" / "corkscrew")
    if (expectedLength >= 6 && spokenLength >= 6)
    {
        if (levenshteinDistance(expected, spoken) <= 2)
            return true;
    }

    // Method 5: Phonetic (homophones missing from the table)
    if (expectedLength >= 2 && spokenLength >= 2)
    {
        if (soundexEncode(expected) == soundexEncode(spoken))
            return true;
    }

    return false;
}

bool WordComparator::isProperNoun(const std::string& original, bool isFirstPosition)
{
    if (original.empty() || isFirstPosition)
        return false;

    unsigned char first = static_cast<unsigned char>(original[0]);
    return first < 128 && std::isupper(first);
}

double WordComparator::jaroSimilarity(const std::string& s1, const std::string& s2)
{
    if (s1 == s2) return 1.0;
    if (s1.empty() || s2.empty()) return 0.0;

    const int len1 = (int)s1.length();
    const int len2 = (int)s2.length();
    const int matchDistance = std::max(0, std::max(len1, len2) / 2 - 1);

    std::vector<bool> s1Matches(len1, false);
    std::vector<bool> s2Matches(len2, false);

    int matches = 0;

    // Find matching characters within the window
    for (int i = 0; i < len1; ++i)
    {
        int start = std::max(0, i - matchDistance);
        int end = std::min(i + matchDistance + 1, len2);

        for (int j = start; j < end; ++j)
        {
            if (s2Matches[j] || s1[i] != s2[j])
                continue;

            s1Matches[i] = true;
            s2Matches[j] = true;
            ++matches;
            break;
        }
    }

    if (matches == 0)
        return 0.0;

    // Count transpositions
    int transpositions = 0;
    int k = 0;
    for (int i = 0; i < len1; ++i)
    {
        if (!s1Matches[i])
            continue;

        while (!s2Matches[k])
            ++k;

        if (s1[i] != s2[k])
            ++transpositions;
        ++k;
    }

    const double m = (double)matches;
    return (m / len1 + m / len2 + (m - transpositions / 2.0) / m) / 3.0;
}

double WordComparator::jaroWinklerSimilarity(const std::string& s1, const std::string& s2,
                                             double scale)
{
    const double jaro = jaroSimilarity(s1, s2);

    int prefix = 0;
    const int maxPrefix = std::min({ (int)s1.length(), (int)s2.length(), 4 });
    for (int i = 0; i < maxPrefix && s1[i] == s2[i]; ++i)
        ++prefix;

    return jaro + prefix * scale * (1.0 - jaro);
}

// Single-row dynamic programming
int WordComparator::levenshteinDistance(const std::string& a, const std::string& b)
{
    const int m = (int)a.length();
    const int n = (int)b.length();

    std::vector<int> dp(n + 1);
    for (int j = 0; j <= n; ++j)
        dp[j] = j;

    for (int i = 1; i <= m; ++i)
    {
        int prev = dp[0];
        dp[0] = i;

        for (int j = 1; j <= n; ++j)
        {
            int tmp = dp[j];

            if (a[i-1] == b[j-1])
                dp[j] = prev;
            else
                dp[j] = 1 + std::min({ prev, dp[j], dp[j-1] });

            prev = tmp;
        }
    }

    return dp[n];
}

std::string WordComparator::soundexEncode(const std::string& word)
{
    if (word.empty()) return "";

    auto digitFor = [](char c) -> char
    {
        switch (std::tolower(static_cast<unsigned char>(c)))
        {
            case 'b': case 'f': case 'p': case 'v':
                return '1';
            case 'c': case 'g': case 'j': case 'k': case 'q': case 's': case 'x': case 'z':
                return '2';
            case 'd': case 't':
                return '3';
            case 'l':
                return '4';
            case 'm': case 'n':
                return '5';
            case 'r':
                return '6';
            default:
                return '0';
        }
    };

    // Keep first letter
    std::string code;
    code += (char)std::toupper(static_cast<unsigned char>(word[0]));
    char prev = digitFor(word[0]);

    // Vowels, h, w and apostrophes separate repeated codes
    for (size_t i = 1; i < word.length() && code.length() < 4; ++i)
    {
        char digit = digitFor(word[i]);

        if (digit != '0' && digit != prev)
            code += digit;

        prev = digit;
    }

    // Pad with zeros
    while (code.length() < 4)
        code += '0';

    return code.substr(0, 4);
}
