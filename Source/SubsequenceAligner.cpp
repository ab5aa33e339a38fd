/*
  ==============================================================================

    SubsequenceAligner.cpp
    Created: 12 Dec 2024
    Author: Explicitly Audio Systems

  ==============================================================================
*/

#include "SubsequenceAligner.h"
#include "TextNormalizer.h"
#include <algorithm>

SubsequenceAligner::SubsequenceAligner(const WordTables& tables, const AlignmentSettings& settings)
    : comparator(tables, settings)
{
}

std::vector<std::vector<int>> SubsequenceAligner::calculateLcsTable(
    const std::vector<std::vector<bool>>& matches)
{
    const int m = (int)matches.size();
    const int n = m > 0 ? (int)matches[0].size() : 0;

    std::vector<std::vector<int>> table(m + 1, std::vector<int>(n + 1, 0));

    for (int i = 1; i <= m; ++i)
    {
        for (int j = 1; j <= n; ++j)
        {
            if (matches[i-1][j-1])
                table[i][j] = table[i-1][j-1] + 1;
            else
                table[i][j] = std::max(table[i-1][j], table[i][j-1]);
        }
    }

    return table;
}

SubsequenceMatchResult SubsequenceAligner::getSubsequenceWordMatch(const std::string& expected,
                                                                   const std::string& spoken,
                                                                   const KnownNames* knownNames) const
{
    const WordTables& tables = comparator.getTables();
    const std::vector<Token> expectedTokens = TextNormalizer::tokenizeExpected(expected);
    const std::vector<Token> spokenTokens = TextNormalizer::tokenizeSpoken(spoken);

    SubsequenceMatchResult result;

    // Auto-match skippable words and stutter repeats
    std::vector<int> rows;
    for (int i = 0; i < (int)expectedTokens.size(); ++i)
    {
        if (tables.canSkipExpected(expectedTokens, i))
            result.matchedIndices.insert(i);
        else
            rows.push_back(i);
    }

    const int skippedCount = (int)result.matchedIndices.size();
    const int effectiveWordCount = (int)expectedTokens.size() - skippedCount;

    if (spokenTokens.empty())
    {
        result.coverage = effectiveWordCount > 0 ? 0.0 : 1.0;
        return result;
    }

    std::vector<std::string> columns;
    for (const auto& token : spokenTokens)
    {
        if (!tables.isFiller(token.normalized))
            columns.push_back(token.normalized);
    }

    const int m = (int)rows.size();
    const int n = (int)columns.size();

    if (m == 0)
    {
        result.coverage = 1.0;
        return result;
    }

    if (n == 0)
        return result;

    // Compare every pair once; backtracking reuses the answers
    std::vector<std::vector<bool>> matches(m, std::vector<bool>(n, false));
    for (int i = 0; i < m; ++i)
    {
        for (int j = 0; j < n; ++j)
            matches[i][j] = comparator.tokenMatches(expectedTokens[rows[i]], columns[j], knownNames);
    }

    const std::vector<std::vector<int>> table = calculateLcsTable(matches);

    // Backtrack from bottom-right to recover the matched expected words
    int i = m;
    int j = n;
    while (i > 0 && j > 0)
    {
        if (matches[i-1][j-1])
        {
            result.matchedIndices.insert(rows[i-1]);
            --i;
            --j;
        }
        else if (table[i-1][j] >= table[i][j-1])
        {
            --i;
        }
        else
        {
            --j;
        }
    }

    result.matchedCount = (int)result.matchedIndices.size() - skippedCount;
    result.coverage = effectiveWordCount > 0 ? (double)result.matchedCount / effectiveWordCount : 1.0;

    return result;
}
