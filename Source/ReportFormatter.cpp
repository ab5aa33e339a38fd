/*
  ==============================================================================

    ReportFormatter.cpp
    Created: 12 Dec 2024
    Author: Explicitly Audio Systems

  ==============================================================================
*/

#include "ReportFormatter.h"
#include "TextNormalizer.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

const char* ReportFormatter::verdictName(WordVerdict verdict)
{
    switch (verdict)
    {
        case WordVerdict::Correct:  return "OK";
        case WordVerdict::Wrong:    return "WRONG";
        case WordVerdict::Missing:  return "MISSING";
    }

    return "?";
}

std::string ReportFormatter::joinList(const std::vector<std::string>& items)
{
    if (items.empty())
        return "(none)";

    std::string joined;
    for (const auto& item : items)
    {
        if (!joined.empty())
            joined += ", ";
        joined += item;
    }
    return joined;
}

std::string ReportFormatter::formatReport(const std::string& expectedLine,
                                          const AccuracyResult& accuracy,
                                          const WordByWordResult& words)
{
    std::ostringstream report;

    report << "========================================\n";
    report << "  LINE CHECK REPORT\n";
    report << "========================================\n\n";

    report << "LINE:\n";
    report << "  \"" << expectedLine << "\"\n\n";

    report << "VERDICT:\n";
    report << "  Result: " << (accuracy.isCorrect ? "PASS" : "FAIL") << "\n";
    report << "  Accuracy: " << accuracy.accuracy << "%\n\n";

    report << "DIAGNOSTICS:\n";
    report << "  Missing: " << joinList(accuracy.missingWords) << "\n";
    report << "  Extra: " << joinList(accuracy.extraWords) << "\n";
    report << "  Wrong: " << joinList(accuracy.wrongWords) << "\n\n";

    report << "WORD BY WORD:\n";
    const std::vector<Token> expected = TextNormalizer::tokenizeExpected(expectedLine);
    const size_t rows = std::min(expected.size(), words.results.size());

    for (size_t i = 0; i < rows; ++i)
    {
        const std::string& spoken = i < words.spokenWords.size() ? words.spokenWords[i] : std::string();

        report << "  " << std::left << std::setw(16) << expected[i].original
               << std::setw(9) << verdictName(words.results[i]);
        if (!spoken.empty())
            report << "\"" << spoken << "\"";
        report << "\n";
    }

    report << "\n========================================\n";

    return report.str();
}
