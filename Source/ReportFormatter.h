/*
  ==============================================================================

    ReportFormatter.h
    Created: 12 Dec 2024
    Author: Explicitly Audio Systems

    Plain-text report of a line check for the console tool and logs.

  ==============================================================================
*/

#pragma once

#include "Types.h"
#include <string>

class ReportFormatter
{
public:
    /**
        Render the verdict, the diagnostic word lists and one row per
        expected word.

        @param expectedLine     Script line that was checked
        @param accuracy         Result of LineAligner::checkAccuracy
        @param words            Result of LineAligner::getWordByWordResults
        @return                 Multi-line report
    */
    static std::string formatReport(const std::string& expectedLine,
                                    const AccuracyResult& accuracy,
                                    const WordByWordResult& words);

    static const char* verdictName(WordVerdict verdict);

private:
    static std::string joinList(const std::vector<std::string>& items);
};
