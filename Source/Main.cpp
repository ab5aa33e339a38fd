/*
  ==============================================================================

    Main.cpp
    Created: 9 Dec 2024
    Author: Explicitly Audio Systems

    CueCheck console tool: checks a spoken transcript against a script line.

    Usage:
        CueCheck check <expected> <spoken> [--strict] [--names a,b]
        CueCheck stream <expected> <prefix1> <prefix2> ...

    Options (both commands):
        --config <file>     Alignment settings (JSON)
        --tables <file>     Word table overrides (JSON)
        --log <file>        Write the log to a file

    Exit code: 0 pass, 1 fail, 2 usage or load error.

  ==============================================================================
*/

#include <juce_core/juce_core.h>
#include "AlignmentSettings.h"
#include "KnownNames.h"
#include "LineAligner.h"
#include "ReportFormatter.h"
#include "SubsequenceAligner.h"
#include "TextNormalizer.h"
#include "WordTables.h"
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
    enum ExitCode
    {
        exitPass = 0,
        exitFail = 1,
        exitUsage = 2
    };

    struct Options
    {
        std::string command;
        std::vector<std::string> positional;
        bool strict = false;
        std::vector<std::string> names;
        juce::String configPath;
        juce::String tablesPath;
        juce::String logPath;
    };

    void printUsage()
    {
        std::cerr << "Usage: CueCheck check <expected> <spoken> [--strict] [--names a,b]" << std::endl;
        std::cerr << "       CueCheck stream <expected> <prefix1> <prefix2> ..." << std::endl;
        std::cerr << std::endl;
        std::cerr << "Options:" << std::endl;
        std::cerr << "  --config <file>   Alignment settings (JSON)" << std::endl;
        std::cerr << "  --tables <file>   Word table overrides (JSON)" << std::endl;
        std::cerr << "  --log <file>      Write the log to a file" << std::endl;
        std::cerr << std::endl;
        std::cerr << "Example: CueCheck check \"I--I am here\" \"I am here\"" << std::endl;
    }

    bool parseArguments(int argc, char* argv[], Options& options)
    {
        if (argc < 2)
            return false;

        options.command = argv[1];

        for (int i = 2; i < argc; ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--strict")
            {
                options.strict = true;
                continue;
            }

            if (arg == "--names" || arg == "--config" || arg == "--tables" || arg == "--log")
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "[CueCheck] ERROR: " << arg << " needs a value" << std::endl;
                    return false;
                }

                const juce::String value(argv[++i]);

                if (arg == "--names")
                {
                    for (const auto& name : juce::StringArray::fromTokens(value, ",", ""))
                        if (name.trim().isNotEmpty())
                            options.names.push_back(name.trim().toStdString());
                }
                else if (arg == "--config")
                    options.configPath = value;
                else if (arg == "--tables")
                    options.tablesPath = value;
                else
                    options.logPath = value;

                continue;
            }

            options.positional.push_back(arg);
        }

        if (options.command == "check")
            return options.positional.size() == 2;

        if (options.command == "stream")
            return options.positional.size() >= 2;

        std::cerr << "[CueCheck] ERROR: Unknown command: " << options.command << std::endl;
        return false;
    }

    int runCheck(const Options& options, const LineAligner& aligner, const KnownNames* names)
    {
        const std::string& expected = options.positional[0];
        const std::string& spoken = options.positional[1];
        const bool strict = options.strict || aligner.getSettings().strictMode;

        std::cout << "[CueCheck] Expected: \"" << expected << "\"" << std::endl;
        std::cout << "[CueCheck] Spoken:   \"" << spoken << "\"" << std::endl;
        std::cout << "[CueCheck] Mode:     " << (strict ? "strict" : "normal") << std::endl;
        std::cout << std::endl;

        const AccuracyResult result = aligner.checkAccuracy(expected, spoken, strict, names);
        const WordByWordResult words = aligner.getWordByWordResults(expected, spoken, names);

        std::cout << ReportFormatter::formatReport(expected, result, words);

        juce::Logger::writeToLog("[CueCheck] check: " + juce::String(result.accuracy) + "% "
            + (result.isCorrect ? "PASS" : "FAIL"));

        return result.isCorrect ? exitPass : exitFail;
    }

    int runStream(const Options& options, const LineAligner& aligner,
                  const SubsequenceAligner& subsequence, const KnownNames* names)
    {
        const std::string& expected = options.positional[0];
        const int expectedWords = (int)TextNormalizer::tokenizeExpected(expected).size();

        std::cout << "[CueCheck] Expected: \"" << expected << "\" (" << expectedWords << " words)" << std::endl;
        std::cout << std::endl;

        LockedWordState state = LineAligner::createFreshLockedState();

        for (size_t i = 1; i < options.positional.size(); ++i)
        {
            const std::string& transcript = options.positional[i];

            state = aligner.getLockedWordMatch(expected, transcript, &state, names);
            const SubsequenceMatchResult gaps = subsequence.getSubsequenceWordMatch(expected, transcript, names);

            std::cout << "[Stream] \"" << transcript << "\"" << std::endl;
            std::cout << "  Locked: " << state.lockedCount << "/" << expectedWords
                      << (state.hasError ? " (error)" : "") << std::endl;
            std::cout << "  Subsequence: " << gaps.matchedCount << " matched, coverage "
                      << std::fixed << std::setprecision(2) << gaps.coverage << std::endl;
        }

        const bool complete = aligner.isLineComplete(expected, state);

        std::cout << std::endl;
        std::cout << "[CueCheck] Line " << (complete ? "complete" : "incomplete") << std::endl;

        juce::Logger::writeToLog("[CueCheck] stream: locked " + juce::String(state.lockedCount)
            + (complete ? ", complete" : ", incomplete"));

        return complete ? exitPass : exitFail;
    }
}

int main(int argc, char* argv[])
{
    std::cout << "============================================" << std::endl;
    std::cout << "  CueCheck - Line Accuracy Checker" << std::endl;
    std::cout << "============================================" << std::endl;
    std::cout << std::endl;

    Options options;
    if (!parseArguments(argc, argv, options))
    {
        printUsage();
        return exitUsage;
    }

    std::unique_ptr<juce::FileLogger> fileLogger;
    if (options.logPath.isNotEmpty())
    {
        fileLogger.reset(new juce::FileLogger(juce::File::getCurrentWorkingDirectory().getChildFile(options.logPath),
                                              "CueCheck log"));
        juce::Logger::setCurrentLogger(fileLogger.get());
    }

    int exitCode = exitUsage;

    AlignmentSettings settings;
    WordTables tables(WordTables::getDefault());

    const bool configLoaded = options.configPath.isEmpty()
        || settings.loadFromFile(juce::File::getCurrentWorkingDirectory().getChildFile(options.configPath));
    const bool tablesLoaded = options.tablesPath.isEmpty()
        || tables.loadOverrides(juce::File::getCurrentWorkingDirectory().getChildFile(options.tablesPath));

    if (!configLoaded || !tablesLoaded)
    {
        std::cerr << "[CueCheck] ERROR: Failed to load "
                  << (configLoaded ? "word tables" : "settings") << std::endl;
    }
    else
    {
        const KnownNames knownNames = KnownNames::fromCharacterNames(options.names);
        const KnownNames* names = knownNames.isEmpty() ? nullptr : &knownNames;

        LineAligner aligner(tables, settings);

        if (options.command == "check")
        {
            exitCode = runCheck(options, aligner, names);
        }
        else
        {
            SubsequenceAligner subsequence(tables, settings);
            exitCode = runStream(options, aligner, subsequence, names);
        }
    }

    juce::Logger::setCurrentLogger(nullptr);
    return exitCode;
}
