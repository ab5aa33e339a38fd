/*
  ==============================================================================

    WordTables.cpp
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Built-in lexicons and JSON override loading.

  ==============================================================================
*/

#include "WordTables.h"
#include "TextNormalizer.h"
#include <algorithm>
#include <utility>

namespace
{
    using EquivalentGroup = std::pair<const char*, std::vector<std::string>>;

    // Only transcription variations: the same sound written differently by
    // different recognizer passes, never a different word the actor chose.
    const std::vector<EquivalentGroup>& builtInEquivalents()
    {
        static const std::vector<EquivalentGroup> groups = {
            // Abbreviations
            { "dr", { "doctor" } }, { "doctor", { "dr" } },
            { "mr", { "mister" } }, { "mister", { "mr" } },
            { "mrs", { "missus" } }, { "missus", { "mrs" } },
            { "ms", { "miss" } }, { "miss", { "ms" } },
            { "prof", { "professor" } }, { "professor", { "prof" } },
            { "st", { "saint" } }, { "saint", { "st" } },
            { "mt", { "mount" } }, { "mount", { "mt" } },

            // Homophones
            { "their", { "there", "they're" } },
            { "there", { "their", "they're" } },
            { "they're", { "their", "there" } },
            { "your", { "you're" } }, { "you're", { "your" } },
            { "its", { "it's" } }, { "it's", { "its" } },
            { "to", { "too", "two", "2" } },
            { "too", { "to", "two", "2" } },
            { "two", { "to", "too", "2" } },
            { "2", { "to", "too", "two" } },
            { "hear", { "here" } }, { "here", { "hear" } },
            { "weather", { "whether" } }, { "whether", { "weather" } },
            { "write", { "right" } }, { "right", { "write" } },
            { "know", { "no" } }, { "no", { "know" } },
            { "knew", { "new" } }, { "new", { "knew" } },
            { "would", { "wood" } }, { "wood", { "would" } },
            { "wait", { "weight" } }, { "weight", { "wait" } },
            { "wear", { "where", "ware" } }, { "where", { "wear", "ware" } },
            { "whose", { "who's" } }, { "who's", { "whose" } },
            { "for", { "four", "4" } }, { "four", { "for", "4" } }, { "4", { "for", "four" } },
            { "ate", { "eight", "8" } }, { "eight", { "ate", "8" } }, { "8", { "ate", "eight" } },
            { "won", { "one", "1" } }, { "one", { "won", "1" } }, { "1", { "won", "one" } },

            // Casual spellings
            { "ok", { "okay", "k", "kay" } }, { "okay", { "ok", "k", "kay" } },
            { "alright", { "all right" } }, { "all right", { "alright" } },

            // mm-hmm (dashed spellings reach the tables as two words)
            { "mhm", { "mmhm", "mhmm", "mmhmm", "mm hmm", "mm hm", "mmm hmm" } },
            { "mmhm", { "mhm", "mhmm", "mmhmm", "mm hmm", "mm hm", "mmm hmm" } },
            { "mhmm", { "mhm", "mmhm", "mmhmm", "mm hmm", "mm hm", "mmm hmm" } },
            { "mmhmm", { "mhm", "mmhm", "mhmm", "mm hmm", "mm hm", "mmm hmm", "uh huh" } },

            // uh-huh
            { "uhhuh", { "uhuh", "uh huh", "ah huh", "ahuh" } },
            { "uhuh", { "uhhuh", "uh huh", "ah huh" } },

            // hmm
            { "hmm", { "hm", "hmmm", "hmmmm" } },
            { "hm", { "hmm", "hmmm" } },
            { "hmmm", { "hmm", "hm", "hmmmm" } },

            // um
            { "um", { "umm", "ummm", "uhm" } },
            { "umm", { "um", "ummm", "uhm" } },
            { "ummm", { "um", "umm", "uhm" } },
            { "uhm", { "um", "umm", "ummm" } },

            // uh
            { "uh", { "uhh", "uhhh", "er" } },
            { "uhh", { "uh", "uhhh", "er" } },
            { "er", { "uh", "uhh" } },

            // ah
            { "ah", { "ahh", "ahhh" } },
            { "ahh", { "ah", "ahhh" } },

            // yeah
            { "yeah", { "yea", "ya", "yah", "yep", "yup" } },
            { "yea", { "yeah", "ya", "yah" } },
            { "ya", { "yeah", "yea", "yah" } },
            { "yep", { "yeah", "yup", "yes" } },
            { "yup", { "yeah", "yep", "yes" } },

            // nope
            { "nope", { "nah", "na" } },
            { "nah", { "nope", "na", "no" } },
            { "na", { "nah", "nope" } },

            // Numerals not covered above
            { "three", { "3" } }, { "3", { "three" } },
            { "five", { "5" } }, { "5", { "five" } },
            { "six", { "6" } }, { "6", { "six" } },
            { "seven", { "7" } }, { "7", { "seven" } },
            { "nine", { "9" } }, { "9", { "nine" } },
            { "ten", { "10" } }, { "10", { "ten" } },
            { "first", { "1st" } }, { "1st", { "first" } },
            { "second", { "2nd" } }, { "2nd", { "second" } },
            { "third", { "3rd" } }, { "3rd", { "third" } },
        };

        return groups;
    }

    const std::vector<std::string> builtInSkippable = {
        // Thinking sounds
        "um", "uh", "ah", "er", "ehh", "uhh", "ahh", "umm",
        // Acknowledgment sounds
        "mm", "mmm", "mmmm", "hmm", "hm", "hmmm",
        "mmhmm", "mhm", "uhuh", "uhhuh",
        "mhmm", "mmhm", "aha",
        // Reactions (parentheticals that ended up in the dialogue)
        "sigh", "sighs", "sighing",
        "laugh", "laughs", "laughing", "chuckle", "chuckles",
        "gasp", "gasps", "gasping",
        "groan", "groans", "groaning",
        "scoff", "scoffs", "scoffing",
        "snort", "snorts", "snorting",
        "sob", "sobs", "sobbing",
        "cough", "coughs", "coughing",
        "sniff", "sniffs", "sniffing",
        "wheeze", "wheezes", "wheezing",
        // Exclamations
        "oh", "ooh", "oooh", "ohhh",
        "ahhh",
        "ugh", "argh", "aargh",
        "whoa", "wow", "woah",
        "huh", "eh", "hey", "ho", "ha",
        "phew", "psst", "shh", "shush", "tsk",
        // Beat markers
        "beat", "pause", "then",
        // Conversational fillers actors naturally drop
        "well", "so",
    };

    const std::vector<std::string> builtInFillers = {
        "um", "uh", "ah", "er", "like", "well", "so", "oh", "hmm", "mm", "hm",
    };
}

WordTables WordTables::createDefault()
{
    WordTables tables;

    for (const auto& group : builtInEquivalents())
        tables.addEquivalents(group.first, group.second);

    for (const auto& word : builtInSkippable)
        tables.addSkippable(word);

    for (const auto& word : builtInFillers)
        tables.addFiller(word);

    juce::Logger::writeToLog("[WordTables] Built-in tables: "
        + juce::String((int)tables.equivalentMap.size()) + " equivalence entries, "
        + juce::String((int)tables.skippableWords.size()) + " skippable, "
        + juce::String((int)tables.fillerWords.size()) + " filler");

    return tables;
}

const WordTables& WordTables::getDefault()
{
    static const WordTables defaults = createDefault();
    return defaults;
}

// Table entries are normalized exactly like the tokens they are compared with
std::string WordTables::normalizeEntry(const std::string& word)
{
    return TextNormalizer::normalizeText(word);
}

bool WordTables::isSingleWord(const std::string& entry)
{
    return !entry.empty() && entry.find(' ') == std::string::npos;
}

void WordTables::addOneWay(const std::string& word, const std::string& alternative)
{
    auto& alternatives = equivalentMap[word];

    if (std::find(alternatives.begin(), alternatives.end(), alternative) == alternatives.end())
        alternatives.push_back(alternative);
}

void WordTables::addEquivalents(const std::string& word, const std::vector<std::string>& alternatives)
{
    const std::string key = normalizeEntry(word);
    if (key.empty())
        return;

    for (const auto& alternative : alternatives)
    {
        const std::string alt = normalizeEntry(alternative);
        if (alt.empty() || alt == key)
            continue;

        addOneWay(key, alt);
        addOneWay(alt, key);
    }
}

void WordTables::addSkippable(const std::string& word)
{
    const std::string key = normalizeEntry(word);
    if (!isSingleWord(key))
    {
        juce::Logger::writeToLog("[WordTables] Ignoring skippable entry \"" + juce::String(word)
            + "\": must be a single word");
        return;
    }

    skippableWords.insert(key);
}

void WordTables::addFiller(const std::string& word)
{
    const std::string key = normalizeEntry(word);
    if (!isSingleWord(key))
    {
        juce::Logger::writeToLog("[WordTables] Ignoring filler entry \"" + juce::String(word)
            + "\": must be a single word");
        return;
    }

    fillerWords.insert(key);
}

const std::vector<std::string>& WordTables::equivalents(const std::string& word) const
{
    static const std::vector<std::string> none;

    auto it = equivalentMap.find(word);
    return it != equivalentMap.end() ? it->second : none;
}

std::vector<std::string> WordTables::multiWordEquivalents(const std::string& word) const
{
    std::vector<std::string> phrases;

    for (const auto& alternative : equivalents(word))
    {
        if (alternative.find(' ') != std::string::npos)
            phrases.push_back(alternative);
    }

    return phrases;
}

bool WordTables::areEquivalent(const std::string& a, const std::string& b) const
{
    const auto& forward = equivalents(a);
    if (std::find(forward.begin(), forward.end(), b) != forward.end())
        return true;

    const auto& backward = equivalents(b);
    return std::find(backward.begin(), backward.end(), a) != backward.end();
}

bool WordTables::isSkippable(const std::string& word) const
{
    return skippableWords.find(word) != skippableWords.end();
}

bool WordTables::isFiller(const std::string& word) const
{
    return fillerWords.find(word) != fillerWords.end();
}

bool WordTables::canSkipExpected(const std::vector<Token>& expected, int index) const
{
    if (index < 0 || index >= (int)expected.size())
        return false;

    return isSkippable(expected[index].normalized)
        || TextNormalizer::isStutterRepeat(expected, index);
}

bool WordTables::loadOverrides(const juce::File& lexiconFile)
{
    if (!lexiconFile.existsAsFile())
    {
        juce::Logger::writeToLog("[WordTables] ERROR: Lexicon file not found: "
            + lexiconFile.getFullPathName());
        return false;
    }

    if (!loadOverridesFromJson(lexiconFile.loadFileAsString()))
    {
        juce::Logger::writeToLog("[WordTables] ERROR: Could not load " + lexiconFile.getFullPathName());
        return false;
    }

    juce::Logger::writeToLog("[WordTables] Loaded overrides from " + lexiconFile.getFullPathName());
    return true;
}

bool WordTables::loadOverridesFromJson(const juce::String& json)
{
    juce::var parsed;
    juce::Result result = juce::JSON::parse(json, parsed);

    if (result.failed())
    {
        juce::Logger::writeToLog("[WordTables] Invalid JSON: " + result.getErrorMessage());
        return false;
    }

    if (parsed.getDynamicObject() == nullptr)
    {
        juce::Logger::writeToLog("[WordTables] Expected a JSON object at top level");
        return false;
    }

    auto toStrings = [](const juce::var& list, std::vector<std::string>& out) -> bool
    {
        const juce::Array<juce::var>* items = list.getArray();
        if (items == nullptr)
            return false;

        for (const auto& item : *items)
        {
            if (!item.isString())
                return false;
            out.push_back(item.toString().toStdString());
        }
        return true;
    };

    // Validate everything first, then merge
    std::vector<std::pair<std::string, std::vector<std::string>>> newEquivalents;
    std::vector<std::string> newSkippable;
    std::vector<std::string> newFillers;

    const juce::var equivalentsVar = parsed.getProperty("equivalents", juce::var());
    if (!equivalentsVar.isVoid())
    {
        auto* object = equivalentsVar.getDynamicObject();
        if (object == nullptr)
        {
            juce::Logger::writeToLog("[WordTables] \"equivalents\" must be an object");
            return false;
        }

        for (const auto& property : object->getProperties())
        {
            std::vector<std::string> alternatives;
            if (!toStrings(property.value, alternatives))
            {
                juce::Logger::writeToLog("[WordTables] Equivalents for \"" + property.name.toString()
                    + "\" must be an array of strings");
                return false;
            }
            newEquivalents.emplace_back(property.name.toString().toStdString(), alternatives);
        }
    }

    const juce::var skippableVar = parsed.getProperty("skippable", juce::var());
    if (!skippableVar.isVoid() && !toStrings(skippableVar, newSkippable))
    {
        juce::Logger::writeToLog("[WordTables] \"skippable\" must be an array of strings");
        return false;
    }

    const juce::var fillerVar = parsed.getProperty("filler", juce::var());
    if (!fillerVar.isVoid() && !toStrings(fillerVar, newFillers))
    {
        juce::Logger::writeToLog("[WordTables] \"filler\" must be an array of strings");
        return false;
    }

    for (const auto& entry : newEquivalents)
        addEquivalents(entry.first, entry.second);

    for (const auto& word : newSkippable)
        addSkippable(word);

    for (const auto& word : newFillers)
        addFiller(word);

    juce::Logger::writeToLog("[WordTables] Merged " + juce::String((int)newEquivalents.size())
        + " equivalence groups, " + juce::String((int)newSkippable.size()) + " skippable, "
        + juce::String((int)newFillers.size()) + " filler");

    return true;
}
