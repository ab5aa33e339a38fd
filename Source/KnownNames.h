/*
  ==============================================================================

    KnownNames.h
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Character names eligible for fuzzy matching regardless of casing.

    Usage:
        auto names = KnownNames::fromCharacterNames({ "Dr. Frank Robinavitch" });
        aligner.checkAccuracy(line, transcript, false, &names);

  ==============================================================================
*/

#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

class KnownNames
{
public:
    KnownNames() = default;

    /**
        Build the name set from full character names.

        Each name is lower-cased and stripped of punctuation; every part of
        two or more characters becomes a known name
        ("Dr. Frank Robinavitch" -> dr, frank, robinavitch).
    */
    static KnownNames fromCharacterNames(const std::vector<std::string>& characterNames)
    {
        KnownNames names;

        for (const auto& fullName : characterNames)
        {
            std::string cleaned;
            for (char c : fullName)
            {
                unsigned char uc = static_cast<unsigned char>(c);
                if (uc < 128 && (std::isalnum(uc) || c == '_'))
                    cleaned += (char)std::tolower(uc);
                else if (std::isspace(uc))
                    cleaned += ' ';
            }

            std::istringstream iss(cleaned);
            std::string part;
            while (iss >> part)
            {
                if (part.length() >= 2)
                    names.names.insert(part);
            }
        }

        return names;
    }

    void add(const std::string& name)
    {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](char c) { return (char)std::tolower(static_cast<unsigned char>(c)); });
        if (!lower.empty())
            names.insert(lower);
    }

    /** @param normalizedWord   Lower-case word as produced by TextNormalizer */
    bool contains(const std::string& normalizedWord) const
    {
        return names.find(normalizedWord) != names.end();
    }

    bool isEmpty() const { return names.empty(); }
    size_t size() const { return names.size(); }

private:
    std::unordered_set<std::string> names;
};
