/*
  ==============================================================================

    AlignmentSettings.cpp
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

  ==============================================================================
*/

#include "AlignmentSettings.h"

bool AlignmentSettings::loadFromFile(const juce::File& settingsFile)
{
    if (!settingsFile.existsAsFile())
    {
        juce::Logger::writeToLog("[Settings] ERROR: Settings file not found: "
            + settingsFile.getFullPathName());
        return false;
    }

    if (!loadFromJson(settingsFile.loadFileAsString()))
    {
        juce::Logger::writeToLog("[Settings] ERROR: Could not apply " + settingsFile.getFullPathName());
        return false;
    }

    juce::Logger::writeToLog("[Settings] Loaded " + settingsFile.getFullPathName());
    return true;
}

bool AlignmentSettings::loadFromJson(const juce::String& json)
{
    juce::var parsed;
    juce::Result result = juce::JSON::parse(json, parsed);

    if (result.failed())
    {
        juce::Logger::writeToLog("[Settings] Invalid JSON: " + result.getErrorMessage());
        return false;
    }

    auto* object = parsed.getDynamicObject();

    if (object == nullptr)
    {
        juce::Logger::writeToLog("[Settings] Expected a JSON object");
        return false;
    }

    // Applied only if every value is valid
    AlignmentSettings updated = *this;

    for (const auto& property : object->getProperties())
    {
        const juce::String key = property.name.toString();
        const juce::var& value = property.value;

        if (key == "strictMode" && value.isBool())
        {
            updated.strictMode = (bool)value;
        }
        else if (key == "freezeOnError" && value.isBool())
        {
            updated.freezeOnError = (bool)value;
        }
        else if (key == "lookAheadWindow" && (value.isInt() || value.isInt64()))
        {
            int window = (int)value;
            if (window < 0)
            {
                juce::Logger::writeToLog("[Settings] lookAheadWindow must not be negative");
                return false;
            }
            updated.lookAheadWindow = window;
        }
        else if (key == "nameSimilarityThreshold" && (value.isDouble() || value.isInt()))
        {
            double threshold = (double)value;
            if (threshold < 0.0 || threshold > 1.0)
            {
                juce::Logger::writeToLog("[Settings] nameSimilarityThreshold must be within 0..1");
                return false;
            }
            updated.nameSimilarityThreshold = threshold;
        }
        else if (key == "prefixScale" && (value.isDouble() || value.isInt()))
        {
            double scale = (double)value;
            if (scale < 0.0 || scale > 0.25)
            {
                juce::Logger::writeToLog("[Settings] prefixScale must be within 0..0.25");
                return false;
            }
            updated.prefixScale = scale;
        }
        else
        {
            juce::Logger::writeToLog("[Settings] Ignoring key: " + key);
        }
    }

    *this = updated;
    return true;
}
