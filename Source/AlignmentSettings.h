/*
  ==============================================================================

    AlignmentSettings.h
    Created: 11 Dec 2024
    Author: Explicitly Audio Systems

    Tunable thresholds for word comparison and line alignment.

    File format (JSON, every key optional):
        {
            "strictMode": false,
            "lookAheadWindow": 3,
            "nameSimilarityThreshold": 0.80,
            "prefixScale": 0.1,
            "freezeOnError": true
        }

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>

struct AlignmentSettings
{
    bool strictMode = false;                // Zero tolerance for missing/extra words
    int lookAheadWindow = 3;                // Words searched ahead to classify a mismatch
    double nameSimilarityThreshold = 0.80;  // Jaro-Winkler floor for proper nouns
    double prefixScale = 0.1;               // Winkler prefix bonus
    bool freezeOnError = true;              // Locked progress stays frozen after a mismatch

    /**
        Load settings from a JSON file. Keys that are absent keep their
        current values.

        @param settingsFile     JSON settings file
        @return                 true if the file was read and parsed
    */
    bool loadFromFile(const juce::File& settingsFile);

    /**
        Apply settings from a JSON string.
    */
    bool loadFromJson(const juce::String& json);
};
