#pragma once

#include "Cutline/Public/Types.h"
#include <juce_data_structures/juce_data_structures.h>

namespace Cutline
{
    struct EditorSettings
    {
        int fps = kDefaultFps;
        int autosaveIntervalMs = 10000;
        int pollingIntervalMs = 1000;
        int initialDelayMs = 0;
        int firstPollDelayMs = 100;
        AspectRatio defaultAspectRatio = AspectRatio::widescreen;
        juce::String backgroundColor { "white" };
        int historyLimit = 256;
        juce::String rendererBaseUrl;

        static juce::PropertiesFile::Options defaultFileOptions();

        // Missing or malformed entries keep their defaults.
        static EditorSettings loadFrom(const juce::PropertiesFile& file);
        void saveTo(juce::PropertiesFile& file) const;

        juce::Result validate() const;
    };
}
