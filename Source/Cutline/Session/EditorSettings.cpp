#include "Cutline/Public/EditorSettings.h"

namespace
{
    namespace Keys
    {
        constexpr auto fps = "fps";
        constexpr auto autosaveIntervalMs = "autosaveIntervalMs";
        constexpr auto pollingIntervalMs = "pollingIntervalMs";
        constexpr auto initialDelayMs = "initialDelayMs";
        constexpr auto firstPollDelayMs = "firstPollDelayMs";
        constexpr auto defaultAspectRatio = "defaultAspectRatio";
        constexpr auto backgroundColor = "backgroundColor";
        constexpr auto historyLimit = "historyLimit";
        constexpr auto rendererBaseUrl = "rendererBaseUrl";
    }

    int readInt(const juce::PropertiesFile& file, const char* key, int fallback, int minimum)
    {
        if (!file.containsKey(key))
            return fallback;

        const auto text = file.getValue(key).trim();
        if (text.isEmpty() || !text.containsOnly("-0123456789"))
        {
            DBG("[Cutline][Settings] ignoring malformed " + juce::String(key) + "=" + text);
            return fallback;
        }

        const auto value = text.getIntValue();
        return value >= minimum ? value : fallback;
    }
}

namespace Cutline
{
    juce::PropertiesFile::Options EditorSettings::defaultFileOptions()
    {
        juce::PropertiesFile::Options options;
        options.applicationName = "Cutline";
        options.folderName = "Cutline";
        options.filenameSuffix = "settings";
        options.osxLibrarySubFolder = "Application Support";
        return options;
    }

    EditorSettings EditorSettings::loadFrom(const juce::PropertiesFile& file)
    {
        EditorSettings settings;
        settings.fps = readInt(file, Keys::fps, settings.fps, 1);
        settings.autosaveIntervalMs = readInt(file, Keys::autosaveIntervalMs, settings.autosaveIntervalMs, 0);
        settings.pollingIntervalMs = readInt(file, Keys::pollingIntervalMs, settings.pollingIntervalMs, 0);
        settings.initialDelayMs = readInt(file, Keys::initialDelayMs, settings.initialDelayMs, 0);
        settings.firstPollDelayMs = readInt(file, Keys::firstPollDelayMs, settings.firstPollDelayMs, 0);
        settings.historyLimit = readInt(file, Keys::historyLimit, settings.historyLimit, 1);

        if (file.containsKey(Keys::defaultAspectRatio))
        {
            if (const auto ratio = aspectRatioFromKey(file.getValue(Keys::defaultAspectRatio)))
                settings.defaultAspectRatio = *ratio;
            else
                DBG("[Cutline][Settings] unknown defaultAspectRatio " + file.getValue(Keys::defaultAspectRatio));
        }

        settings.backgroundColor = file.getValue(Keys::backgroundColor, settings.backgroundColor);
        settings.rendererBaseUrl = file.getValue(Keys::rendererBaseUrl, settings.rendererBaseUrl).trim();
        return settings;
    }

    void EditorSettings::saveTo(juce::PropertiesFile& file) const
    {
        file.setValue(Keys::fps, fps);
        file.setValue(Keys::autosaveIntervalMs, autosaveIntervalMs);
        file.setValue(Keys::pollingIntervalMs, pollingIntervalMs);
        file.setValue(Keys::initialDelayMs, initialDelayMs);
        file.setValue(Keys::firstPollDelayMs, firstPollDelayMs);
        file.setValue(Keys::defaultAspectRatio, aspectRatioToKey(defaultAspectRatio));
        file.setValue(Keys::backgroundColor, backgroundColor);
        file.setValue(Keys::historyLimit, historyLimit);
        file.setValue(Keys::rendererBaseUrl, rendererBaseUrl);
    }

    juce::Result EditorSettings::validate() const
    {
        if (fps < 1)
            return juce::Result::fail("fps must be >= 1");
        if (autosaveIntervalMs < 0 || pollingIntervalMs < 0 || initialDelayMs < 0 || firstPollDelayMs < 0)
            return juce::Result::fail("timing settings must be >= 0");
        if (historyLimit < 1)
            return juce::Result::fail("historyLimit must be >= 1");

        return juce::Result::ok();
    }
}
