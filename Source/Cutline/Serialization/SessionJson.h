#pragma once

#include "Cutline/Public/Types.h"
#include <vector>

namespace Cutline::Serialization
{
    juce::var serializeOverlay(const OverlayModel& overlay);
    juce::Result parseOverlay(const juce::var& value, OverlayModel& overlayOut);

    juce::var serializeOverlays(const std::vector<OverlayModel>& overlays);
    juce::Result parseOverlays(const juce::var& value, std::vector<OverlayModel>& overlaysOut);

    juce::var serializeSessionState(const SessionStateModel& state);
    juce::Result parseSessionState(const juce::var& value, SessionStateModel& stateOut);

    juce::var serializeCompositionProps(const CompositionProps& props);
    juce::Result compositionPropsToJsonString(const CompositionProps& props, juce::String& jsonOut);

    juce::Result serializeSessionRecordToJsonString(const SavedSessionRecord& record, juce::String& jsonOut);
    juce::Result parseSessionRecordFromJsonString(const juce::String& json, SavedSessionRecord& recordOut);

    juce::Result saveSessionRecordToFile(const juce::File& file, const SavedSessionRecord& record);
    juce::Result loadSessionRecordFromFile(const juce::File& file, SavedSessionRecord& recordOut);
}
