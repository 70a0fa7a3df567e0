#pragma once

#include "Cutline/Public/Collaborators.h"
#include "Cutline/Public/Types.h"
#include <vector>

namespace Cutline::MediaDrop
{
    constexpr double kDefaultClipSeconds = 5.0;
    constexpr double kDefaultTextSeconds = 3.0;
    constexpr FrameIndex kDefaultImageFrames = 150;

    // Builds the overlay for a media item dropped on row at startFrame.
    // Supports video, image, sound and text. The id is left for the store.
    juce::Result createOverlay(const MediaDescriptor& media,
                               int row,
                               FrameIndex startFrame,
                               CanvasSize canvas,
                               int fps,
                               OverlayModel& overlayOut);

    // Caption track in the lower band of the canvas, long enough to show every caption.
    juce::Result createCaptionOverlay(std::vector<Caption> captions,
                                      int row,
                                      FrameIndex startFrame,
                                      CanvasSize canvas,
                                      int fps,
                                      OverlayModel& overlayOut);
}
