#pragma once

#include "Cutline/Public/Types.h"
#include <vector>

namespace Cutline::Geometry
{
    constexpr double kCanvasMatchTolerance = 0.01;

    CanvasSize canvasForAspectRatio(AspectRatio ratio) noexcept;

    // Unknown identifiers map to the 1920x1080 fallback canvas.
    CanvasSize canvasForAspectRatioKey(const juce::String& key);

    // Frame/time conversions. fps is always explicit.
    double framesToSeconds(FrameIndex frames, int fps) noexcept;
    double framesToMs(FrameIndex frames, int fps) noexcept;
    // Saturates at +/- kMaxFrame.
    FrameIndex secondsToFrames(double seconds, int fps) noexcept;

    CropRect cropFromStyles(const PropertyBag& styles);
    void writeCropToStyles(PropertyBag& styles, const CropRect& crop);
    juce::Result validateCrop(const CropRect& crop);
    CropRect normaliseCrop(CropRect crop) noexcept;

    juce::String clipPathFor(double x, double y, double width, double height);
    bool hasActiveCrop(const OverlayModel& overlay);

    // Visible sub-rectangle after the crop, used for selection outlines.
    juce::Rectangle<int> effectiveBounds(const OverlayModel& overlay);

    // Bakes the crop into the bounds and resets the crop to the full frame.
    OverlayModel withCropApplied(const OverlayModel& overlay);

    bool canvasesMatch(CanvasSize lhs, CanvasSize rhs, double tolerance = kCanvasMatchTolerance) noexcept;

    OverlayModel resizeOverlay(const OverlayModel& overlay, CanvasSize oldCanvas, CanvasSize newCanvas);
    std::vector<OverlayModel> resizeOverlays(const std::vector<OverlayModel>& overlays,
                                             CanvasSize oldCanvas,
                                             CanvasSize newCanvas);
}
