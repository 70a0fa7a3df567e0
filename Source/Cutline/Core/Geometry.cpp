#include "Cutline/Core/Geometry.h"

#include <cmath>

namespace
{
    // Slack for fractional percentages that add up to 100.
    constexpr double kCropTolerance = 1.0e-9;

    double readPercent(const Cutline::PropertyBag& styles, const juce::Identifier& key, double fallback)
    {
        const auto* value = styles.getVarPointer(key);
        if (value == nullptr || !Cutline::isNumericVar(*value))
            return fallback;

        const auto parsed = static_cast<double>(*value);
        return std::isfinite(parsed) ? parsed : fallback;
    }

    juce::String formatPercent(double value)
    {
        if (std::abs(value - std::round(value)) < 1.0e-9)
            return juce::String(static_cast<juce::int64>(std::llround(value)));

        return juce::String(value, 4).trimCharactersAtEnd("0").trimCharactersAtEnd(".");
    }

    // Half-up rounding, matching how pixel positions are rounded in saved documents.
    int roundHalfUp(double value) noexcept
    {
        return static_cast<int>(std::floor(value + 0.5));
    }

    bool isPercent(double value) noexcept
    {
        return std::isfinite(value) && value >= 0.0 && value <= 100.0;
    }

    int scaled(int value, double scale) noexcept
    {
        return roundHalfUp(static_cast<double>(value) * scale);
    }
}

namespace Cutline::Geometry
{
    CanvasSize canvasForAspectRatio(AspectRatio ratio) noexcept
    {
        switch (ratio)
        {
            case AspectRatio::portraitLong: return { 1080, 1920 };
            case AspectRatio::portraitMedium: return { 1080, 1350 };
            case AspectRatio::square: return { 1080, 1080 };
            case AspectRatio::widescreen: return { 1280, 720 };
        }

        return { 1920, 1080 };
    }

    CanvasSize canvasForAspectRatioKey(const juce::String& key)
    {
        if (const auto ratio = aspectRatioFromKey(key))
            return canvasForAspectRatio(*ratio);

        return { 1920, 1080 };
    }

    double framesToSeconds(FrameIndex frames, int fps) noexcept
    {
        return fps > 0 ? static_cast<double>(frames) / static_cast<double>(fps) : 0.0;
    }

    double framesToMs(FrameIndex frames, int fps) noexcept
    {
        return framesToSeconds(frames, fps) * 1000.0;
    }

    FrameIndex secondsToFrames(double seconds, int fps) noexcept
    {
        if (!std::isfinite(seconds) || fps <= 0)
            return 0;

        const auto frames = std::round(seconds * static_cast<double>(fps));
        return static_cast<FrameIndex>(juce::jlimit(-static_cast<double>(kMaxFrame), static_cast<double>(kMaxFrame), frames));
    }

    CropRect cropFromStyles(const PropertyBag& styles)
    {
        CropRect crop;
        crop.x = readPercent(styles, StyleKeys::cropX, 0.0);
        crop.y = readPercent(styles, StyleKeys::cropY, 0.0);

        // A zero extent means "unset" in saved documents.
        const auto width = readPercent(styles, StyleKeys::cropWidth, 100.0);
        const auto height = readPercent(styles, StyleKeys::cropHeight, 100.0);
        crop.width = width > 0.0 ? width : 100.0;
        crop.height = height > 0.0 ? height : 100.0;
        return crop;
    }

    void writeCropToStyles(PropertyBag& styles, const CropRect& crop)
    {
        styles.set(StyleKeys::cropX, crop.x);
        styles.set(StyleKeys::cropY, crop.y);
        styles.set(StyleKeys::cropWidth, crop.width);
        styles.set(StyleKeys::cropHeight, crop.height);
        styles.set(StyleKeys::clipPath, clipPathFor(crop.x, crop.y, crop.width, crop.height));
    }

    juce::Result validateCrop(const CropRect& crop)
    {
        if (!isPercent(crop.x) || !isPercent(crop.y) || !isPercent(crop.width) || !isPercent(crop.height))
            return juce::Result::fail("crop values must be within [0, 100]");

        if (crop.width <= 0.0 || crop.height <= 0.0)
            return juce::Result::fail("crop extent must be positive");

        if (crop.x + crop.width > 100.0 + kCropTolerance || crop.y + crop.height > 100.0 + kCropTolerance)
            return juce::Result::fail("crop rectangle exceeds the frame");

        return juce::Result::ok();
    }

    CropRect normaliseCrop(CropRect crop) noexcept
    {
        const auto clampPercent = [](double value, double fallback)
        {
            return std::isfinite(value) ? juce::jlimit(0.0, 100.0, value) : fallback;
        };

        crop.x = clampPercent(crop.x, 0.0);
        crop.y = clampPercent(crop.y, 0.0);
        crop.width = juce::jmin(clampPercent(crop.width, 100.0), 100.0 - crop.x);
        crop.height = juce::jmin(clampPercent(crop.height, 100.0), 100.0 - crop.y);

        if (crop.width <= 0.0 || crop.height <= 0.0)
            return {};

        return crop;
    }

    juce::String clipPathFor(double x, double y, double width, double height)
    {
        const auto top = y;
        const auto right = 100.0 - (x + width);
        const auto bottom = 100.0 - (y + height);
        const auto left = x;

        return "inset(" + formatPercent(top) + "% "
             + formatPercent(right) + "% "
             + formatPercent(bottom) + "% "
             + formatPercent(left) + "%)";
    }

    bool hasActiveCrop(const OverlayModel& overlay)
    {
        return !cropFromStyles(overlay.styles).isDefault();
    }

    juce::Rectangle<int> effectiveBounds(const OverlayModel& overlay)
    {
        const auto crop = cropFromStyles(overlay.styles);
        if (crop.isDefault())
            return overlay.bounds;

        const auto width = static_cast<double>(overlay.bounds.getWidth());
        const auto height = static_cast<double>(overlay.bounds.getHeight());

        return { overlay.bounds.getX() + roundHalfUp(crop.x / 100.0 * width),
                 overlay.bounds.getY() + roundHalfUp(crop.y / 100.0 * height),
                 roundHalfUp(crop.width / 100.0 * width),
                 roundHalfUp(crop.height / 100.0 * height) };
    }

    OverlayModel withCropApplied(const OverlayModel& overlay)
    {
        auto result = overlay;
        result.bounds = effectiveBounds(overlay);
        writeCropToStyles(result.styles, {});
        result.styles.set(StyleKeys::clipPath, "none");
        return result;
    }

    bool canvasesMatch(CanvasSize lhs, CanvasSize rhs, double tolerance) noexcept
    {
        if (lhs == rhs)
            return true;
        if (lhs.width <= 0 || lhs.height <= 0)
            return false;

        const auto widthDelta = std::abs(static_cast<double>(lhs.width - rhs.width)) / lhs.width;
        const auto heightDelta = std::abs(static_cast<double>(lhs.height - rhs.height)) / lhs.height;
        return widthDelta <= tolerance && heightDelta <= tolerance;
    }

    OverlayModel resizeOverlay(const OverlayModel& overlay, CanvasSize oldCanvas, CanvasSize newCanvas)
    {
        if (oldCanvas.width <= 0 || oldCanvas.height <= 0)
            return overlay;

        const auto scaleX = static_cast<double>(newCanvas.width) / static_cast<double>(oldCanvas.width);
        const auto scaleY = static_cast<double>(newCanvas.height) / static_cast<double>(oldCanvas.height);

        auto result = overlay;
        result.bounds = { scaled(overlay.bounds.getX(), scaleX),
                          scaled(overlay.bounds.getY(), scaleY),
                          scaled(overlay.bounds.getWidth(), scaleX),
                          scaled(overlay.bounds.getHeight(), scaleY) };
        return result;
    }

    std::vector<OverlayModel> resizeOverlays(const std::vector<OverlayModel>& overlays,
                                             CanvasSize oldCanvas,
                                             CanvasSize newCanvas)
    {
        if (canvasesMatch(oldCanvas, newCanvas))
            return overlays;

        std::vector<OverlayModel> resized;
        resized.reserve(overlays.size());
        for (const auto& overlay : overlays)
            resized.push_back(resizeOverlay(overlay, oldCanvas, newCanvas));

        return resized;
    }
}
