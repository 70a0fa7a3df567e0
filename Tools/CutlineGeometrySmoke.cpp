#include <juce_core/juce_core.h>

#include "Cutline/Core/Geometry.h"
#include "Cutline/Core/OverlayValidator.h"
#include "SmokeSupport.h"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <vector>

namespace
{
    using CutlineSmoke::makeTextOverlay;
    using CutlineSmoke::nearlyEqual;

    const std::vector<Cutline::AspectRatio>& supportedRatios()
    {
        static const std::vector<Cutline::AspectRatio> ratios {
            Cutline::AspectRatio::widescreen,
            Cutline::AspectRatio::square,
            Cutline::AspectRatio::portraitMedium,
            Cutline::AspectRatio::portraitLong
        };
        return ratios;
    }

    std::vector<Cutline::OverlayModel> sampleOverlays()
    {
        return {
            makeTextOverlay(0, 30, 0, { 640, 360, 100, 50 }),
            makeTextOverlay(0, 30, 1, { 0, 0, 1280, 720 }),
            makeTextOverlay(0, 30, 2, { 13, 701, 7, 3 }),
            makeTextOverlay(0, 30, 3, { 1279, 1, 1, 719 }),
            makeTextOverlay(0, 30, 4, { 333, 222, 111, 555 })
        };
    }

    juce::Result testCanvasTable()
    {
        const std::vector<std::pair<juce::String, Cutline::CanvasSize>> expected {
            { "16:9", { 1280, 720 } },
            { "1:1", { 1080, 1080 } },
            { "4:5", { 1080, 1350 } },
            { "9:16", { 1080, 1920 } },
            { "21:9", { 1920, 1080 } },
            { "", { 1920, 1080 } }
        };

        for (const auto& [key, canvas] : expected)
        {
            const auto actual = Cutline::Geometry::canvasForAspectRatioKey(key);
            if (actual != canvas)
                return juce::Result::fail("canvas for \"" + key + "\" is " + juce::String(actual.width) + "x" + juce::String(actual.height));
        }

        for (const auto ratio : supportedRatios())
        {
            if (Cutline::aspectRatioFromKey(Cutline::aspectRatioToKey(ratio)) != ratio)
                return juce::Result::fail("aspect ratio key must round trip");
        }

        if (!Cutline::Geometry::canvasesMatch({ 1280, 720 }, { 1285, 722 }))
            return juce::Result::fail("canvases within 1% must match");
        if (Cutline::Geometry::canvasesMatch({ 1280, 720 }, { 1080, 1920 }))
            return juce::Result::fail("different canvases must not match");

        return juce::Result::ok();
    }

    juce::Result testLandscapeToPortrait()
    {
        const auto overlay = makeTextOverlay(0, 30, 0, { 640, 360, 100, 50 });
        const auto resized = Cutline::Geometry::resizeOverlay(overlay, { 1280, 720 }, { 1080, 1920 });

        if (resized.bounds != juce::Rectangle<int> { 540, 960, 84, 133 })
            return juce::Result::fail("expected 540,960,84,133 but got " + resized.bounds.toString());
        if (resized.from != overlay.from || resized.durationInFrames != overlay.durationInFrames || resized.row != overlay.row)
            return juce::Result::fail("resize must only touch geometry");

        return juce::Result::ok();
    }

    juce::Result testIdentityResize()
    {
        const auto overlays = sampleOverlays();
        const auto resized = Cutline::Geometry::resizeOverlays(overlays, { 1280, 720 }, { 1280, 720 });

        if (resized.size() != overlays.size())
            return juce::Result::fail("identity resize changed the overlay count");

        for (size_t i = 0; i < overlays.size(); ++i)
        {
            if (resized[i].bounds != overlays[i].bounds)
                return juce::Result::fail("identity resize changed overlay " + juce::String(static_cast<int>(i)));
        }

        return juce::Result::ok();
    }

    juce::Result testRoundTripWithinOnePixel()
    {
        const auto original = sampleOverlays();

        for (const auto from : supportedRatios())
        {
            for (const auto to : supportedRatios())
            {
                const auto a = Cutline::Geometry::canvasForAspectRatio(from);
                const auto b = Cutline::Geometry::canvasForAspectRatio(to);
                const auto back = Cutline::Geometry::resizeOverlays(Cutline::Geometry::resizeOverlays(original, a, b), b, a);

                for (size_t i = 0; i < original.size(); ++i)
                {
                    const auto& lhs = original[i].bounds;
                    const auto& rhs = back[i].bounds;
                    if (std::abs(lhs.getX() - rhs.getX()) > 1 || std::abs(lhs.getY() - rhs.getY()) > 1
                        || std::abs(lhs.getWidth() - rhs.getWidth()) > 1 || std::abs(lhs.getHeight() - rhs.getHeight()) > 1)
                    {
                        return juce::Result::fail(Cutline::aspectRatioToKey(from) + " -> " + Cutline::aspectRatioToKey(to)
                                                  + " drifted: " + lhs.toString() + " vs " + rhs.toString());
                    }
                }
            }
        }

        return juce::Result::ok();
    }

    juce::Result testDefaultCropIsNoOp()
    {
        auto overlay = makeTextOverlay(0, 30, 0, { 17, 29, 311, 97 });
        if (Cutline::Geometry::effectiveBounds(overlay) != overlay.bounds)
            return juce::Result::fail("missing crop must leave bounds untouched");
        if (Cutline::Geometry::hasActiveCrop(overlay))
            return juce::Result::fail("missing crop must not count as active");

        Cutline::Geometry::writeCropToStyles(overlay.styles, {});
        if (Cutline::Geometry::effectiveBounds(overlay) != overlay.bounds)
            return juce::Result::fail("default crop must leave bounds untouched");
        if (overlay.styles[Cutline::StyleKeys::clipPath].toString() != "inset(0% 0% 0% 0%)")
            return juce::Result::fail("default crop clip path mismatch: " + overlay.styles[Cutline::StyleKeys::clipPath].toString());

        // Zero extents are treated as unset.
        overlay.styles.set(Cutline::StyleKeys::cropWidth, 0);
        overlay.styles.set(Cutline::StyleKeys::cropHeight, 0);
        if (Cutline::Geometry::effectiveBounds(overlay) != overlay.bounds)
            return juce::Result::fail("zero crop extent must fall back to the full frame");

        return juce::Result::ok();
    }

    juce::Result testCropGeometry()
    {
        auto overlay = makeTextOverlay(0, 30, 0, { 100, 200, 400, 300 });
        Cutline::Geometry::writeCropToStyles(overlay.styles, { 12.5, 20.0, 50.0, 25.0 });

        if (overlay.styles[Cutline::StyleKeys::clipPath].toString() != "inset(20% 37.5% 55% 12.5%)")
            return juce::Result::fail("clip path mismatch: " + overlay.styles[Cutline::StyleKeys::clipPath].toString());

        const auto visible = Cutline::Geometry::effectiveBounds(overlay);
        if (visible != juce::Rectangle<int> { 150, 260, 200, 75 })
            return juce::Result::fail("effective bounds mismatch: " + visible.toString());

        if (Cutline::Core::OverlayValidator::validateOverlay(overlay).failed())
            return juce::Result::fail("valid crop rejected");

        const auto applied = Cutline::Geometry::withCropApplied(overlay);
        if (applied.bounds != visible)
            return juce::Result::fail("applying the crop must move the bounds to the visible area");
        if (Cutline::Geometry::hasActiveCrop(applied))
            return juce::Result::fail("applied crop must reset to the full frame");
        if (applied.styles[Cutline::StyleKeys::clipPath].toString() != "none")
            return juce::Result::fail("applied crop must clear the clip path");

        if (Cutline::Geometry::validateCrop({ -1.0, 0.0, 50.0, 50.0 }).wasOk()
            || Cutline::Geometry::validateCrop({ 0.0, 0.0, 0.0, 50.0 }).wasOk()
            || Cutline::Geometry::validateCrop({ 0.0, 60.0, 100.0, 50.0 }).wasOk())
            return juce::Result::fail("out-of-range crops must be rejected");

        const auto third = 100.0 / 3.0;
        if (Cutline::Geometry::validateCrop({ third + third, 0.0, third, 100.0 }).failed()
            || Cutline::Geometry::validateCrop({ 40.0, 0.0, 60.0 + 1.0e-12, 100.0 }).failed())
            return juce::Result::fail("crops that add up to 100 within rounding must be accepted");
        if (Cutline::Geometry::validateCrop({ 40.0, 0.0, 60.001, 100.0 }).wasOk())
            return juce::Result::fail("crops past 100 by more than rounding must be rejected");

        const auto normalised = Cutline::Geometry::normaliseCrop({ 80.0, -5.0, 50.0, 120.0 });
        if (!nearlyEqual(normalised.x, 80.0) || !nearlyEqual(normalised.y, 0.0)
            || !nearlyEqual(normalised.width, 20.0) || !nearlyEqual(normalised.height, 100.0))
            return juce::Result::fail("normaliseCrop must clamp into the frame");

        return juce::Result::ok();
    }

    juce::Result testFrameConversions()
    {
        if (!nearlyEqual(Cutline::Geometry::framesToSeconds(45, 30), 1.5))
            return juce::Result::fail("45 frames at 30 fps must be 1.5 s");
        if (!nearlyEqual(Cutline::Geometry::framesToMs(15, 30), 500.0))
            return juce::Result::fail("15 frames at 30 fps must be 500 ms");
        if (Cutline::Geometry::secondsToFrames(2.5, 24) != 60)
            return juce::Result::fail("2.5 s at 24 fps must be 60 frames");
        if (Cutline::Geometry::framesToSeconds(10, 0) != 0.0 || Cutline::Geometry::secondsToFrames(1.0, 0) != 0)
            return juce::Result::fail("non-positive fps must yield zero");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Canvas table", testCanvasTable },
        { "Landscape to portrait", testLandscapeToPortrait },
        { "Identity resize", testIdentityResize },
        { "Round trip within one pixel", testRoundTripWithinOnePixel },
        { "Default crop is a no-op", testDefaultCropIsNoOp },
        { "Crop geometry", testCropGeometry },
        { "Frame conversions", testFrameConversions }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Cutline geometry smoke passed." << std::endl;
    return 0;
}
