#pragma once

#include "Cutline/Core/Captions.h"
#include "Cutline/Core/Geometry.h"
#include "Cutline/Core/RowLayout.h"
#include "Cutline/Public/Types.h"
#include <cmath>
#include <unordered_set>
#include <vector>

namespace Cutline::Core::OverlayValidator
{
    inline bool isFiniteNonNegative(double value) noexcept
    {
        return std::isfinite(value) && value >= 0.0;
    }

    inline juce::Result validateSchemaVersion(const SchemaVersion& version)
    {
        const auto current = currentSchemaVersion();
        if (version.major != current.major)
            return juce::Result::fail("schema.major mismatch");

        if (compareSchemaVersion(version, current) > 0)
            return juce::Result::fail("schema is newer than runtime");

        return juce::Result::ok();
    }

    inline juce::Result validateStyles(const PropertyBag& styles)
    {
        auto hasCropKey = false;

        for (int i = 0; i < styles.size(); ++i)
        {
            const auto key = styles.getName(i);
            const auto& value = styles.getValueAt(i);

            if (!isScalarVar(value) && !isFlatObjectVar(value))
                return juce::Result::fail("styles." + key.toString() + " must be a scalar or a flat object");

            if (isCropStyleKey(key))
            {
                if (!isNumericVar(value))
                    return juce::Result::fail("styles." + key.toString() + " must be numeric");
                hasCropKey = true;
            }
        }

        if (const auto* opacity = styles.getVarPointer(StyleKeys::opacity))
        {
            if (isNumericVar(*opacity))
            {
                const auto v = static_cast<double>(*opacity);
                if (!std::isfinite(v) || v < 0.0 || v > 1.0)
                    return juce::Result::fail("styles.opacity must be within [0, 1]");
            }
        }

        for (const auto* key : { &StyleKeys::volume, &StyleKeys::fadeIn, &StyleKeys::fadeOut })
        {
            if (const auto* value = styles.getVarPointer(*key))
            {
                if (isNumericVar(*value) && !isFiniteNonNegative(static_cast<double>(*value)))
                    return juce::Result::fail("styles." + key->toString() + " must be >= 0");
            }
        }

        if (hasCropKey)
        {
            const auto crop = Geometry::validateCrop(Geometry::cropFromStyles(styles));
            if (crop.failed())
                return crop;
        }

        return juce::Result::ok();
    }

    inline juce::Result validatePayload(const OverlayPayload& payload)
    {
        if (const auto* video = std::get_if<VideoContent>(&payload))
        {
            if (!isFiniteNonNegative(video->videoStartTime))
                return juce::Result::fail("video.videoStartTime must be >= 0");
            if (!std::isfinite(video->speed) || video->speed <= 0.0)
                return juce::Result::fail("video.speed must be > 0");
            if (video->mediaSrcDuration.has_value() && !isFiniteNonNegative(*video->mediaSrcDuration))
                return juce::Result::fail("video.mediaSrcDuration must be >= 0");
        }
        else if (const auto* sound = std::get_if<SoundContent>(&payload))
        {
            if (!isFiniteNonNegative(sound->startFromSound))
                return juce::Result::fail("sound.startFromSound must be >= 0");
            if (sound->mediaSrcDuration.has_value() && !isFiniteNonNegative(*sound->mediaSrcDuration))
                return juce::Result::fail("sound.mediaSrcDuration must be >= 0");
            if (sound->waveform.has_value() && sound->waveform->length < 0)
                return juce::Result::fail("sound.waveform.length must be >= 0");
        }
        else if (const auto* caption = std::get_if<CaptionContent>(&payload))
        {
            return Captions::validateCaptions(caption->captions);
        }

        return juce::Result::ok();
    }

    inline juce::Result validateOverlay(const OverlayModel& overlay)
    {
        if (overlay.id < kFirstOverlayId)
            return juce::Result::fail("overlay.id must be >= 0");
        if (overlay.from < 0)
            return juce::Result::fail("overlay.from must be >= 0");
        if (overlay.durationInFrames < 1)
            return juce::Result::fail("overlay.durationInFrames must be >= 1");
        if (!frameRangeFits(overlay.from, overlay.durationInFrames))
            return juce::Result::fail("overlay end frame is out of range");
        if (overlay.row < 0)
            return juce::Result::fail("overlay.row must be >= 0");
        if (overlay.bounds.getWidth() < 0 || overlay.bounds.getHeight() < 0)
            return juce::Result::fail("overlay width/height must be >= 0");
        if (!std::isfinite(overlay.rotation))
            return juce::Result::fail("overlay.rotation must be finite");

        const auto styles = validateStyles(overlay.styles);
        if (styles.failed())
            return styles;

        return validatePayload(overlay.payload);
    }

    inline juce::Result validateOverlays(const std::vector<OverlayModel>& overlays)
    {
        std::unordered_set<OverlayId> ids;
        for (const auto& overlay : overlays)
        {
            const auto check = validateOverlay(overlay);
            if (check.failed())
                return juce::Result::fail("overlay " + juce::String(overlay.id) + ": " + check.getErrorMessage());

            if (!ids.insert(overlay.id).second)
                return juce::Result::fail("duplicate overlay id " + juce::String(overlay.id));
        }

        return RowLayout::validateRowsDoNotOverlap(overlays);
    }

    inline juce::Result validateTimeline(const TimelineModel& timeline)
    {
        const auto schemaCheck = validateSchemaVersion(timeline.schemaVersion);
        if (schemaCheck.failed())
            return schemaCheck;

        return validateOverlays(timeline.overlays);
    }

    inline juce::Result validateComposition(const CompositionProps& props)
    {
        if (props.durationInFrames < 1)
            return juce::Result::fail("composition.durationInFrames must be a positive integer");
        if (props.width < 1 || props.height < 1)
            return juce::Result::fail("composition width/height must be positive integers");
        if (props.fps < 1)
            return juce::Result::fail("composition.fps must be a positive integer");

        return validateOverlays(props.overlays);
    }
}
