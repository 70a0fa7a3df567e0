#include "Cutline/Core/OverlayEdits.h"

#include "Cutline/Core/Captions.h"
#include "Cutline/Core/Geometry.h"
#include "Cutline/Core/RowLayout.h"
#include <cmath>

namespace Cutline::Core::OverlayEdits
{
    bool isValidSplitFrame(const OverlayModel& overlay, FrameIndex atFrame) noexcept
    {
        return overlay.from < atFrame && atFrame < overlay.endFrame();
    }

    std::pair<WaveformData, WaveformData> splitWaveform(const WaveformData& waveform,
                                                        FrameIndex firstFrames,
                                                        FrameIndex totalFrames)
    {
        WaveformData head;
        WaveformData tail;
        if (totalFrames <= 0)
            return { head, waveform };

        const auto ratio = static_cast<double>(firstFrames) / static_cast<double>(totalFrames);
        const auto tailRatio = static_cast<double>(totalFrames - firstFrames) / static_cast<double>(totalFrames);
        const auto peakCount = waveform.peaks.size();
        const auto splitIndex = juce::jlimit<size_t>(0,
                                                     peakCount,
                                                     static_cast<size_t>(std::floor(ratio * static_cast<double>(peakCount))));

        head.peaks.assign(waveform.peaks.begin(), waveform.peaks.begin() + static_cast<std::ptrdiff_t>(splitIndex));
        tail.peaks.assign(waveform.peaks.begin() + static_cast<std::ptrdiff_t>(splitIndex), waveform.peaks.end());
        head.length = static_cast<int>(std::floor(waveform.length * ratio));
        tail.length = static_cast<int>(std::floor(waveform.length * tailRatio));
        return { head, tail };
    }

    std::optional<SplitResult> splitOverlay(const OverlayModel& overlay,
                                            OverlayId newId,
                                            FrameIndex atFrame,
                                            int fps)
    {
        if (!isValidSplitFrame(overlay, atFrame) || fps <= 0)
            return std::nullopt;

        const auto firstFrames = atFrame - overlay.from;
        const auto secondFrames = overlay.durationInFrames - firstFrames;
        const auto firstSeconds = Geometry::framesToSeconds(firstFrames, fps);

        SplitResult result { overlay, overlay };
        result.first.durationInFrames = firstFrames;
        result.second.id = newId;
        result.second.from = atFrame;
        result.second.durationInFrames = secondFrames;

        if (auto* video = std::get_if<VideoContent>(&result.second.payload))
        {
            video->videoStartTime += firstSeconds;
        }
        else if (auto* sound = std::get_if<SoundContent>(&result.second.payload))
        {
            sound->startFromSound += firstSeconds;

            if (sound->waveform.has_value())
            {
                auto halves = splitWaveform(*sound->waveform, firstFrames, overlay.durationInFrames);
                std::get<SoundContent>(result.first.payload).waveform = std::move(halves.first);
                sound->waveform = std::move(halves.second);
            }
        }
        else if (auto* caption = std::get_if<CaptionContent>(&result.second.payload))
        {
            const auto offsetMs = Geometry::framesToMs(firstFrames, fps);
            auto parts = Captions::splitCaptions(caption->captions, offsetMs);
            std::get<CaptionContent>(result.first.payload).captions = std::move(parts.first);
            caption->captions = std::move(parts.second);
        }

        return result;
    }

    OverlayModel duplicateOverlay(const std::vector<OverlayModel>& overlays,
                                  const OverlayModel& source,
                                  OverlayId newId)
    {
        auto copy = source;
        copy.id = newId;
        copy.from = RowLayout::resolveFreeStart(overlays, source.row, source.endFrame(), source.durationInFrames);
        return copy;
    }

    void mergeStyles(PropertyBag& styles, const PropertyBag& patch)
    {
        for (int i = 0; i < patch.size(); ++i)
            styles.set(patch.getName(i), patch.getValueAt(i));
    }

    OverlayModel applyPatch(const OverlayModel& overlay, const OverlayPatch& patch)
    {
        auto next = overlay;

        if (patch.from.has_value())
            next.from = *patch.from;
        if (patch.durationInFrames.has_value())
            next.durationInFrames = *patch.durationInFrames;
        if (patch.row.has_value())
            next.row = *patch.row;
        if (patch.bounds.has_value())
            next.bounds = *patch.bounds;
        if (patch.rotation.has_value())
            next.rotation = *patch.rotation;
        if (patch.payload.has_value())
            next.payload = *patch.payload;

        mergeStyles(next.styles, patch.styles);
        return next;
    }
}
