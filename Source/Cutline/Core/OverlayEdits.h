#pragma once

#include "Cutline/Public/Action.h"
#include "Cutline/Public/Types.h"
#include <optional>
#include <utility>
#include <vector>

namespace Cutline::Core::OverlayEdits
{
    struct SplitResult
    {
        OverlayModel first;                   // keeps the original id
        OverlayModel second;
    };

    bool isValidSplitFrame(const OverlayModel& overlay, FrameIndex atFrame) noexcept;

    // Peaks are partitioned at floor(firstFrames / totalFrames * peakCount).
    std::pair<WaveformData, WaveformData> splitWaveform(const WaveformData& waveform,
                                                        FrameIndex firstFrames,
                                                        FrameIndex totalFrames);

    std::optional<SplitResult> splitOverlay(const OverlayModel& overlay,
                                            OverlayId newId,
                                            FrameIndex atFrame,
                                            int fps);

    // Places the copy on the same row, right after the source or after the
    // latest-ending conflict.
    OverlayModel duplicateOverlay(const std::vector<OverlayModel>& overlays,
                                  const OverlayModel& source,
                                  OverlayId newId);

    void mergeStyles(PropertyBag& styles, const PropertyBag& patch);

    OverlayModel applyPatch(const OverlayModel& overlay, const OverlayPatch& patch);
}
