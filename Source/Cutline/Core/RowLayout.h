#pragma once

#include "Cutline/Public/Types.h"
#include <optional>
#include <vector>

namespace Cutline::Core::RowLayout
{
    struct Gap
    {
        FrameIndex start = 0;
        FrameIndex end = 0;
    };

    // Half-open interval test on [from, from + duration).
    bool intervalsOverlap(FrameIndex aFrom, FrameIndex aDuration,
                          FrameIndex bFrom, FrameIndex bDuration) noexcept;

    bool overlapsRow(const std::vector<OverlayModel>& overlays,
                     int row,
                     FrameIndex from,
                     FrameIndex duration,
                     std::optional<OverlayId> ignoreId = std::nullopt);

    // Advances from past every conflicting overlay on the row until the
    // interval fits. Conflicts are resolved by jumping to the latest end.
    FrameIndex resolveFreeStart(const std::vector<OverlayModel>& overlays,
                                int row,
                                FrameIndex from,
                                FrameIndex duration,
                                std::optional<OverlayId> ignoreId = std::nullopt);

    juce::Result validateRowsDoNotOverlap(const std::vector<OverlayModel>& overlays);

    std::vector<Gap> findGaps(const std::vector<OverlayModel>& overlays, int row);

    // Shifts the row's overlays left so they sit back to back from frame 0.
    void closeGaps(std::vector<OverlayModel>& overlays, int row);

    FrameIndex timelineEnd(const std::vector<OverlayModel>& overlays) noexcept;
    int rowCount(const std::vector<OverlayModel>& overlays) noexcept;
}
