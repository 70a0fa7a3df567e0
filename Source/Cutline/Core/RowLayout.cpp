#include "Cutline/Core/RowLayout.h"

#include <algorithm>
#include <map>

namespace
{
    std::vector<size_t> rowIndicesByStart(const std::vector<Cutline::OverlayModel>& overlays, int row)
    {
        std::vector<size_t> indices;
        for (size_t i = 0; i < overlays.size(); ++i)
        {
            if (overlays[i].row == row)
                indices.push_back(i);
        }

        std::stable_sort(indices.begin(),
                         indices.end(),
                         [&overlays](size_t lhs, size_t rhs)
                         {
                             return overlays[lhs].from < overlays[rhs].from;
                         });
        return indices;
    }
}

namespace Cutline::Core::RowLayout
{
    bool intervalsOverlap(FrameIndex aFrom, FrameIndex aDuration,
                          FrameIndex bFrom, FrameIndex bDuration) noexcept
    {
        return static_cast<juce::int64>(aFrom) < static_cast<juce::int64>(bFrom) + bDuration
            && static_cast<juce::int64>(bFrom) < static_cast<juce::int64>(aFrom) + aDuration;
    }

    bool overlapsRow(const std::vector<OverlayModel>& overlays,
                     int row,
                     FrameIndex from,
                     FrameIndex duration,
                     std::optional<OverlayId> ignoreId)
    {
        return std::any_of(overlays.begin(),
                           overlays.end(),
                           [&](const OverlayModel& overlay)
                           {
                               if (overlay.row != row)
                                   return false;
                               if (ignoreId.has_value() && overlay.id == *ignoreId)
                                   return false;
                               return intervalsOverlap(from, duration, overlay.from, overlay.durationInFrames);
                           });
    }

    FrameIndex resolveFreeStart(const std::vector<OverlayModel>& overlays,
                                int row,
                                FrameIndex from,
                                FrameIndex duration,
                                std::optional<OverlayId> ignoreId)
    {
        auto candidate = from;

        for (;;)
        {
            auto latestConflictEnd = candidate;
            auto conflicted = false;

            for (const auto& overlay : overlays)
            {
                if (overlay.row != row)
                    continue;
                if (ignoreId.has_value() && overlay.id == *ignoreId)
                    continue;
                if (!intervalsOverlap(candidate, duration, overlay.from, overlay.durationInFrames))
                    continue;

                conflicted = true;
                latestConflictEnd = std::max(latestConflictEnd, overlay.endFrame());
            }

            // A conflicting interval always ends after candidate, so this terminates.
            if (!conflicted)
                return candidate;

            candidate = latestConflictEnd;
        }
    }

    juce::Result validateRowsDoNotOverlap(const std::vector<OverlayModel>& overlays)
    {
        std::map<int, std::vector<const OverlayModel*>> rows;
        for (const auto& overlay : overlays)
            rows[overlay.row].push_back(&overlay);

        for (auto& [row, members] : rows)
        {
            std::sort(members.begin(),
                      members.end(),
                      [](const OverlayModel* lhs, const OverlayModel* rhs)
                      {
                          return lhs->from < rhs->from;
                      });

            for (size_t i = 1; i < members.size(); ++i)
            {
                if (members[i]->from < members[i - 1]->endFrame())
                {
                    return juce::Result::fail("overlays " + juce::String(members[i - 1]->id)
                                              + " and " + juce::String(members[i]->id)
                                              + " overlap on row " + juce::String(row));
                }
            }
        }

        return juce::Result::ok();
    }

    std::vector<Gap> findGaps(const std::vector<OverlayModel>& overlays, int row)
    {
        std::vector<Gap> gaps;
        FrameIndex cursor = 0;

        for (const auto index : rowIndicesByStart(overlays, row))
        {
            const auto& overlay = overlays[index];
            if (overlay.from > cursor)
                gaps.push_back({ cursor, overlay.from });

            cursor = std::max(cursor, overlay.endFrame());
        }

        return gaps;
    }

    void closeGaps(std::vector<OverlayModel>& overlays, int row)
    {
        FrameIndex cursor = 0;
        for (const auto index : rowIndicesByStart(overlays, row))
        {
            overlays[index].from = cursor;
            cursor += overlays[index].durationInFrames;
        }
    }

    FrameIndex timelineEnd(const std::vector<OverlayModel>& overlays) noexcept
    {
        FrameIndex end = 0;
        for (const auto& overlay : overlays)
            end = std::max(end, overlay.endFrame());
        return end;
    }

    int rowCount(const std::vector<OverlayModel>& overlays) noexcept
    {
        int count = 0;
        for (const auto& overlay : overlays)
            count = std::max(count, overlay.row + 1);
        return count;
    }
}
