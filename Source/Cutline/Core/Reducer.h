#pragma once

#include "Cutline/Core/OverlayEdits.h"
#include "Cutline/Core/OverlayValidator.h"
#include "Cutline/Core/RowLayout.h"
#include "Cutline/Public/Action.h"
#include "Cutline/Public/Types.h"
#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

namespace Cutline::Core::Reducer
{
    struct Context
    {
        int fps = kDefaultFps;
        OverlayId idFloor = kFirstOverlayId;  // ids below this were issued before
    };

    namespace detail
    {
        inline std::optional<size_t> findOverlayIndex(const TimelineModel& timeline, OverlayId id) noexcept
        {
            const auto it = std::find_if(timeline.overlays.begin(),
                                         timeline.overlays.end(),
                                         [id](const OverlayModel& overlay)
                                         {
                                             return overlay.id == id;
                                         });

            if (it == timeline.overlays.end())
                return std::nullopt;

            return static_cast<size_t>(std::distance(timeline.overlays.begin(), it));
        }

        inline OverlayId nextOverlayId(const TimelineModel& timeline, OverlayId idFloor) noexcept
        {
            OverlayId next = std::max(idFloor, kFirstOverlayId);
            for (const auto& overlay : timeline.overlays)
            {
                if (overlay.id < std::numeric_limits<OverlayId>::max())
                    next = std::max(next, overlay.id + 1);
            }

            return next;
        }

        inline juce::Result commitChangedOverlay(TimelineModel& timeline, size_t index, OverlayModel next)
        {
            next.id = timeline.overlays[index].id;

            const auto validity = OverlayValidator::validateOverlay(next);
            if (validity.failed())
                return validity;

            if (RowLayout::overlapsRow(timeline.overlays, next.row, next.from, next.durationInFrames, next.id))
                return juce::Result::fail("overlay would overlap another overlay on row " + juce::String(next.row));

            timeline.overlays[index] = std::move(next);
            return juce::Result::ok();
        }
    }

    inline juce::Result apply(TimelineModel& timeline,
                              const Action& action,
                              const Context& context = {},
                              std::vector<OverlayId>* createdIdsOut = nullptr)
    {
        const auto validation = validateAction(action);
        if (validation.failed())
            return validation;

        return std::visit([&timeline, &context, createdIdsOut](const auto& typedAction) -> juce::Result
                          {
                              using T = std::decay_t<decltype(typedAction)>;

                              if constexpr (std::is_same_v<T, AddOverlayAction>)
                              {
                                  auto overlay = typedAction.overlay;
                                  overlay.id = detail::nextOverlayId(timeline, context.idFloor);
                                  overlay.from = RowLayout::resolveFreeStart(timeline.overlays,
                                                                             overlay.row,
                                                                             overlay.from,
                                                                             overlay.durationInFrames);

                                  const auto validity = OverlayValidator::validateOverlay(overlay);
                                  if (validity.failed())
                                      return validity;

                                  if (createdIdsOut != nullptr)
                                      createdIdsOut->push_back(overlay.id);

                                  timeline.overlays.push_back(std::move(overlay));
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, DeleteOverlayAction>)
                              {
                                  const auto index = detail::findOverlayIndex(timeline, typedAction.id);
                                  if (!index.has_value())
                                      return juce::Result::fail("DeleteOverlay target id not found");

                                  timeline.overlays.erase(timeline.overlays.begin() + static_cast<std::ptrdiff_t>(*index));
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, DeleteRowAction>)
                              {
                                  const auto before = timeline.overlays.size();
                                  const auto row = typedAction.row;
                                  timeline.overlays.erase(std::remove_if(timeline.overlays.begin(),
                                                                         timeline.overlays.end(),
                                                                         [row](const OverlayModel& overlay)
                                                                         {
                                                                             return overlay.row == row;
                                                                         }),
                                                          timeline.overlays.end());

                                  if (timeline.overlays.size() == before)
                                      return juce::Result::fail("DeleteRow found no overlays on row " + juce::String(row));

                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, ChangeOverlayAction>)
                              {
                                  const auto index = detail::findOverlayIndex(timeline, typedAction.id);
                                  if (!index.has_value())
                                      return juce::Result::fail("ChangeOverlay target id not found");

                                  const auto& current = timeline.overlays[*index];
                                  auto next = std::holds_alternative<OverlayPatch>(typedAction.update)
                                              ? OverlayEdits::applyPatch(current, std::get<OverlayPatch>(typedAction.update))
                                              : std::get<OverlayUpdater>(typedAction.update)(current);

                                  return detail::commitChangedOverlay(timeline, *index, std::move(next));
                              }

                              else if constexpr (std::is_same_v<T, DuplicateOverlayAction>)
                              {
                                  const auto index = detail::findOverlayIndex(timeline, typedAction.id);
                                  if (!index.has_value())
                                      return juce::Result::fail("DuplicateOverlay target id not found");

                                  const auto newId = detail::nextOverlayId(timeline, context.idFloor);
                                  auto copy = OverlayEdits::duplicateOverlay(timeline.overlays,
                                                                             timeline.overlays[*index],
                                                                             newId);

                                  const auto validity = OverlayValidator::validateOverlay(copy);
                                  if (validity.failed())
                                      return validity;

                                  if (createdIdsOut != nullptr)
                                      createdIdsOut->push_back(newId);

                                  timeline.overlays.push_back(std::move(copy));
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, SplitOverlayAction>)
                              {
                                  const auto index = detail::findOverlayIndex(timeline, typedAction.id);
                                  if (!index.has_value())
                                      return juce::Result::fail("SplitOverlay target id not found");

                                  const auto newId = detail::nextOverlayId(timeline, context.idFloor);
                                  auto split = OverlayEdits::splitOverlay(timeline.overlays[*index],
                                                                          newId,
                                                                          typedAction.atFrame,
                                                                          context.fps);
                                  if (!split.has_value())
                                      return juce::Result::fail("SplitOverlay frame must lie strictly inside the overlay");

                                  timeline.overlays[*index] = std::move(split->first);
                                  timeline.overlays.insert(timeline.overlays.begin() + static_cast<std::ptrdiff_t>(*index + 1),
                                                           std::move(split->second));

                                  if (createdIdsOut != nullptr)
                                      createdIdsOut->push_back(newId);

                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, UpdateStylesAction>)
                              {
                                  const auto index = detail::findOverlayIndex(timeline, typedAction.id);
                                  if (!index.has_value())
                                      return juce::Result::fail("UpdateStyles target id not found");

                                  auto next = timeline.overlays[*index];
                                  OverlayEdits::mergeStyles(next.styles, typedAction.patch);

                                  const auto styles = OverlayValidator::validateStyles(next.styles);
                                  if (styles.failed())
                                      return styles;

                                  timeline.overlays[*index] = std::move(next);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, ReplaceOverlaysAction>)
                              {
                                  const auto validity = OverlayValidator::validateOverlays(typedAction.overlays);
                                  if (validity.failed())
                                      return validity;

                                  timeline.overlays = typedAction.overlays;
                                  return juce::Result::ok();
                              }

                              else
                              {
                                  const auto gaps = RowLayout::findGaps(timeline.overlays, typedAction.row);
                                  if (gaps.empty())
                                      return juce::Result::fail("CloseRowGaps found nothing to close on row "
                                                                + juce::String(typedAction.row));

                                  RowLayout::closeGaps(timeline.overlays, typedAction.row);
                                  return juce::Result::ok();
                              }
                          },
                          action);
    }
}
