#pragma once

#include "Cutline/Public/Types.h"
#include <functional>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace Cutline
{
    // -----------------------------------------------------------------------------
    //  Timeline Actions (Public contract)
    //
    //  Rules:
    //  - Every action mutates the TimelineModel and is an undo/redo candidate.
    //  - Actions are payload-only. Updater functions must be pure.
    //  - Validation here is shape validation. Reducer checks the action against
    //    the current timeline (existence, split range, row overlap).
    //
    //  NOTE:
    //  - bounds are first-class overlay geometry, not style entries.
    //  - selection lives in EditorStateModel and is maintained by OverlayStore.
    // -----------------------------------------------------------------------------

    struct AddOverlayAction
    {
        OverlayModel overlay;                 // id is assigned by the store
    };

    struct DeleteOverlayAction
    {
        OverlayId id = kFirstOverlayId;
    };

    struct DeleteRowAction
    {
        int row = 0;
    };

    struct OverlayPatch
    {
        std::optional<FrameIndex> from;
        std::optional<FrameIndex> durationInFrames;
        std::optional<int> row;
        std::optional<juce::Rectangle<int>> bounds;
        std::optional<double> rotation;
        PropertyBag styles;                   // merged into the existing bag
        std::optional<OverlayPayload> payload;
    };

    using OverlayUpdater = std::function<OverlayModel(const OverlayModel&)>;

    struct ChangeOverlayAction
    {
        OverlayId id = kFirstOverlayId;
        std::variant<OverlayPatch, OverlayUpdater> update;
    };

    struct DuplicateOverlayAction
    {
        OverlayId id = kFirstOverlayId;
    };

    struct SplitOverlayAction
    {
        OverlayId id = kFirstOverlayId;
        FrameIndex atFrame = 0;
    };

    struct UpdateStylesAction
    {
        OverlayId id = kFirstOverlayId;
        PropertyBag patch;
    };

    struct ReplaceOverlaysAction
    {
        std::vector<OverlayModel> overlays;
    };

    struct CloseRowGapsAction
    {
        int row = 0;
    };

    using Action = std::variant<
        AddOverlayAction,
        DeleteOverlayAction,
        DeleteRowAction,
        ChangeOverlayAction,
        DuplicateOverlayAction,
        SplitOverlayAction,
        UpdateStylesAction,
        ReplaceOverlaysAction,
        CloseRowGapsAction>;

    static_assert(std::variant_size_v<Action> == 9,
                  "Action variant must contain exactly nine timeline actions");

    enum class ActionKind
    {
        addOverlay,
        deleteOverlay,
        deleteRow,
        changeOverlay,
        duplicateOverlay,
        splitOverlay,
        updateStyles,
        replaceOverlays,
        closeRowGaps
    };

    inline ActionKind getActionKind(const Action& action) noexcept
    {
        return std::visit([](const auto& a) -> ActionKind
        {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, AddOverlayAction>)       return ActionKind::addOverlay;
            if constexpr (std::is_same_v<T, DeleteOverlayAction>)    return ActionKind::deleteOverlay;
            if constexpr (std::is_same_v<T, DeleteRowAction>)        return ActionKind::deleteRow;
            if constexpr (std::is_same_v<T, ChangeOverlayAction>)    return ActionKind::changeOverlay;
            if constexpr (std::is_same_v<T, DuplicateOverlayAction>) return ActionKind::duplicateOverlay;
            if constexpr (std::is_same_v<T, SplitOverlayAction>)     return ActionKind::splitOverlay;
            if constexpr (std::is_same_v<T, UpdateStylesAction>)     return ActionKind::updateStyles;
            if constexpr (std::is_same_v<T, ReplaceOverlaysAction>)  return ActionKind::replaceOverlays;
            return ActionKind::closeRowGaps;
        }, action);
    }

    // Small, cheap "shape validation".
    inline juce::Result validateAction(const Action& action)
    {
        const auto validateId = [](OverlayId id) -> juce::Result
        {
            if (id < kFirstOverlayId)
                return juce::Result::fail("Action id must not be negative");
            return juce::Result::ok();
        };

        const auto validateRow = [](int row) -> juce::Result
        {
            if (row < 0)
                return juce::Result::fail("Action row must not be negative");
            return juce::Result::ok();
        };

        return std::visit([&](const auto& a) -> juce::Result
        {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, AddOverlayAction>)
            {
                if (a.overlay.durationInFrames < 1)
                    return juce::Result::fail("AddOverlay duration must be >= 1 frame");
                if (a.overlay.from < 0)
                    return juce::Result::fail("AddOverlay from must not be negative");
                if (!frameRangeFits(a.overlay.from, a.overlay.durationInFrames))
                    return juce::Result::fail("AddOverlay end frame is out of range");
                return validateRow(a.overlay.row);
            }
            else if constexpr (std::is_same_v<T, DeleteRowAction> || std::is_same_v<T, CloseRowGapsAction>)
            {
                return validateRow(a.row);
            }
            else if constexpr (std::is_same_v<T, ChangeOverlayAction>)
            {
                if (const auto* updater = std::get_if<OverlayUpdater>(&a.update))
                {
                    if (!(*updater))
                        return juce::Result::fail("ChangeOverlay updater must be callable");
                }
                else
                {
                    const auto& patch = std::get<OverlayPatch>(a.update);
                    if (patch.durationInFrames.has_value() && *patch.durationInFrames < 1)
                        return juce::Result::fail("ChangeOverlay duration must be >= 1 frame");
                    if (patch.from.has_value() && *patch.from < 0)
                        return juce::Result::fail("ChangeOverlay from must not be negative");
                    if (patch.from.has_value() && patch.durationInFrames.has_value()
                        && !frameRangeFits(*patch.from, *patch.durationInFrames))
                        return juce::Result::fail("ChangeOverlay end frame is out of range");
                    if (patch.row.has_value() && *patch.row < 0)
                        return juce::Result::fail("ChangeOverlay row must not be negative");
                }

                return validateId(a.id);
            }
            else if constexpr (std::is_same_v<T, ReplaceOverlaysAction>)
            {
                return juce::Result::ok();
            }
            else
            {
                return validateId(a.id);
            }
        }, action);
    }
}
