#pragma once

#include "Cutline/Core/Reducer.h"
#include <algorithm>
#include <unordered_set>
#include <vector>

namespace Cutline::Core
{
    class OverlayStore
    {
    public:
        OverlayStore() = default;
        explicit OverlayStore(int framesPerSecond)
            : fps(std::max(1, framesPerSecond))
        {
        }

        const TimelineModel& snapshot() const noexcept
        {
            return state.timeline;
        }

        const std::vector<OverlayModel>& overlays() const noexcept
        {
            return state.timeline.overlays;
        }

        const EditorStateModel& editorState() const noexcept
        {
            return state.editorState;
        }

        const OverlayModel* find(OverlayId id) const noexcept
        {
            const auto index = Reducer::detail::findOverlayIndex(state.timeline, id);
            return index.has_value() ? &state.timeline.overlays[*index] : nullptr;
        }

        int framesPerSecond() const noexcept
        {
            return fps;
        }

        void setFramesPerSecond(int framesPerSecond) noexcept
        {
            fps = std::max(1, framesPerSecond);
        }

        // Next id the store would hand out. Never decreases, including across undo.
        OverlayId nextOverlayId() const noexcept
        {
            return Reducer::detail::nextOverlayId(state.timeline, idFloor);
        }

        juce::Result apply(const Action& action,
                           std::vector<OverlayId>* createdIdsOut = nullptr,
                           bool recordHistory = true)
        {
            auto next = state;
            std::vector<OverlayId> createdIds;

            const auto result = Reducer::apply(next.timeline, action, { fps, idFloor }, &createdIds);
            if (result.failed())
                return result;

            if (getActionKind(action) == ActionKind::addOverlay && createdIds.size() == 1)
                next.editorState.selection = createdIds;
            else
                pruneSelection(next);

            if (recordHistory)
                pushUndoState();

            state = std::move(next);
            raiseIdFloor();

            if (recordHistory)
                redoStack.clear();

            if (createdIdsOut != nullptr)
                *createdIdsOut = std::move(createdIds);

            return juce::Result::ok();
        }

        // Selection edits are not undoable.
        void setSelection(std::vector<OverlayId> selection)
        {
            std::unordered_set<OverlayId> seen;
            std::vector<OverlayId> filtered;
            for (const auto id : selection)
            {
                if (find(id) != nullptr && seen.insert(id).second)
                    filtered.push_back(id);
            }

            state.editorState.selection = std::move(filtered);
        }

        void selectSingle(OverlayId id)
        {
            setSelection({ id });
        }

        void clearSelection() noexcept
        {
            state.editorState.selection.clear();
        }

        // Removes every overlay and clears the selection as one undoable step.
        juce::Result clear()
        {
            return apply(ReplaceOverlaysAction {});
        }

        // Replaces the whole state and drops history. Used when a saved session is restored.
        void load(TimelineModel timeline, EditorStateModel editorState = {})
        {
            state.timeline = std::move(timeline);
            state.editorState = std::move(editorState);
            pruneSelection(state);
            raiseIdFloor();
            clearHistory();
        }

        bool canUndo() const noexcept
        {
            return !undoStack.empty();
        }

        bool canRedo() const noexcept
        {
            return !redoStack.empty();
        }

        bool undo()
        {
            if (!canUndo())
                return false;

            redoStack.push_back(state);
            state = std::move(undoStack.back());
            undoStack.pop_back();
            return true;
        }

        bool redo()
        {
            if (!canRedo())
                return false;

            undoStack.push_back(state);
            trimUndoHistory();

            state = std::move(redoStack.back());
            redoStack.pop_back();
            return true;
        }

        void clearHistory()
        {
            undoStack.clear();
            redoStack.clear();
        }

        void setHistoryLimit(size_t limit) noexcept
        {
            historyLimit = std::max<size_t>(1, limit);
            trimUndoHistory();
        }

        size_t getHistoryLimit() const noexcept
        {
            return historyLimit;
        }

        size_t undoDepth() const noexcept
        {
            return undoStack.size();
        }

        size_t redoDepth() const noexcept
        {
            return redoStack.size();
        }

    private:
        struct State
        {
            TimelineModel timeline;
            EditorStateModel editorState;
        };

        static void pruneSelection(State& target)
        {
            auto& selection = target.editorState.selection;
            selection.erase(std::remove_if(selection.begin(),
                                           selection.end(),
                                           [&target](OverlayId id)
                                           {
                                               return !Reducer::detail::findOverlayIndex(target.timeline, id).has_value();
                                           }),
                            selection.end());
        }

        void raiseIdFloor() noexcept
        {
            idFloor = Reducer::detail::nextOverlayId(state.timeline, idFloor);
        }

        void pushUndoState()
        {
            undoStack.push_back(state);
            trimUndoHistory();
        }

        void trimUndoHistory()
        {
            if (undoStack.size() <= historyLimit)
                return;

            const auto overflow = undoStack.size() - historyLimit;
            undoStack.erase(undoStack.begin(), undoStack.begin() + static_cast<std::ptrdiff_t>(overflow));
        }

        State state;
        std::vector<State> undoStack;
        std::vector<State> redoStack;
        size_t historyLimit = 256;
        int fps = kDefaultFps;
        OverlayId idFloor = kFirstOverlayId;
    };
}
