#pragma once

#include "Cutline/Public/Action.h"
#include "Cutline/Public/Collaborators.h"
#include "Cutline/Public/EditorSettings.h"
#include "Cutline/Public/Types.h"
#include "Cutline/Render/RenderOrchestrator.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace Cutline
{
    namespace Persistence
    {
        class AutosaveStore;
    }

    // The single entry point UI code talks to. All calls happen on the message thread.
    class EditorSession
    {
    public:
        // Non-owning. Missing collaborators fall back to headless defaults;
        // without a renderer renderMedia() fails, without a store autosave is off.
        struct Collaborators
        {
            Render::Renderer* renderer = nullptr;
            Render::Scheduler* scheduler = nullptr;
            PlaybackPositionProvider* playback = nullptr;
            const CanvasDimensionProvider* canvas = nullptr;
            Persistence::AutosaveStore* autosaveStore = nullptr;
        };

        static constexpr const char* kCompositionId = "Main";

        EditorSession(juce::String projectId, EditorSettings settings, Collaborators collaborators);
        ~EditorSession();
        EditorSession(EditorSession&&) noexcept;
        EditorSession& operator=(EditorSession&&) noexcept;

        EditorSession(const EditorSession&) = delete;
        EditorSession& operator=(const EditorSession&) = delete;

        const juce::String& projectId() const noexcept;
        const EditorSettings& settings() const noexcept;
        int fps() const noexcept;

        const std::vector<OverlayModel>& overlays() const noexcept;
        const OverlayModel* findOverlay(OverlayId id) const noexcept;
        const std::vector<OverlayId>& selectedOverlayIds() const noexcept;
        std::optional<OverlayId> selectedOverlayId() const noexcept;

        AspectRatio aspectRatio() const noexcept;
        CanvasSize canvasSize() const;
        double playbackRate() const noexcept;
        const juce::String& backgroundColor() const noexcept;
        FrameIndex durationInFrames() const noexcept;
        FrameIndex currentFrame() const;
        PlaybackPositionProvider& playback() noexcept;

        bool setPlaybackRate(double rate);
        void setBackgroundColor(juce::String colour);
        // Rescales every overlay to the new canvas and drops edit history.
        // Returns false, leaving ratio and overlays as they were, if the rescale is rejected.
        bool setAspectRatio(AspectRatio ratio);
        void setAspectRatioWithoutTransform(AspectRatio ratio);

        // Overlay edits. A false / empty return leaves the session unchanged;
        // lastEditResult() carries the reason.
        std::optional<OverlayId> addOverlay(OverlayModel overlay);
        bool deleteOverlay(OverlayId id);
        bool deleteOverlaysByRow(int row);
        bool changeOverlay(OverlayId id, OverlayPatch patch);
        bool changeOverlay(OverlayId id, OverlayUpdater updater);
        std::optional<OverlayId> duplicateOverlay(OverlayId id);
        std::optional<OverlayId> splitOverlay(OverlayId id, FrameIndex atFrame);
        std::optional<OverlayId> splitAtPlayhead(OverlayId id);
        bool updateStyles(OverlayId id, PropertyBag patch);
        bool applyCrop(OverlayId id);
        bool replaceOverlays(std::vector<OverlayModel> overlays);
        bool closeRowGaps(int row);
        bool resetOverlays();
        const juce::Result& lastEditResult() const noexcept;

        std::optional<OverlayId> addMedia(const MediaDescriptor& media, int row, FrameIndex startFrame);
        std::optional<OverlayId> importSrt(const juce::String& srtText, int row, FrameIndex startFrame);
        std::optional<OverlayId> addCaptionsFromText(const juce::String& text, int row, FrameIndex startFrame);
        bool editCaptionText(OverlayId id, size_t captionIndex, const juce::String& text);
        bool editCaptionTiming(OverlayId id, size_t captionIndex, double startMs, double endMs);

        void selectOverlay(OverlayId id);
        void setSelectedOverlayIds(std::vector<OverlayId> ids);
        void clearSelection();

        bool canUndo() const noexcept;
        bool canRedo() const noexcept;
        bool undo();
        bool redo();

        CompositionProps compositionProps() const;
        bool renderMedia();
        void resetRender();
        const Render::RenderState& renderState() const noexcept;

        SessionStateModel snapshotState() const;
        juce::Result loadState(const SessionStateModel& state);

        void startAutosave();
        void stopAutosave();
        bool isAutosaving() const noexcept;
        // Writes unconditionally.
        juce::Result saveNow();
        // Writes only when the serialized state differs from the last successful save.
        juce::Result autosaveIfChanged(bool* wroteOut = nullptr);
        bool hasSavedState() const;
        juce::Result restoreSaved();
        const juce::Result& lastAutosaveError() const noexcept;

        std::function<void()> onChanged;
        std::function<void(const Render::RenderState&)> onRenderStateChanged;
        std::function<void(const juce::String&)> onAutosaveError;

    private:
        class Impl;
        std::unique_ptr<Impl> impl;
    };
}
