#include "Cutline/Public/EditorSession.h"

#include "Cutline/Core/Captions.h"
#include "Cutline/Core/Geometry.h"
#include "Cutline/Core/OverlayStore.h"
#include "Cutline/Core/RowLayout.h"
#include "Cutline/Persistence/AutosaveStore.h"
#include "Cutline/Serialization/SessionJson.h"
#include "Cutline/Session/MediaDrop.h"
#include <cmath>

namespace Cutline
{
    class EditorSession::Impl
    {
    public:
        Impl(EditorSession& ownerIn, juce::String projectIdIn, EditorSettings settingsIn, Collaborators collaborators)
            : owner(&ownerIn),
              projectId(std::move(projectIdIn)),
              settings(std::move(settingsIn)),
              store(settings.fps),
              aspectRatio(settings.defaultAspectRatio),
              backgroundColor(settings.backgroundColor),
              autosaveStore(collaborators.autosaveStore)
        {
            store.setHistoryLimit(static_cast<size_t>(juce::jmax(1, settings.historyLimit)));

            if (collaborators.scheduler != nullptr)
            {
                scheduler = collaborators.scheduler;
            }
            else
            {
                ownedScheduler = std::make_unique<Render::MessageThreadScheduler>();
                scheduler = ownedScheduler.get();
            }

            if (collaborators.playback != nullptr)
            {
                playback = collaborators.playback;
            }
            else
            {
                ownedPlayback = std::make_unique<StoppedPlaybackPosition>();
                playback = ownedPlayback.get();
            }

            canvas = collaborators.canvas != nullptr ? collaborators.canvas : &defaultCanvas;

            if (collaborators.renderer != nullptr)
            {
                Render::RenderSettings renderSettings;
                renderSettings.pollingIntervalMs = settings.pollingIntervalMs;
                renderSettings.initialDelayMs = settings.initialDelayMs;
                renderSettings.firstPollDelayMs = settings.firstPollDelayMs;

                orchestrator = std::make_unique<Render::RenderOrchestrator>(*collaborators.renderer, *scheduler, renderSettings);
                orchestrator->onStateChanged = [this](const Render::RenderState& state)
                {
                    if (owner->onRenderStateChanged != nullptr)
                        owner->onRenderStateChanged(state);
                };
            }
        }

        CanvasSize canvasSize() const
        {
            return canvas->dimensionsFor(aspectRatioToKey(aspectRatio));
        }

        void notifyChanged()
        {
            if (owner->onChanged != nullptr)
                owner->onChanged();
        }

        bool commit(const Action& action, std::vector<OverlayId>* createdIdsOut = nullptr)
        {
            lastEdit = store.apply(action, createdIdsOut);
            if (lastEdit.failed())
                return false;

            notifyChanged();
            return true;
        }

        std::optional<OverlayId> commitCreating(const Action& action)
        {
            std::vector<OverlayId> createdIds;
            if (!commit(action, &createdIds) || createdIds.size() != 1)
                return std::nullopt;

            return createdIds.front();
        }

        bool rejectEdit(const juce::String& message)
        {
            lastEdit = juce::Result::fail(message);
            return false;
        }

        // Replaces overlays outside undo history; earlier snapshots no longer
        // match the canvas, so history is dropped.
        juce::Result replaceWithoutHistory(std::vector<OverlayModel> overlays)
        {
            ReplaceOverlaysAction action;
            action.overlays = std::move(overlays);

            const auto result = store.apply(action, nullptr, false);
            if (result.failed())
            {
                DBG("[Cutline] canvas transform rejected: " + result.getErrorMessage());
                return result;
            }

            store.clearHistory();
            return result;
        }

        SessionStateModel snapshotState() const
        {
            SessionStateModel state;
            state.overlays = store.overlays();
            state.selectedOverlayIds = store.editorState().selection;
            state.aspectRatio = aspectRatio;
            state.playbackRate = playbackRate;
            state.backgroundColor = backgroundColor;
            state.durationInFrames = durationInFrames();
            state.currentFrame = playback->currentFrame();
            return state;
        }

        FrameIndex durationInFrames() const noexcept
        {
            return juce::jmax(Core::RowLayout::timelineEnd(store.overlays()), store.framesPerSecond());
        }

        juce::String serializedState() const
        {
            return juce::JSON::toString(Serialization::serializeSessionState(snapshotState()), true);
        }

        juce::Result writeRecord(const juce::String& stateJson)
        {
            if (autosaveStore == nullptr)
                return reportPersistenceFailure("no autosave store configured");

            SavedSessionRecord record;
            record.projectId = projectId;
            record.timestampMs = scheduler->nowMs();
            record.editorState = snapshotState();

            const auto result = autosaveStore->save(record);
            if (result.failed())
                return reportPersistenceFailure("save failed: " + result.getErrorMessage());

            lastSavedJson = stateJson;
            lastAutosave = juce::Result::ok();
            return lastAutosave;
        }

        // Reads and writes: logged, kept as lastAutosaveError, passed to onAutosaveError.
        juce::Result reportPersistenceFailure(const juce::String& message)
        {
            DBG("[Cutline][Autosave] " + projectId + ": " + message);
            lastAutosave = juce::Result::fail(message);

            if (owner->onAutosaveError != nullptr)
                owner->onAutosaveError(message);

            return lastAutosave;
        }

        void scheduleAutosave(std::uint64_t generation)
        {
            juce::WeakReference<Impl> weakThis(this);
            scheduler->callAfter(settings.autosaveIntervalMs,
                                 [weakThis, generation]
                                 {
                                     auto* self = weakThis.get();
                                     if (self == nullptr || !self->autosaveRunning || generation != self->autosaveGeneration)
                                         return;

                                     self->owner->autosaveIfChanged();
                                     self->scheduleAutosave(generation);
                                 });
        }

        const OverlayModel* findCaptionOverlay(OverlayId id, size_t captionIndex)
        {
            const auto* overlay = store.find(id);
            if (overlay == nullptr)
            {
                rejectEdit("caption overlay not found");
                return nullptr;
            }

            const auto* content = std::get_if<CaptionContent>(&overlay->payload);
            if (content == nullptr)
            {
                rejectEdit("overlay " + juce::String(id) + " is not a caption overlay");
                return nullptr;
            }

            if (captionIndex >= content->captions.size())
            {
                rejectEdit("caption index out of range");
                return nullptr;
            }

            return overlay;
        }

        EditorSession* owner = nullptr;
        juce::String projectId;
        EditorSettings settings;
        Core::OverlayStore store;
        AspectRatio aspectRatio = AspectRatio::widescreen;
        double playbackRate = 1.0;
        juce::String backgroundColor;

        std::unique_ptr<Render::MessageThreadScheduler> ownedScheduler;
        Render::Scheduler* scheduler = nullptr;
        std::unique_ptr<StoppedPlaybackPosition> ownedPlayback;
        PlaybackPositionProvider* playback = nullptr;
        FixedTableCanvasDimensions defaultCanvas;
        const CanvasDimensionProvider* canvas = nullptr;
        Persistence::AutosaveStore* autosaveStore = nullptr;
        std::unique_ptr<Render::RenderOrchestrator> orchestrator;
        Render::RenderState idleRenderState;

        juce::Result lastEdit = juce::Result::ok();
        juce::Result lastAutosave = juce::Result::ok();
        juce::String lastSavedJson;
        bool autosaveRunning = false;
        std::uint64_t autosaveGeneration = 0;

        JUCE_DECLARE_WEAK_REFERENCEABLE(Impl)
    };

    EditorSession::EditorSession(juce::String projectId, EditorSettings settings, Collaborators collaborators)
        : impl(std::make_unique<Impl>(*this, std::move(projectId), std::move(settings), collaborators))
    {
    }

    EditorSession::~EditorSession() = default;

    EditorSession::EditorSession(EditorSession&& other) noexcept
        : onChanged(std::move(other.onChanged)),
          onRenderStateChanged(std::move(other.onRenderStateChanged)),
          onAutosaveError(std::move(other.onAutosaveError)),
          impl(std::move(other.impl))
    {
        if (impl != nullptr)
            impl->owner = this;
    }

    EditorSession& EditorSession::operator=(EditorSession&& other) noexcept
    {
        if (this != &other)
        {
            onChanged = std::move(other.onChanged);
            onRenderStateChanged = std::move(other.onRenderStateChanged);
            onAutosaveError = std::move(other.onAutosaveError);
            impl = std::move(other.impl);

            if (impl != nullptr)
                impl->owner = this;
        }

        return *this;
    }

    const juce::String& EditorSession::projectId() const noexcept { return impl->projectId; }
    const EditorSettings& EditorSession::settings() const noexcept { return impl->settings; }
    int EditorSession::fps() const noexcept { return impl->store.framesPerSecond(); }

    const std::vector<OverlayModel>& EditorSession::overlays() const noexcept
    {
        return impl->store.overlays();
    }

    const OverlayModel* EditorSession::findOverlay(OverlayId id) const noexcept
    {
        return impl->store.find(id);
    }

    const std::vector<OverlayId>& EditorSession::selectedOverlayIds() const noexcept
    {
        return impl->store.editorState().selection;
    }

    std::optional<OverlayId> EditorSession::selectedOverlayId() const noexcept
    {
        return impl->store.editorState().primarySelection();
    }

    AspectRatio EditorSession::aspectRatio() const noexcept { return impl->aspectRatio; }
    CanvasSize EditorSession::canvasSize() const { return impl->canvasSize(); }
    double EditorSession::playbackRate() const noexcept { return impl->playbackRate; }
    const juce::String& EditorSession::backgroundColor() const noexcept { return impl->backgroundColor; }
    FrameIndex EditorSession::durationInFrames() const noexcept { return impl->durationInFrames(); }
    FrameIndex EditorSession::currentFrame() const { return impl->playback->currentFrame(); }
    PlaybackPositionProvider& EditorSession::playback() noexcept { return *impl->playback; }

    bool EditorSession::setPlaybackRate(double rate)
    {
        if (!std::isfinite(rate) || rate <= 0.0)
            return impl->rejectEdit("playback rate must be > 0");

        impl->playbackRate = rate;
        impl->notifyChanged();
        return true;
    }

    void EditorSession::setBackgroundColor(juce::String colour)
    {
        impl->backgroundColor = std::move(colour);
        impl->notifyChanged();
    }

    bool EditorSession::setAspectRatio(AspectRatio ratio)
    {
        if (ratio == impl->aspectRatio)
            return true;

        const auto oldCanvas = impl->canvasSize();
        const auto newCanvas = impl->canvas->dimensionsFor(aspectRatioToKey(ratio));

        if (!Geometry::canvasesMatch(oldCanvas, newCanvas) && !impl->store.overlays().empty())
        {
            // The ratio only changes once the rescaled overlays are committed.
            const auto replaced = impl->replaceWithoutHistory(Geometry::resizeOverlays(impl->store.overlays(), oldCanvas, newCanvas));
            if (replaced.failed())
            {
                impl->lastEdit = replaced;
                return false;
            }
        }

        impl->aspectRatio = ratio;
        impl->notifyChanged();
        return true;
    }

    void EditorSession::setAspectRatioWithoutTransform(AspectRatio ratio)
    {
        impl->aspectRatio = ratio;
        impl->notifyChanged();
    }

    std::optional<OverlayId> EditorSession::addOverlay(OverlayModel overlay)
    {
        AddOverlayAction action;
        action.overlay = std::move(overlay);
        return impl->commitCreating(action);
    }

    bool EditorSession::deleteOverlay(OverlayId id)
    {
        return impl->commit(DeleteOverlayAction { id });
    }

    bool EditorSession::deleteOverlaysByRow(int row)
    {
        return impl->commit(DeleteRowAction { row });
    }

    bool EditorSession::changeOverlay(OverlayId id, OverlayPatch patch)
    {
        ChangeOverlayAction action;
        action.id = id;
        action.update = std::move(patch);
        return impl->commit(action);
    }

    bool EditorSession::changeOverlay(OverlayId id, OverlayUpdater updater)
    {
        ChangeOverlayAction action;
        action.id = id;
        action.update = std::move(updater);
        return impl->commit(action);
    }

    std::optional<OverlayId> EditorSession::duplicateOverlay(OverlayId id)
    {
        return impl->commitCreating(DuplicateOverlayAction { id });
    }

    std::optional<OverlayId> EditorSession::splitOverlay(OverlayId id, FrameIndex atFrame)
    {
        return impl->commitCreating(SplitOverlayAction { id, atFrame });
    }

    std::optional<OverlayId> EditorSession::splitAtPlayhead(OverlayId id)
    {
        return splitOverlay(id, impl->playback->currentFrame());
    }

    bool EditorSession::updateStyles(OverlayId id, PropertyBag patch)
    {
        UpdateStylesAction action;
        action.id = id;
        action.patch = std::move(patch);
        return impl->commit(action);
    }

    bool EditorSession::applyCrop(OverlayId id)
    {
        const auto* overlay = impl->store.find(id);
        if (overlay == nullptr)
            return impl->rejectEdit("overlay not found");
        if (!Geometry::hasActiveCrop(*overlay))
            return impl->rejectEdit("overlay has no crop to apply");

        return changeOverlay(id, OverlayUpdater([](const OverlayModel& current)
        {
            return Geometry::withCropApplied(current);
        }));
    }

    bool EditorSession::replaceOverlays(std::vector<OverlayModel> overlays)
    {
        ReplaceOverlaysAction action;
        action.overlays = std::move(overlays);
        return impl->commit(action);
    }

    bool EditorSession::closeRowGaps(int row)
    {
        return impl->commit(CloseRowGapsAction { row });
    }

    bool EditorSession::resetOverlays()
    {
        impl->lastEdit = impl->store.clear();
        if (impl->lastEdit.failed())
            return false;

        impl->notifyChanged();
        return true;
    }

    const juce::Result& EditorSession::lastEditResult() const noexcept
    {
        return impl->lastEdit;
    }

    std::optional<OverlayId> EditorSession::addMedia(const MediaDescriptor& media, int row, FrameIndex startFrame)
    {
        OverlayModel overlay;
        const auto result = MediaDrop::createOverlay(media, row, startFrame, canvasSize(), fps(), overlay);
        if (result.failed())
        {
            impl->lastEdit = result;
            return std::nullopt;
        }

        return addOverlay(std::move(overlay));
    }

    std::optional<OverlayId> EditorSession::importSrt(const juce::String& srtText, int row, FrameIndex startFrame)
    {
        auto parsed = Captions::parseSrt(srtText);
        if (!parsed.succeeded())
        {
            impl->lastEdit = juce::Result::fail(parsed.errors.empty() ? juce::String("no captions found")
                                                                      : parsed.describeErrors());
            return std::nullopt;
        }

        OverlayModel overlay;
        const auto result = MediaDrop::createCaptionOverlay(std::move(parsed.captions), row, startFrame, canvasSize(), fps(), overlay);
        if (result.failed())
        {
            impl->lastEdit = result;
            return std::nullopt;
        }

        return addOverlay(std::move(overlay));
    }

    std::optional<OverlayId> EditorSession::addCaptionsFromText(const juce::String& text, int row, FrameIndex startFrame)
    {
        OverlayModel overlay;
        const auto result = MediaDrop::createCaptionOverlay(Captions::generateFromText(text), row, startFrame, canvasSize(), fps(), overlay);
        if (result.failed())
        {
            impl->lastEdit = result;
            return std::nullopt;
        }

        return addOverlay(std::move(overlay));
    }

    bool EditorSession::editCaptionText(OverlayId id, size_t captionIndex, const juce::String& text)
    {
        if (impl->findCaptionOverlay(id, captionIndex) == nullptr)
            return false;

        const auto trimmed = text.trim();
        if (trimmed.isEmpty())
            return impl->rejectEdit("caption text must not be empty");

        return changeOverlay(id, OverlayUpdater([captionIndex, trimmed](const OverlayModel& current)
        {
            auto next = current;
            auto& caption = std::get<CaptionContent>(next.payload).captions[captionIndex];
            caption.text = trimmed;
            Captions::retimeFromText(caption);
            return next;
        }));
    }

    bool EditorSession::editCaptionTiming(OverlayId id, size_t captionIndex, double startMs, double endMs)
    {
        const auto* overlay = impl->findCaptionOverlay(id, captionIndex);
        if (overlay == nullptr)
            return false;

        const auto& captions = std::get<CaptionContent>(overlay->payload).captions;
        const auto timing = Captions::validateCaptionTiming(captions, captionIndex, startMs, endMs);
        if (timing.failed())
        {
            impl->lastEdit = timing;
            return false;
        }

        return changeOverlay(id, OverlayUpdater([captionIndex, startMs, endMs](const OverlayModel& current)
        {
            auto next = current;
            auto& caption = std::get<CaptionContent>(next.payload).captions[captionIndex];
            caption.startMs = startMs;
            caption.endMs = endMs;
            Captions::redistributeWords(caption);
            return next;
        }));
    }

    void EditorSession::selectOverlay(OverlayId id)
    {
        impl->store.selectSingle(id);
        impl->notifyChanged();
    }

    void EditorSession::setSelectedOverlayIds(std::vector<OverlayId> ids)
    {
        impl->store.setSelection(std::move(ids));
        impl->notifyChanged();
    }

    void EditorSession::clearSelection()
    {
        impl->store.clearSelection();
        impl->notifyChanged();
    }

    bool EditorSession::canUndo() const noexcept { return impl->store.canUndo(); }
    bool EditorSession::canRedo() const noexcept { return impl->store.canRedo(); }

    bool EditorSession::undo()
    {
        if (!impl->store.undo())
            return false;

        impl->notifyChanged();
        return true;
    }

    bool EditorSession::redo()
    {
        if (!impl->store.redo())
            return false;

        impl->notifyChanged();
        return true;
    }

    CompositionProps EditorSession::compositionProps() const
    {
        const auto canvas = canvasSize();

        CompositionProps props;
        props.overlays = overlays();
        props.durationInFrames = durationInFrames();
        props.width = canvas.width;
        props.height = canvas.height;
        props.fps = fps();
        return props;
    }

    bool EditorSession::renderMedia()
    {
        if (impl->orchestrator == nullptr)
        {
            DBG("[Cutline][Render] no renderer configured for " + impl->projectId);
            return false;
        }

        return impl->orchestrator->renderMedia(kCompositionId, compositionProps());
    }

    void EditorSession::resetRender()
    {
        if (impl->orchestrator != nullptr)
            impl->orchestrator->undo();
    }

    const Render::RenderState& EditorSession::renderState() const noexcept
    {
        return impl->orchestrator != nullptr ? impl->orchestrator->getState() : impl->idleRenderState;
    }

    SessionStateModel EditorSession::snapshotState() const
    {
        return impl->snapshotState();
    }

    juce::Result EditorSession::loadState(const SessionStateModel& state)
    {
        TimelineModel timeline;
        timeline.overlays = state.overlays;

        const auto validity = Core::OverlayValidator::validateTimeline(timeline);
        if (validity.failed())
            return validity;

        if (!std::isfinite(state.playbackRate) || state.playbackRate <= 0.0)
            return juce::Result::fail("saved playback rate must be > 0");

        impl->store.load(std::move(timeline));
        impl->aspectRatio = state.aspectRatio;
        impl->playbackRate = state.playbackRate;
        impl->backgroundColor = state.backgroundColor;
        impl->lastSavedJson = impl->serializedState();
        impl->notifyChanged();
        return juce::Result::ok();
    }

    void EditorSession::startAutosave()
    {
        if (impl->autosaveStore == nullptr || impl->settings.autosaveIntervalMs <= 0)
        {
            DBG("[Cutline][Autosave] autosave disabled for " + impl->projectId);
            return;
        }

        if (impl->autosaveRunning)
            return;

        impl->autosaveRunning = true;
        impl->scheduleAutosave(++impl->autosaveGeneration);
    }

    void EditorSession::stopAutosave()
    {
        impl->autosaveRunning = false;
        ++impl->autosaveGeneration;
    }

    bool EditorSession::isAutosaving() const noexcept
    {
        return impl->autosaveRunning;
    }

    juce::Result EditorSession::saveNow()
    {
        return impl->writeRecord(impl->serializedState());
    }

    juce::Result EditorSession::autosaveIfChanged(bool* wroteOut)
    {
        if (wroteOut != nullptr)
            *wroteOut = false;

        const auto stateJson = impl->serializedState();
        if (stateJson == impl->lastSavedJson)
            return juce::Result::ok();

        const auto result = impl->writeRecord(stateJson);
        if (result.wasOk() && wroteOut != nullptr)
            *wroteOut = true;

        return result;
    }

    bool EditorSession::hasSavedState() const
    {
        return impl->autosaveStore != nullptr && impl->autosaveStore->hasRecord(impl->projectId);
    }

    juce::Result EditorSession::restoreSaved()
    {
        if (impl->autosaveStore == nullptr)
            return juce::Result::fail("no autosave store configured");

        SavedSessionRecord record;
        const auto loaded = impl->autosaveStore->load(impl->projectId, record);
        if (loaded.failed())
            return impl->reportPersistenceFailure("restore failed: " + loaded.getErrorMessage());

        const auto applied = loadState(record.editorState);
        if (applied.failed())
            return impl->reportPersistenceFailure("restore failed: " + applied.getErrorMessage());

        impl->lastAutosave = juce::Result::ok();
        return applied;
    }

    const juce::Result& EditorSession::lastAutosaveError() const noexcept
    {
        return impl->lastAutosave;
    }
}
