#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>

#include "Cutline/Core/Geometry.h"
#include "Cutline/Persistence/AutosaveStore.h"
#include "Cutline/Public/EditorSession.h"
#include "Cutline/Serialization/SessionJson.h"
#include "SmokeSupport.h"

#include <functional>
#include <iostream>
#include <vector>

namespace
{
    using CutlineSmoke::FakeRenderer;
    using CutlineSmoke::ManualScheduler;
    using CutlineSmoke::makeTextOverlay;
    using CutlineSmoke::nearlyEqual;

    struct ScopedTempDirectory
    {
        ScopedTempDirectory()
            : directory(juce::File::getSpecialLocation(juce::File::tempDirectory)
                            .getNonexistentChildFile("cutline-smoke", {}, false))
        {
            directory.createDirectory();
        }

        ~ScopedTempDirectory()
        {
            directory.deleteRecursively();
        }

        juce::File directory;
    };

    // Portrait canvas with a negative width, so any rescale onto it is rejected.
    class BrokenPortraitCanvas final : public Cutline::CanvasDimensionProvider
    {
    public:
        Cutline::CanvasSize dimensionsFor(const juce::String& aspectRatioKey) const override
        {
            if (aspectRatioKey == "9:16")
                return { -1080, 1920 };

            return Cutline::Geometry::canvasForAspectRatioKey(aspectRatioKey);
        }
    };

    Cutline::EditorSession makeSession(const juce::String& projectId,
                                       Cutline::Render::Scheduler& scheduler,
                                       Cutline::Persistence::AutosaveStore* store,
                                       Cutline::Render::Renderer* renderer = nullptr)
    {
        Cutline::EditorSettings settings;
        settings.autosaveIntervalMs = 1000;

        Cutline::EditorSession::Collaborators collaborators;
        collaborators.scheduler = &scheduler;
        collaborators.autosaveStore = store;
        collaborators.renderer = renderer;
        return Cutline::EditorSession(projectId, settings, collaborators);
    }

    Cutline::MediaDescriptor media(Cutline::OverlayType type, const juce::String& src, std::optional<double> seconds = std::nullopt)
    {
        Cutline::MediaDescriptor descriptor;
        descriptor.type = type;
        descriptor.src = src;
        descriptor.durationSeconds = seconds;
        return descriptor;
    }

    juce::Result recordTimestamp(Cutline::Persistence::AutosaveStore& store, const juce::String& projectId, juce::int64& timestampOut)
    {
        Cutline::SavedSessionRecord record;
        const auto result = store.load(projectId, record);
        if (result.failed())
            return juce::Result::fail("load failed: " + result.getErrorMessage());

        timestampOut = record.timestampMs;
        return juce::Result::ok();
    }

    juce::Result testAutosaveWritesOnlyOnChange()
    {
        ScopedTempDirectory temp;
        Cutline::Persistence::AutosaveStore store(temp.directory);
        ManualScheduler scheduler;
        auto session = makeSession("reel", scheduler, &store);

        session.startAutosave();
        if (!session.isAutosaving())
            return juce::Result::fail("autosave did not start");

        scheduler.advance(1000);
        juce::int64 timestamp = 0;
        auto result = recordTimestamp(store, "reel", timestamp);
        if (result.failed())
            return juce::Result::fail("first tick must write a record: " + result.getErrorMessage());
        if (timestamp != 1000)
            return juce::Result::fail("record timestamp must come from the scheduler clock");

        scheduler.advance(1000);
        result = recordTimestamp(store, "reel", timestamp);
        if (result.failed() || timestamp != 1000)
            return juce::Result::fail("unchanged state must not be written again");

        if (!session.addMedia(media(Cutline::OverlayType::video, "clip.mp4", 2.0), 0, 0).has_value())
            return juce::Result::fail("addMedia failed: " + session.lastEditResult().getErrorMessage());

        scheduler.advance(1000);
        result = recordTimestamp(store, "reel", timestamp);
        if (result.failed() || timestamp != 3000)
            return juce::Result::fail("an edit must be written on the next tick");

        bool wrote = true;
        if (session.autosaveIfChanged(&wrote).failed() || wrote)
            return juce::Result::fail("autosaveIfChanged must skip unchanged state");

        session.stopAutosave();
        session.setBackgroundColor("black");
        scheduler.advance(5000);
        result = recordTimestamp(store, "reel", timestamp);
        if (result.failed() || timestamp != 3000 || session.isAutosaving())
            return juce::Result::fail("stopped autosave must not write");
        if (scheduler.pendingCount() != 0)
            return juce::Result::fail("stopped autosave must not reschedule");

        return juce::Result::ok();
    }

    juce::Result testRestoreSavedSession()
    {
        ScopedTempDirectory temp;
        Cutline::Persistence::AutosaveStore store(temp.directory);
        ManualScheduler scheduler;

        std::vector<Cutline::OverlayModel> savedOverlays;
        {
            auto session = makeSession("trailer", scheduler, &store);
            session.setAspectRatio(Cutline::AspectRatio::square);
            session.setPlaybackRate(1.5);
            session.setBackgroundColor("#101010");
            if (!session.addMedia(media(Cutline::OverlayType::image, "poster.png"), 0, 0).has_value()
                || !session.addMedia(media(Cutline::OverlayType::sound, "score.mp3", 4.0), 1, 15).has_value())
                return juce::Result::fail("setup edits failed");

            const auto saved = session.saveNow();
            if (saved.failed())
                return juce::Result::fail("saveNow failed: " + saved.getErrorMessage());

            savedOverlays = session.overlays();
        }

        auto restored = makeSession("trailer", scheduler, &store);
        if (!restored.hasSavedState())
            return juce::Result::fail("saved state must be visible to a new session");

        const auto result = restored.restoreSaved();
        if (result.failed())
            return juce::Result::fail("restore failed: " + result.getErrorMessage());

        if (restored.aspectRatio() != Cutline::AspectRatio::square || !nearlyEqual(restored.playbackRate(), 1.5)
            || restored.backgroundColor() != "#101010")
            return juce::Result::fail("session settings not restored");

        if (restored.overlays().size() != savedOverlays.size())
            return juce::Result::fail("overlay count mismatch after restore");

        for (size_t i = 0; i < savedOverlays.size(); ++i)
        {
            const auto& lhs = savedOverlays[i];
            const auto& rhs = restored.overlays()[i];
            if (lhs.id != rhs.id || lhs.from != rhs.from || lhs.durationInFrames != rhs.durationInFrames
                || lhs.row != rhs.row || lhs.bounds != rhs.bounds || lhs.type() != rhs.type())
                return juce::Result::fail("overlay " + juce::String(lhs.id) + " changed across save/restore");
        }

        if (restored.findOverlay(0)->bounds != juce::Rectangle<int> { 0, 0, 1080, 1080 })
            return juce::Result::fail("restored overlays must keep the geometry of their saved canvas");
        if (!restored.selectedOverlayIds().empty() || restored.canUndo())
            return juce::Result::fail("restore starts with no selection and no history");

        bool wrote = true;
        if (restored.autosaveIfChanged(&wrote).failed() || wrote)
            return juce::Result::fail("a freshly restored session has nothing to autosave");

        const auto newId = restored.addMedia(media(Cutline::OverlayType::text, "Hello"), 2, 0);
        if (!newId.has_value() || *newId != 2)
            return juce::Result::fail("ids must continue after the restored overlays");

        auto missing = makeSession("never-saved", scheduler, &store);
        if (missing.hasSavedState() || missing.restoreSaved().wasOk())
            return juce::Result::fail("restoring an unknown project must fail");

        return juce::Result::ok();
    }

    juce::Result testAutosaveStoreListing()
    {
        ScopedTempDirectory temp;
        Cutline::Persistence::AutosaveStore store(temp.directory);

        for (const auto& [projectId, timestamp] : std::vector<std::pair<juce::String, juce::int64>> {
                 { "alpha", 100 }, { "beta", 300 }, { "gamma", 200 } })
        {
            Cutline::SavedSessionRecord record;
            record.projectId = projectId;
            record.timestampMs = timestamp;
            record.editorState.overlays = { makeTextOverlay(0, 30, 0) };
            const auto saved = store.save(record);
            if (saved.failed())
                return juce::Result::fail("save failed: " + saved.getErrorMessage());
        }

        if (!temp.directory.getChildFile("broken.json").replaceWithText("{ not json"))
            return juce::Result::fail("could not write the broken record");

        std::vector<Cutline::SavedSessionRecord> records;
        juce::StringArray skipped;
        auto result = store.list(records, &skipped);
        if (result.failed())
            return juce::Result::fail("list failed: " + result.getErrorMessage());

        if (records.size() != 3 || records[0].projectId != "beta" || records[1].projectId != "gamma" || records[2].projectId != "alpha")
            return juce::Result::fail("records must be listed newest first");
        if (skipped.size() != 1 || skipped[0] != "broken.json")
            return juce::Result::fail("unreadable records must be reported as skipped");

        Cutline::SavedSessionRecord loaded;
        if (store.load("broken", loaded).wasOk())
            return juce::Result::fail("loading a broken record must fail");

        if (store.remove("beta").failed() || store.hasRecord("beta"))
            return juce::Result::fail("remove failed");
        if (store.remove("beta").failed())
            return juce::Result::fail("removing a missing record is not an error");

        if (store.clear().failed())
            return juce::Result::fail("clear failed");

        result = store.list(records, nullptr);
        if (result.failed() || !records.empty())
            return juce::Result::fail("clear must delete every record");

        Cutline::SavedSessionRecord nameless;
        if (store.save(nameless).wasOk())
            return juce::Result::fail("records without a project id must be rejected");

        return juce::Result::ok();
    }

    juce::Result testAutosaveFailureIsRecoverable()
    {
        ScopedTempDirectory temp;
        const auto blocker = temp.directory.getChildFile("blocker");
        if (!blocker.replaceWithText("occupied"))
            return juce::Result::fail("could not create the blocking file");

        Cutline::Persistence::AutosaveStore store(blocker.getChildFile("autosave"));
        ManualScheduler scheduler;
        auto session = makeSession("blocked", scheduler, &store);

        juce::StringArray reported;
        session.onAutosaveError = [&reported](const juce::String& message)
        {
            reported.add(message);
        };

        if (!session.addMedia(media(Cutline::OverlayType::text, "Title"), 0, 0).has_value())
            return juce::Result::fail("setup edit failed");

        session.startAutosave();
        scheduler.advance(1000);

        if (reported.size() != 1 || session.lastAutosaveError().wasOk())
            return juce::Result::fail("a failed write must be reported once");
        if (session.overlays().size() != 1)
            return juce::Result::fail("a failed write must not touch the overlays");

        if (!session.addMedia(media(Cutline::OverlayType::text, "Second"), 0, 0).has_value())
            return juce::Result::fail("edits must keep working after a failed write");

        scheduler.advance(1000);
        if (reported.size() != 2 || !session.isAutosaving())
            return juce::Result::fail("autosave must keep retrying after a failure");

        session.stopAutosave();
        return juce::Result::ok();
    }

    juce::Result testRestoreFailureIsReported()
    {
        ScopedTempDirectory temp;
        Cutline::Persistence::AutosaveStore store(temp.directory);
        ManualScheduler scheduler;
        auto session = makeSession("damaged", scheduler, &store);

        juce::StringArray reported;
        session.onAutosaveError = [&reported](const juce::String& message)
        {
            reported.add(message);
        };

        if (!session.addMedia(media(Cutline::OverlayType::text, "Keep me"), 0, 0).has_value())
            return juce::Result::fail("setup edit failed");

        if (!store.fileForProject("damaged").replaceWithText("{ not json"))
            return juce::Result::fail("could not write the damaged record");
        if (!session.hasSavedState())
            return juce::Result::fail("the damaged record must still count as saved state");

        if (session.restoreSaved().wasOk())
            return juce::Result::fail("restoring a damaged record must fail");
        if (reported.size() != 1 || session.lastAutosaveError().wasOk())
            return juce::Result::fail("a failed restore must be reported and kept as the last autosave error");
        if (session.overlays().size() != 1 || !session.canUndo())
            return juce::Result::fail("a failed restore must leave the session untouched");

        Cutline::SavedSessionRecord foreign;
        foreign.projectId = "someone-else";
        if (Cutline::Serialization::saveSessionRecordToFile(store.fileForProject("damaged"), foreign).failed())
            return juce::Result::fail("could not write the foreign record");

        if (session.restoreSaved().wasOk() || reported.size() != 2)
            return juce::Result::fail("a record for another project must be reported as a failed restore");

        if (session.saveNow().failed() || session.lastAutosaveError().failed())
            return juce::Result::fail("a successful save must clear the last autosave error");

        return juce::Result::ok();
    }

    juce::Result testRejectedRescaleKeepsRatio()
    {
        ManualScheduler scheduler;
        BrokenPortraitCanvas canvas;

        Cutline::EditorSession::Collaborators collaborators;
        collaborators.scheduler = &scheduler;
        collaborators.canvas = &canvas;
        Cutline::EditorSession session("broken-canvas", Cutline::EditorSettings {}, collaborators);

        const auto id = session.addOverlay(makeTextOverlay(0, 30, 0, { 640, 360, 100, 50 }));
        if (!id.has_value())
            return juce::Result::fail("addOverlay failed");

        int changes = 0;
        session.onChanged = [&changes] { ++changes; };

        if (session.setAspectRatio(Cutline::AspectRatio::portraitLong))
            return juce::Result::fail("a rescale onto an invalid canvas must be rejected");
        if (session.lastEditResult().wasOk())
            return juce::Result::fail("a rejected rescale must report a reason");
        if (session.aspectRatio() != Cutline::AspectRatio::widescreen || session.canvasSize() != Cutline::CanvasSize { 1280, 720 })
            return juce::Result::fail("a rejected rescale must keep the old ratio");
        if (session.findOverlay(*id)->bounds != juce::Rectangle<int> { 640, 360, 100, 50 })
            return juce::Result::fail("a rejected rescale must keep the overlay geometry");
        if (!session.canUndo() || changes != 0)
            return juce::Result::fail("a rejected rescale must keep history and stay silent");

        if (!session.setAspectRatio(Cutline::AspectRatio::square)
            || session.findOverlay(*id)->bounds != juce::Rectangle<int> { 540, 540, 84, 75 })
            return juce::Result::fail("a valid canvas must still be accepted afterwards");

        return juce::Result::ok();
    }

    juce::Result testMediaDrop()
    {
        ManualScheduler scheduler;
        auto session = makeSession("drop", scheduler, nullptr);

        const auto videoId = session.addMedia(media(Cutline::OverlayType::video, "clip.mp4", 2.5), 0, 10);
        if (!videoId.has_value())
            return juce::Result::fail("video drop failed: " + session.lastEditResult().getErrorMessage());

        const auto* video = session.findOverlay(*videoId);
        if (video->from != 10 || video->durationInFrames != 75 || video->bounds != juce::Rectangle<int> { 0, 0, 1280, 720 })
            return juce::Result::fail("video must fill the canvas for its duration");
        const auto& videoContent = std::get<Cutline::VideoContent>(video->payload);
        if (videoContent.src != "clip.mp4" || !videoContent.mediaSrcDuration.has_value() || !nearlyEqual(*videoContent.mediaSrcDuration, 2.5))
            return juce::Result::fail("video payload mismatch");
        if (session.selectedOverlayId() != videoId)
            return juce::Result::fail("a dropped item must become the selection");

        const auto imageId = session.addMedia(media(Cutline::OverlayType::image, "still.png"), 0, 0);
        if (!imageId.has_value())
            return juce::Result::fail("image drop failed");
        const auto* image = session.findOverlay(*imageId);
        if (image->durationInFrames != 150 || image->from != 85)
            return juce::Result::fail("image must last 150 frames and skip past the video");

        const auto soundId = session.addMedia(media(Cutline::OverlayType::sound, "voice.wav"), 1, 0);
        const auto* sound = soundId.has_value() ? session.findOverlay(*soundId) : nullptr;
        if (sound == nullptr || sound->durationInFrames != 150 || sound->bounds != juce::Rectangle<int> { 0, 0, 1920, 100 })
            return juce::Result::fail("sound without a duration must default to five seconds");
        if (std::get<Cutline::SoundContent>(sound->payload).content != "Audio")
            return juce::Result::fail("unlabelled sound must be called Audio");

        auto label = media(Cutline::OverlayType::text, {});
        label.label = "Opening";
        const auto textId = session.addMedia(label, 2, 0);
        const auto* text = textId.has_value() ? session.findOverlay(*textId) : nullptr;
        if (text == nullptr || text->durationInFrames != 90 || std::get<Cutline::TextContent>(text->payload).content != "Opening")
            return juce::Result::fail("text drop mismatch");

        if (session.addMedia(media(Cutline::OverlayType::sticker, "star"), 0, 0).has_value())
            return juce::Result::fail("unsupported media types must be rejected");
        if (session.lastEditResult().wasOk())
            return juce::Result::fail("rejected drop must report a reason");
        if (session.addMedia(media(Cutline::OverlayType::video, "clip.mp4"), -1, 0).has_value())
            return juce::Result::fail("negative rows must be rejected");

        if (session.durationInFrames() != 235)
            return juce::Result::fail("composition duration must follow the last overlay, got " + juce::String(session.durationInFrames()));

        return juce::Result::ok();
    }

    juce::Result testCaptionEditing()
    {
        ManualScheduler scheduler;
        auto session = makeSession("subs", scheduler, nullptr);

        const juce::String srt = "1\n00:00:00,000 --> 00:00:01,000\nHello world\n\n"
                                 "2\n00:00:01,500 --> 00:00:04,000\nSee you soon\n";
        const auto id = session.importSrt(srt, 3, 30);
        if (!id.has_value())
            return juce::Result::fail("SRT import failed: " + session.lastEditResult().getErrorMessage());

        const auto* overlay = session.findOverlay(*id);
        if (overlay->type() != Cutline::OverlayType::caption || overlay->from != 30 || overlay->durationInFrames != 120)
            return juce::Result::fail("caption overlay must span every caption");
        if (overlay->bounds != juce::Rectangle<int> { 0, 570, 1280, 113 })
            return juce::Result::fail("caption overlay must sit in the lower band, got " + overlay->bounds.toString());
        if (overlay->styles["fontFamily"].toString() != "Outfit")
            return juce::Result::fail("caption styles missing");

        if (!session.editCaptionText(*id, 0, "  Hi there friend "))
            return juce::Result::fail("caption text edit failed: " + session.lastEditResult().getErrorMessage());

        const auto* edited = session.findOverlay(*id);
        const auto& first = std::get<Cutline::CaptionContent>(edited->payload).captions[0];
        if (first.text != "Hi there friend" || first.words.size() != 3 || !nearlyEqual(first.words[1].startMs, 333.0))
            return juce::Result::fail("text edit must rebuild and re-time the words");

        if (session.editCaptionText(*id, 0, "   "))
            return juce::Result::fail("blank caption text must be rejected");
        if (session.editCaptionTiming(*id, 1, 900.0, 3000.0))
            return juce::Result::fail("timing overlapping the previous caption must be rejected");
        if (session.editCaptionTiming(*id, 5, 0.0, 100.0))
            return juce::Result::fail("out-of-range caption index must be rejected");

        if (!session.editCaptionTiming(*id, 1, 2000.0, 3000.0))
            return juce::Result::fail("valid timing edit failed: " + session.lastEditResult().getErrorMessage());

        const auto& second = std::get<Cutline::CaptionContent>(session.findOverlay(*id)->payload).captions[1];
        if (!nearlyEqual(second.startMs, 2000.0) || second.words.size() != 3 || !nearlyEqual(second.words[2].endMs, 3000.0)
            || second.words[0].word != "See")
            return juce::Result::fail("timing edit must keep the words and spread them over the new span");

        if (!session.undo() || !nearlyEqual(std::get<Cutline::CaptionContent>(session.findOverlay(*id)->payload).captions[1].startMs, 1500.0))
            return juce::Result::fail("caption edits must be undoable");

        if (session.importSrt("garbage", 4, 0).has_value())
            return juce::Result::fail("invalid SRT must be rejected");

        const auto generated = session.addCaptionsFromText("First line. Second line!", 4, 0);
        if (!generated.has_value()
            || std::get<Cutline::CaptionContent>(session.findOverlay(*generated)->payload).captions.size() != 2)
            return juce::Result::fail("caption generation from text failed");

        return juce::Result::ok();
    }

    juce::Result testAspectRatioAndEditing()
    {
        ManualScheduler scheduler;
        auto session = makeSession("canvas", scheduler, nullptr);

        const auto id = session.addOverlay(makeTextOverlay(0, 90, 0, { 640, 360, 100, 50 }));
        if (!id.has_value())
            return juce::Result::fail("addOverlay failed");

        session.playback().seekTo(30);
        const auto tailId = session.splitAtPlayhead(*id);
        if (!tailId.has_value() || session.findOverlay(*tailId)->from != 30)
            return juce::Result::fail("split at the playhead failed");

        if (!session.setAspectRatio(Cutline::AspectRatio::portraitLong))
            return juce::Result::fail("aspect change failed: " + session.lastEditResult().getErrorMessage());
        if (session.canvasSize() != Cutline::CanvasSize { 1080, 1920 })
            return juce::Result::fail("canvas must follow the aspect ratio");

        for (const auto overlayId : { *id, *tailId })
        {
            if (session.findOverlay(overlayId)->bounds != juce::Rectangle<int> { 540, 960, 84, 133 })
                return juce::Result::fail("overlays must be rescaled to the new canvas");
        }
        if (session.canUndo())
            return juce::Result::fail("an aspect change must drop edit history");

        session.setAspectRatioWithoutTransform(Cutline::AspectRatio::widescreen);
        if (session.findOverlay(*id)->bounds != juce::Rectangle<int> { 540, 960, 84, 133 })
            return juce::Result::fail("the non-transforming setter must leave overlays alone");

        Cutline::PropertyBag crop;
        crop.set(Cutline::StyleKeys::cropX, 50.0);
        crop.set(Cutline::StyleKeys::cropWidth, 50.0);
        if (!session.updateStyles(*id, crop))
            return juce::Result::fail("crop style update failed: " + session.lastEditResult().getErrorMessage());
        if (!session.applyCrop(*id) || session.findOverlay(*id)->bounds != juce::Rectangle<int> { 582, 960, 42, 133 })
            return juce::Result::fail("applyCrop must move the bounds onto the visible half");
        if (session.applyCrop(*id))
            return juce::Result::fail("applying a default crop must be rejected");

        if (session.setPlaybackRate(0.0) || !session.setPlaybackRate(2.0))
            return juce::Result::fail("playback rate must be positive");

        int changes = 0;
        session.onChanged = [&changes] { ++changes; };
        if (!session.deleteOverlay(*tailId) || changes != 1)
            return juce::Result::fail("a successful edit must notify once");
        if (session.deleteOverlay(*tailId) || changes != 1)
            return juce::Result::fail("a rejected edit must not notify");

        if (!session.resetOverlays() || !session.overlays().empty())
            return juce::Result::fail("reset must clear every overlay");
        if (!session.undo() || session.overlays().size() != 1)
            return juce::Result::fail("reset must be undoable");

        return juce::Result::ok();
    }

    juce::Result testRenderThroughSession()
    {
        ManualScheduler scheduler;
        FakeRenderer renderer;
        auto session = makeSession("render", scheduler, nullptr, &renderer);

        std::vector<Cutline::Render::RenderStatus> statuses;
        session.onRenderStateChanged = [&statuses](const Cutline::Render::RenderState& state)
        {
            statuses.push_back(state.status);
        };

        if (!session.addMedia(media(Cutline::OverlayType::video, "clip.mp4", 3.0), 0, 0).has_value())
            return juce::Result::fail("setup failed");

        const auto props = session.compositionProps();
        if (props.width != 1280 || props.height != 720 || props.fps != 30 || props.durationInFrames != 90 || props.src.isNotEmpty())
            return juce::Result::fail("composition props mismatch");

        juce::String json;
        if (Cutline::Serialization::compositionPropsToJsonString(props, json).failed())
            return juce::Result::fail("composition props must serialize");

        const auto parsedProps = juce::JSON::parse(json);
        if (static_cast<int>(parsedProps.getProperty("durationInFrames", {})) != 90
            || static_cast<int>(parsedProps.getProperty("width", {})) != 1280)
            return juce::Result::fail("composition JSON mismatch: " + json);

        if (!session.renderMedia() || session.renderMedia())
            return juce::Result::fail("only one render may be in flight");
        if (renderer.startCalls != 1 || renderer.lastCompositionId != Cutline::EditorSession::kCompositionId)
            return juce::Result::fail("renderer must be asked once for the Main composition");

        renderer.replyStart(juce::Result::ok(), { "job-7", {} });
        scheduler.advance(100);
        renderer.replyProgressFraction(0.5);

        if (session.renderState().status != Cutline::Render::RenderStatus::rendering || !nearlyEqual(session.renderState().progress, 0.5))
            return juce::Result::fail("render progress must be visible through the session");

        session.resetRender();
        if (session.renderState().status != Cutline::Render::RenderStatus::init || statuses.back() != Cutline::Render::RenderStatus::init)
            return juce::Result::fail("resetRender must return to init");

        auto headless = makeSession("headless", scheduler, nullptr);
        if (headless.renderMedia() || headless.renderState().status != Cutline::Render::RenderStatus::init)
            return juce::Result::fail("a session without a renderer must refuse to render");

        return juce::Result::ok();
    }

    juce::Result testSessionRecordJson()
    {
        Cutline::SavedSessionRecord record;
        record.projectId = "json";
        record.timestampMs = 1700000000000;
        record.editorState.aspectRatio = Cutline::AspectRatio::portraitMedium;
        record.editorState.playbackRate = 0.5;

        auto sound = makeTextOverlay(0, 60, 1);
        Cutline::SoundContent soundContent;
        soundContent.src = "a.mp3";
        soundContent.startFromSound = 1.25;
        soundContent.waveform = Cutline::WaveformData { { 0.5f, 0.25f }, 480 };
        sound.payload = soundContent;
        sound.id = 4;

        auto caption = makeTextOverlay(0, 30, 2);
        Cutline::CaptionContent captionContent;
        Cutline::Caption line;
        line.text = "Hi";
        line.startMs = 0.0;
        line.endMs = 500.0;
        line.words = { { "Hi", 0.0, 500.0, 0.9 } };
        captionContent.captions = { line };
        caption.payload = captionContent;
        caption.id = 9;

        record.editorState.overlays = { makeTextOverlay(10, 20, 0), sound, caption };
        record.editorState.selectedOverlayIds = { 4 };

        juce::String json;
        auto result = Cutline::Serialization::serializeSessionRecordToJsonString(record, json);
        if (result.failed())
            return juce::Result::fail("serialize failed: " + result.getErrorMessage());

        Cutline::SavedSessionRecord parsed;
        result = Cutline::Serialization::parseSessionRecordFromJsonString(json, parsed);
        if (result.failed())
            return juce::Result::fail("parse failed: " + result.getErrorMessage());

        if (parsed.projectId != "json" || parsed.timestampMs != 1700000000000 || parsed.editorState.overlays.size() != 3)
            return juce::Result::fail("record header mismatch");
        if (parsed.editorState.aspectRatio != Cutline::AspectRatio::portraitMedium || !nearlyEqual(parsed.editorState.playbackRate, 0.5))
            return juce::Result::fail("editor state mismatch");
        if (parsed.editorState.selectedOverlayIds != std::vector<Cutline::OverlayId> { 4 })
            return juce::Result::fail("selection mismatch");

        const auto& parsedSound = std::get<Cutline::SoundContent>(parsed.editorState.overlays[1].payload);
        if (!nearlyEqual(parsedSound.startFromSound, 1.25) || !parsedSound.waveform.has_value()
            || parsedSound.waveform->peaks.size() != 2 || parsedSound.waveform->length != 480)
            return juce::Result::fail("sound payload mismatch");

        const auto& parsedCaption = std::get<Cutline::CaptionContent>(parsed.editorState.overlays[2].payload);
        if (parsedCaption.captions.size() != 1 || parsedCaption.captions[0].words.size() != 1
            || !nearlyEqual(parsedCaption.captions[0].words[0].confidence, 0.9))
            return juce::Result::fail("caption payload mismatch");

        if (Cutline::Serialization::parseSessionRecordFromJsonString(R"({"id":"x"})", parsed).wasOk())
            return juce::Result::fail("records without editorState must be rejected");
        if (Cutline::Serialization::parseSessionRecordFromJsonString(
                R"({"id":"x","version":{"major":2,"minor":0,"patch":0},"editorState":{"overlays":[]}})", parsed).wasOk())
            return juce::Result::fail("records from another major version must be rejected");
        if (Cutline::Serialization::parseSessionRecordFromJsonString(
                R"({"id":"x","editorState":{"overlays":[],"aspectRatio":"3:2"}})", parsed).wasOk())
            return juce::Result::fail("unknown aspect ratios must be rejected");

        record.editorState.overlays.push_back(makeTextOverlay(15, 10, 0));
        record.editorState.overlays.back().id = 11;
        if (Cutline::Serialization::serializeSessionRecordToJsonString(record, json).wasOk())
            return juce::Result::fail("overlapping overlays must not be saved");

        return juce::Result::ok();
    }

    juce::Result testSettingsFile()
    {
        ScopedTempDirectory temp;
        auto options = Cutline::EditorSettings::defaultFileOptions();
        options.millisecondsBeforeSaving = -1;
        const auto file = temp.directory.getChildFile("cutline.settings");

        {
            juce::PropertiesFile properties(file, options);
            Cutline::EditorSettings settings;
            settings.fps = 24;
            settings.autosaveIntervalMs = 5000;
            settings.defaultAspectRatio = Cutline::AspectRatio::portraitLong;
            settings.rendererBaseUrl = "http://localhost:3000/api/latest/lambda";
            settings.saveTo(properties);
            if (!properties.saveIfNeeded())
                return juce::Result::fail("settings file could not be written");
        }

        juce::PropertiesFile properties(file, options);
        auto loaded = Cutline::EditorSettings::loadFrom(properties);
        if (loaded.fps != 24 || loaded.autosaveIntervalMs != 5000 || loaded.defaultAspectRatio != Cutline::AspectRatio::portraitLong
            || loaded.rendererBaseUrl != "http://localhost:3000/api/latest/lambda" || loaded.historyLimit != 256)
            return juce::Result::fail("settings did not survive a save/load");
        if (loaded.validate().failed())
            return juce::Result::fail("loaded settings must validate");

        properties.setValue("fps", "fast");
        properties.setValue("historyLimit", 0);
        properties.setValue("defaultAspectRatio", "cinema");
        loaded = Cutline::EditorSettings::loadFrom(properties);
        if (loaded.fps != Cutline::kDefaultFps || loaded.historyLimit != 256 || loaded.defaultAspectRatio != Cutline::AspectRatio::widescreen)
            return juce::Result::fail("malformed settings must fall back to defaults");

        Cutline::EditorSettings invalid;
        invalid.pollingIntervalMs = -5;
        if (invalid.validate().wasOk())
            return juce::Result::fail("negative intervals must not validate");

        ManualScheduler scheduler;
        Cutline::EditorSession::Collaborators collaborators;
        collaborators.scheduler = &scheduler;
        Cutline::EditorSession session("settings", loaded, collaborators);
        if (session.fps() != Cutline::kDefaultFps || session.aspectRatio() != Cutline::AspectRatio::widescreen)
            return juce::Result::fail("session must start from its settings");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Autosave writes only on change", testAutosaveWritesOnlyOnChange },
        { "Restore saved session", testRestoreSavedSession },
        { "Autosave store listing", testAutosaveStoreListing },
        { "Autosave failure is recoverable", testAutosaveFailureIsRecoverable },
        { "Restore failure is reported", testRestoreFailureIsReported },
        { "Rejected rescale keeps ratio", testRejectedRescaleKeepsRatio },
        { "Media drop", testMediaDrop },
        { "Caption editing", testCaptionEditing },
        { "Aspect ratio and editing", testAspectRatioAndEditing },
        { "Render through session", testRenderThroughSession },
        { "Session record JSON", testSessionRecordJson },
        { "Settings file", testSettingsFile }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Cutline session smoke passed." << std::endl;
    return 0;
}
