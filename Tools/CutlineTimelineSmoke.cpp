#include <juce_core/juce_core.h>

#include "Cutline/Core/Captions.h"
#include "Cutline/Core/Geometry.h"
#include "Cutline/Core/OverlayStore.h"
#include "Cutline/Core/RowLayout.h"
#include "Cutline/Session/MediaDrop.h"
#include "SmokeSupport.h"

#include <functional>
#include <iostream>
#include <vector>

namespace
{
    using CutlineSmoke::findOverlay;
    using CutlineSmoke::makeTextOverlay;
    using CutlineSmoke::nearlyEqual;

    juce::Result addOverlay(Cutline::Core::OverlayStore& store, Cutline::OverlayModel overlay, Cutline::OverlayId& idOut)
    {
        std::vector<Cutline::OverlayId> createdIds;
        const auto result = store.apply(Cutline::AddOverlayAction { std::move(overlay) }, &createdIds);
        if (result.failed())
            return juce::Result::fail("add overlay failed: " + result.getErrorMessage());
        if (createdIds.size() != 1)
            return juce::Result::fail("add overlay returned unexpected id count");

        idOut = createdIds.front();
        return juce::Result::ok();
    }

    Cutline::Caption makeCaption(const juce::String& text, double startMs, double endMs)
    {
        Cutline::Caption caption;
        caption.text = text;
        caption.startMs = startMs;
        caption.endMs = endMs;
        caption.confidence = Cutline::Captions::kImportedConfidence;
        caption.words = Cutline::Captions::distributeWordTiming(Cutline::Captions::splitWords(text), startMs, endMs);
        return caption;
    }

    juce::Result testSplitAtFrameThirty()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId id = 0;
        auto result = addOverlay(store, makeTextOverlay(0, 90, 0), id);
        if (result.failed())
            return result;

        std::vector<Cutline::OverlayId> createdIds;
        result = store.apply(Cutline::SplitOverlayAction { id, 30 }, &createdIds);
        if (result.failed())
            return juce::Result::fail("split failed: " + result.getErrorMessage());

        const auto& overlays = store.overlays();
        if (overlays.size() != 2 || createdIds.size() != 1)
            return juce::Result::fail("split must produce exactly two overlays");

        const auto* first = findOverlay(overlays, id);
        const auto* second = findOverlay(overlays, createdIds.front());
        if (first == nullptr || second == nullptr)
            return juce::Result::fail("split halves missing");

        if (first->from != 0 || first->durationInFrames != 30)
            return juce::Result::fail("first half must be [0, 30)");
        if (second->from != 30 || second->durationInFrames != 60 || second->row != 0)
            return juce::Result::fail("second half must be [30, 90) on row 0");
        if (second->id == first->id)
            return juce::Result::fail("second half needs a fresh id");
        if (overlays[1].id != second->id)
            return juce::Result::fail("second half must follow the first in the overlay list");

        return juce::Result::ok();
    }

    juce::Result testSplitPreservesDurationAndIgnoresBoundaries()
    {
        for (int frame = 11; frame < 57; frame += 5)
        {
            Cutline::Core::OverlayStore store;
            Cutline::OverlayId id = 0;
            auto result = addOverlay(store, makeTextOverlay(10, 47, 2), id);
            if (result.failed())
                return result;

            result = store.apply(Cutline::SplitOverlayAction { id, frame });
            if (result.failed())
                return juce::Result::fail("split at " + juce::String(frame) + " failed: " + result.getErrorMessage());

            const auto& overlays = store.overlays();
            if (overlays[0].durationInFrames + overlays[1].durationInFrames != 47)
                return juce::Result::fail("split at " + juce::String(frame) + " lost frames");
        }

        Cutline::Core::OverlayStore store;
        Cutline::OverlayId id = 0;
        auto result = addOverlay(store, makeTextOverlay(10, 47, 2), id);
        if (result.failed())
            return result;

        const auto depthBefore = store.undoDepth();
        for (const auto frame : { 10, 57, 0, 200 })
        {
            if (store.apply(Cutline::SplitOverlayAction { id, frame }).wasOk())
                return juce::Result::fail("split at " + juce::String(frame) + " must be rejected");
        }

        if (store.overlays().size() != 1 || store.overlays().front().durationInFrames != 47)
            return juce::Result::fail("rejected split changed the overlay list");
        if (store.undoDepth() != depthBefore)
            return juce::Result::fail("rejected split must not record history");

        if (store.apply(Cutline::SplitOverlayAction { id + 40, 20 }).wasOk())
            return juce::Result::fail("split of an absent id must be rejected");

        return juce::Result::ok();
    }

    juce::Result testDuplicateSkipsPastConflicts()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId firstId = 0;
        Cutline::OverlayId secondId = 0;
        auto result = addOverlay(store, makeTextOverlay(0, 50, 0), firstId);
        if (result.failed())
            return result;
        result = addOverlay(store, makeTextOverlay(50, 50, 0), secondId);
        if (result.failed())
            return result;

        std::vector<Cutline::OverlayId> createdIds;
        result = store.apply(Cutline::DuplicateOverlayAction { firstId }, &createdIds);
        if (result.failed())
            return juce::Result::fail("duplicate failed: " + result.getErrorMessage());

        if (createdIds.size() != 1)
            return juce::Result::fail("duplicate must create one overlay");

        const auto* copy = findOverlay(store.overlays(), createdIds.front());
        if (copy == nullptr)
            return juce::Result::fail("duplicate missing from the overlay list");
        if (copy->from != 100 || copy->durationInFrames != 50 || copy->row != 0)
            return juce::Result::fail("duplicate must land at [100, 150) on row 0, got from=" + juce::String(copy->from));
        if (copy->id == firstId || copy->id == secondId)
            return juce::Result::fail("duplicate must receive a fresh id");
        if (CutlineSmoke::rowHasOverlap(store.overlays(), 0))
            return juce::Result::fail("duplicate introduced an overlap");

        return juce::Result::ok();
    }

    juce::Result testDuplicateNeverOverlaps()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId sourceId = 0;
        Cutline::OverlayId ignored = 0;

        auto result = addOverlay(store, makeTextOverlay(0, 30, 0), sourceId);
        if (result.failed())
            return result;
        for (const auto& [from, duration] : std::vector<std::pair<int, int>> { { 40, 20 }, { 60, 40 }, { 130, 5 } })
        {
            result = addOverlay(store, makeTextOverlay(from, duration, 0), ignored);
            if (result.failed())
                return result;
        }
        result = addOverlay(store, makeTextOverlay(30, 10, 1), ignored);
        if (result.failed())
            return result;

        for (int i = 0; i < 4; ++i)
        {
            std::vector<Cutline::OverlayId> createdIds;
            result = store.apply(Cutline::DuplicateOverlayAction { sourceId }, &createdIds);
            if (result.failed())
                return juce::Result::fail("duplicate failed: " + result.getErrorMessage());

            for (int row = 0; row < 2; ++row)
            {
                if (CutlineSmoke::rowHasOverlap(store.overlays(), row))
                    return juce::Result::fail("row " + juce::String(row) + " overlaps after duplicate " + juce::String(i));
            }
        }

        const auto firstCopyFrom = store.overlays()[5].from;
        if (firstCopyFrom != 100)
            return juce::Result::fail("first copy must skip to frame 100, got " + juce::String(firstCopyFrom));

        const auto sizeBefore = store.overlays().size();
        if (store.apply(Cutline::DuplicateOverlayAction { 999 }).wasOk())
            return juce::Result::fail("duplicate of an absent id must be rejected");
        if (store.overlays().size() != sizeBefore)
            return juce::Result::fail("rejected duplicate changed the overlay list");

        return juce::Result::ok();
    }

    juce::Result testAddAndChangeRespectRows()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId firstId = 0;
        Cutline::OverlayId secondId = 0;
        auto result = addOverlay(store, makeTextOverlay(0, 50, 0), firstId);
        if (result.failed())
            return result;

        result = addOverlay(store, makeTextOverlay(20, 10, 0), secondId);
        if (result.failed())
            return result;

        const auto* second = findOverlay(store.overlays(), secondId);
        if (second == nullptr || second->from != 50)
            return juce::Result::fail("add onto an occupied slot must move past the conflict");

        Cutline::OverlayPatch overlapping;
        overlapping.from = 45;
        if (store.apply(Cutline::ChangeOverlayAction { secondId, overlapping }).wasOk())
            return juce::Result::fail("change into an occupied slot must be rejected");

        Cutline::OverlayPatch moveRow;
        moveRow.row = 1;
        moveRow.from = 10;
        moveRow.bounds = juce::Rectangle<int> { 5, 6, 70, 80 };
        moveRow.styles.set(Cutline::StyleKeys::opacity, 0.5);
        result = store.apply(Cutline::ChangeOverlayAction { secondId, moveRow });
        if (result.failed())
            return juce::Result::fail("valid change failed: " + result.getErrorMessage());

        second = findOverlay(store.overlays(), secondId);
        if (second->row != 1 || second->from != 10 || second->bounds != juce::Rectangle<int> { 5, 6, 70, 80 })
            return juce::Result::fail("patch fields not applied");
        if (!nearlyEqual(static_cast<double>(second->styles[Cutline::StyleKeys::opacity]), 0.5))
            return juce::Result::fail("patch styles not merged");

        const Cutline::OverlayUpdater lengthen = [](const Cutline::OverlayModel& current)
        {
            auto next = current;
            next.durationInFrames += 20;
            next.id = 12345;
            return next;
        };
        result = store.apply(Cutline::ChangeOverlayAction { firstId, lengthen });
        if (result.failed())
            return juce::Result::fail("updater change failed: " + result.getErrorMessage());

        const auto* first = findOverlay(store.overlays(), firstId);
        if (first == nullptr || first->durationInFrames != 70)
            return juce::Result::fail("updater must keep the id and apply its result");

        Cutline::OverlayPatch zeroLength;
        zeroLength.durationInFrames = 0;
        if (store.apply(Cutline::ChangeOverlayAction { firstId, zeroLength }).wasOk())
            return juce::Result::fail("zero duration must be rejected");

        return juce::Result::ok();
    }

    juce::Result testStyleValidation()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId id = 0;
        auto result = addOverlay(store, makeTextOverlay(0, 30, 0), id);
        if (result.failed())
            return result;

        Cutline::PropertyBag badOpacity;
        badOpacity.set(Cutline::StyleKeys::opacity, 1.5);
        if (store.apply(Cutline::UpdateStylesAction { id, badOpacity }).wasOk())
            return juce::Result::fail("opacity > 1 must be rejected");

        Cutline::PropertyBag badCrop;
        badCrop.set(Cutline::StyleKeys::cropX, "left");
        if (store.apply(Cutline::UpdateStylesAction { id, badCrop }).wasOk())
            return juce::Result::fail("non-numeric crop must be rejected");

        Cutline::PropertyBag outsideCrop;
        outsideCrop.set(Cutline::StyleKeys::cropX, 60.0);
        outsideCrop.set(Cutline::StyleKeys::cropWidth, 50.0);
        if (store.apply(Cutline::UpdateStylesAction { id, outsideCrop }).wasOk())
            return juce::Result::fail("crop beyond the frame must be rejected");

        Cutline::PropertyBag nested;
        auto inner = std::make_unique<juce::DynamicObject>();
        auto innermost = std::make_unique<juce::DynamicObject>();
        innermost->setProperty("deep", 1);
        inner->setProperty("child", juce::var(innermost.release()));
        nested.set("animation", juce::var(inner.release()));
        if (store.apply(Cutline::UpdateStylesAction { id, nested }).wasOk())
            return juce::Result::fail("nested style objects must be rejected");

        Cutline::PropertyBag valid;
        valid.set(Cutline::StyleKeys::opacity, 0.25);
        valid.set("fontFamily", "Outfit");
        result = store.apply(Cutline::UpdateStylesAction { id, valid });
        if (result.failed())
            return juce::Result::fail("valid style update failed: " + result.getErrorMessage());

        const auto& styles = store.overlays().front().styles;
        if (styles["fontFamily"].toString() != "Outfit" || !nearlyEqual(static_cast<double>(styles[Cutline::StyleKeys::opacity]), 0.25))
            return juce::Result::fail("style update not merged");

        if (store.undoDepth() != 2)
            return juce::Result::fail("only successful edits may record history");

        return juce::Result::ok();
    }

    juce::Result testRowOperations()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId ignored = 0;
        for (const auto& [from, row] : std::vector<std::pair<int, int>> { { 10, 0 }, { 50, 0 }, { 0, 1 }, { 90, 2 } })
        {
            const auto result = addOverlay(store, makeTextOverlay(from, 20, row), ignored);
            if (result.failed())
                return result;
        }

        const auto gaps = Cutline::Core::RowLayout::findGaps(store.overlays(), 0);
        if (gaps.size() != 2 || gaps[0].start != 0 || gaps[0].end != 10 || gaps[1].start != 30 || gaps[1].end != 50)
            return juce::Result::fail("row 0 gaps must be [0, 10) and [30, 50)");

        auto result = store.apply(Cutline::CloseRowGapsAction { 0 });
        if (result.failed())
            return juce::Result::fail("close gaps failed: " + result.getErrorMessage());

        if (store.overlays()[0].from != 0 || store.overlays()[1].from != 20)
            return juce::Result::fail("closed row must sit back to back from frame 0");
        if (store.apply(Cutline::CloseRowGapsAction { 0 }).wasOk())
            return juce::Result::fail("closing a gapless row must be rejected");

        if (Cutline::Core::RowLayout::rowCount(store.overlays()) != 3)
            return juce::Result::fail("row count must be 3");
        if (Cutline::Core::RowLayout::timelineEnd(store.overlays()) != 110)
            return juce::Result::fail("timeline end must be 110");

        result = store.apply(Cutline::DeleteRowAction { 0 });
        if (result.failed())
            return juce::Result::fail("delete row failed: " + result.getErrorMessage());
        if (store.overlays().size() != 2)
            return juce::Result::fail("delete row must remove both row 0 overlays");
        if (store.apply(Cutline::DeleteRowAction { 7 }).wasOk())
            return juce::Result::fail("deleting an empty row must be rejected");

        const auto doomed = store.overlays().front().id;
        result = store.apply(Cutline::DeleteOverlayAction { doomed });
        if (result.failed() || findOverlay(store.overlays(), doomed) != nullptr)
            return juce::Result::fail("delete overlay failed");
        if (store.apply(Cutline::DeleteOverlayAction { doomed }).wasOk())
            return juce::Result::fail("deleting an absent id must be rejected");

        return juce::Result::ok();
    }

    juce::Result testUndoRedoAndIdAllocation()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId a = 0;
        Cutline::OverlayId b = 0;
        Cutline::OverlayId c = 0;
        if (addOverlay(store, makeTextOverlay(0, 10, 0), a).failed()
            || addOverlay(store, makeTextOverlay(10, 10, 0), b).failed()
            || addOverlay(store, makeTextOverlay(20, 10, 0), c).failed())
            return juce::Result::fail("setup failed");

        if (a != Cutline::kFirstOverlayId || b != a + 1 || c != b + 1)
            return juce::Result::fail("ids must be allocated in sequence");

        if (store.apply(Cutline::DeleteOverlayAction { c }).failed())
            return juce::Result::fail("delete failed");
        if (!store.undo() || findOverlay(store.overlays(), c) == nullptr)
            return juce::Result::fail("undo must restore the deleted overlay");
        if (!store.redo() || findOverlay(store.overlays(), c) != nullptr)
            return juce::Result::fail("redo must delete again");

        Cutline::OverlayId d = 0;
        if (addOverlay(store, makeTextOverlay(40, 10, 0), d).failed())
            return juce::Result::fail("add after delete failed");
        if (d <= c)
            return juce::Result::fail("ids must never be reused after delete");
        if (store.canRedo())
            return juce::Result::fail("new edit must clear redo history");

        if (!store.undo() || !store.undo())
            return juce::Result::fail("undo chain failed");
        Cutline::OverlayId e = 0;
        if (addOverlay(store, makeTextOverlay(60, 10, 0), e).failed())
            return juce::Result::fail("add after undo failed");
        if (e <= d)
            return juce::Result::fail("ids must never be reused after undo");

        store.setHistoryLimit(2);
        for (int i = 0; i < 5; ++i)
        {
            Cutline::OverlayId ignored = 0;
            if (addOverlay(store, makeTextOverlay(100 + i * 10, 10, 1), ignored).failed())
                return juce::Result::fail("history limit setup failed");
        }

        if (store.undoDepth() != 2)
            return juce::Result::fail("history limit must cap undo depth");

        for (int i = 0; i < 100; ++i)
        {
            if (store.apply(Cutline::SplitOverlayAction { a, 5 }).failed() || !store.undo())
                return juce::Result::fail("split/undo cycle failed at " + juce::String(i));
        }

        if (findOverlay(store.overlays(), a)->durationInFrames != 10)
            return juce::Result::fail("split/undo cycles must restore the original overlay");

        return juce::Result::ok();
    }

    juce::Result testSelectionFollowsEdits()
    {
        Cutline::Core::OverlayStore store;
        Cutline::OverlayId a = 0;
        Cutline::OverlayId b = 0;
        if (addOverlay(store, makeTextOverlay(0, 10, 0), a).failed()
            || addOverlay(store, makeTextOverlay(10, 10, 0), b).failed())
            return juce::Result::fail("setup failed");

        const auto& selection = store.editorState().selection;
        if (selection.size() != 1 || selection.front() != b)
            return juce::Result::fail("add must select exactly the new overlay");

        store.setSelection({ b, b, 404, a });
        if (selection.size() != 2 || selection[0] != b || selection[1] != a)
            return juce::Result::fail("selection must drop unknown and repeated ids");
        if (store.editorState().primarySelection() != b)
            return juce::Result::fail("primary selection must be the first entry");

        if (store.apply(Cutline::DeleteOverlayAction { b }).failed())
            return juce::Result::fail("delete failed");
        if (selection.size() != 1 || selection.front() != a)
            return juce::Result::fail("deleted overlays must leave the selection");

        if (store.apply(Cutline::DuplicateOverlayAction { a }).failed())
            return juce::Result::fail("duplicate failed");
        if (selection.size() != 1 || selection.front() != a)
            return juce::Result::fail("duplicate must keep the current selection");

        if (store.clear().failed() || !store.overlays().empty() || !selection.empty())
            return juce::Result::fail("clear must remove every overlay and the selection");

        return juce::Result::ok();
    }

    juce::Result testMediaSplitOffsets()
    {
        Cutline::Core::OverlayStore store(30);

        auto video = makeTextOverlay(0, 90, 0);
        Cutline::VideoContent videoContent;
        videoContent.src = "clip.mp4";
        videoContent.videoStartTime = 2.0;
        video.payload = videoContent;

        auto sound = makeTextOverlay(0, 90, 1);
        Cutline::SoundContent soundContent;
        soundContent.src = "track.mp3";
        soundContent.startFromSound = 0.5;
        Cutline::WaveformData waveform;
        for (int i = 0; i < 100; ++i)
            waveform.peaks.push_back(static_cast<float>(i) / 100.0f);
        waveform.length = 1000;
        soundContent.waveform = waveform;
        sound.payload = soundContent;

        Cutline::OverlayId videoId = 0;
        Cutline::OverlayId soundId = 0;
        if (addOverlay(store, video, videoId).failed() || addOverlay(store, sound, soundId).failed())
            return juce::Result::fail("setup failed");

        std::vector<Cutline::OverlayId> createdIds;
        if (store.apply(Cutline::SplitOverlayAction { videoId, 45 }, &createdIds).failed())
            return juce::Result::fail("video split failed");

        const auto& videoHead = std::get<Cutline::VideoContent>(findOverlay(store.overlays(), videoId)->payload);
        const auto& videoTail = std::get<Cutline::VideoContent>(findOverlay(store.overlays(), createdIds.front())->payload);
        if (!nearlyEqual(videoHead.videoStartTime, 2.0) || !nearlyEqual(videoTail.videoStartTime, 3.5))
            return juce::Result::fail("video tail must start 1.5 s further into the source");

        createdIds.clear();
        if (store.apply(Cutline::SplitOverlayAction { soundId, 30 }, &createdIds).failed())
            return juce::Result::fail("sound split failed");

        const auto& soundHead = std::get<Cutline::SoundContent>(findOverlay(store.overlays(), soundId)->payload);
        const auto& soundTail = std::get<Cutline::SoundContent>(findOverlay(store.overlays(), createdIds.front())->payload);
        if (!nearlyEqual(soundHead.startFromSound, 0.5) || !nearlyEqual(soundTail.startFromSound, 1.5))
            return juce::Result::fail("sound tail must start 1 s further into the source");
        if (!soundHead.waveform.has_value() || !soundTail.waveform.has_value())
            return juce::Result::fail("both sound halves need waveform data");
        if (soundHead.waveform->peaks.size() != 33 || soundTail.waveform->peaks.size() != 67)
            return juce::Result::fail("waveform peaks must split 33/67");
        if (soundHead.waveform->length != 333 || soundTail.waveform->length != 666)
            return juce::Result::fail("waveform lengths must split 333/666");
        if (!nearlyEqual(soundTail.waveform->peaks.front(), 0.33, 1.0e-5))
            return juce::Result::fail("tail peaks must continue where the head stopped");

        return juce::Result::ok();
    }

    juce::Result testCaptionSplit()
    {
        Cutline::Core::OverlayStore store(30);

        auto overlay = makeTextOverlay(0, 60, 0);
        Cutline::CaptionContent content;
        content.captions = { makeCaption("hello world", 0.0, 1000.0), makeCaption("second line", 1200.0, 2000.0) };
        content.captions[1].timestampMs = 1200.0;
        overlay.payload = content;

        Cutline::OverlayId id = 0;
        if (addOverlay(store, overlay, id).failed())
            return juce::Result::fail("setup failed");

        std::vector<Cutline::OverlayId> createdIds;
        const auto result = store.apply(Cutline::SplitOverlayAction { id, 15 }, &createdIds);
        if (result.failed())
            return juce::Result::fail("caption split failed: " + result.getErrorMessage());

        const auto& head = std::get<Cutline::CaptionContent>(findOverlay(store.overlays(), id)->payload).captions;
        const auto& tail = std::get<Cutline::CaptionContent>(findOverlay(store.overlays(), createdIds.front())->payload).captions;

        if (head.size() != 1 || head[0].text != "hello" || !nearlyEqual(head[0].endMs, 500.0))
            return juce::Result::fail("head must keep the truncated first caption");
        if (tail.size() != 2)
            return juce::Result::fail("tail must keep both captions");
        if (tail[0].text != "world" || !nearlyEqual(tail[0].startMs, 0.0) || !nearlyEqual(tail[0].endMs, 500.0))
            return juce::Result::fail("tail must keep the rest of the first caption, rebased to 0");
        if (!nearlyEqual(tail[1].startMs, 700.0) || !nearlyEqual(tail[1].endMs, 1500.0))
            return juce::Result::fail("untouched captions must shift by the split offset");
        if (!tail[1].timestampMs.has_value() || !nearlyEqual(*tail[1].timestampMs, 700.0))
            return juce::Result::fail("caption timestamps must shift by the split offset");
        if (tail[1].words.size() != 2 || !nearlyEqual(tail[1].words[0].startMs, 700.0))
            return juce::Result::fail("word timings must shift by the split offset");

        return juce::Result::ok();
    }

    juce::Result testSrtParsing()
    {
        const juce::String srt =
            "1\r\n"
            "00:00:01,000 --> 00:00:02,500\r\n"
            "<i>Hello</i> {\\an8}there\r\n"
            "\r\n"
            "2\r\n"
            "00:00:03,000 --> 00:00:04,000\r\n"
            "Second line\r\n"
            "continues here\r\n";

        const auto parsed = Cutline::Captions::parseSrt(srt);
        if (!parsed.succeeded())
            return juce::Result::fail("valid SRT rejected: " + parsed.describeErrors());
        if (parsed.captions.size() != 2)
            return juce::Result::fail("expected two captions");

        const auto& first = parsed.captions[0];
        if (first.text != "Hello there" || !nearlyEqual(first.startMs, 1000.0) || !nearlyEqual(first.endMs, 2500.0))
            return juce::Result::fail("markup must be stripped and timing parsed, got \"" + first.text + "\"");
        if (first.words.size() != 2 || !nearlyEqual(first.words[1].startMs, 1750.0))
            return juce::Result::fail("words must be spread evenly over the caption");
        if (!first.confidence.has_value() || !nearlyEqual(*first.confidence, Cutline::Captions::kImportedConfidence))
            return juce::Result::fail("imported captions carry the import confidence");
        if (parsed.captions[1].words.size() != 4)
            return juce::Result::fail("multi-line captions must keep every word");

        if (Cutline::Captions::parseSrtTimestamp("01:02:03,456") != 3723456.0)
            return juce::Result::fail("timestamp parse mismatch");
        if (Cutline::Captions::parseSrtTimestamp("1:02:03,456").has_value()
            || Cutline::Captions::parseSrtTimestamp("00:61:00,000").has_value())
            return juce::Result::fail("malformed timestamps must be rejected");

        if (Cutline::Captions::parseSrt("").succeeded() || Cutline::Captions::parseSrt("plain text").succeeded())
            return juce::Result::fail("input without subtitles must fail");

        const auto reversed = Cutline::Captions::parseSrt("1\n00:00:05,000 --> 00:00:04,000\nBackwards\n");
        if (reversed.succeeded() || reversed.errors.size() != 1 || reversed.errors[0].block != 1)
            return juce::Result::fail("reversed timing must be reported against block 1");

        const auto overlapping = Cutline::Captions::parseSrt("1\n00:00:01,000 --> 00:00:03,000\nA\n\n"
                                                             "2\n00:00:02,000 --> 00:00:04,000\nB\n");
        if (overlapping.succeeded() || overlapping.errors.empty())
            return juce::Result::fail("overlapping subtitles must be reported");

        const auto badNumber = Cutline::Captions::parseSrt("one\n00:00:01,000 --> 00:00:02,000\nA\n");
        if (badNumber.succeeded())
            return juce::Result::fail("a non-numeric subtitle number must be reported");

        return juce::Result::ok();
    }

    juce::Result testCaptionTimingRules()
    {
        const auto generated = Cutline::Captions::generateFromText("Hello there. How are you?");
        if (generated.size() != 2)
            return juce::Result::fail("one caption per sentence expected");
        if (!nearlyEqual(generated[0].endMs, 750.0) || !nearlyEqual(generated[1].startMs, 1250.0)
            || !nearlyEqual(generated[1].endMs, 2375.0))
            return juce::Result::fail("generated timing must follow 160 wpm with a 500 ms gap");
        if (!nearlyEqual(generated[1].words.back().confidence, Cutline::Captions::kGeneratedConfidence))
            return juce::Result::fail("generated words carry the generated confidence");

        if (Cutline::Captions::validateCaptions(generated).failed())
            return juce::Result::fail("generated captions must validate");
        if (Cutline::Captions::validateCaptionTiming(generated, 1, 700.0, 2000.0).wasOk())
            return juce::Result::fail("overlap with the previous caption must be rejected");
        if (Cutline::Captions::validateCaptionTiming(generated, 0, 100.0, 100.0).wasOk())
            return juce::Result::fail("empty caption span must be rejected");
        if (Cutline::Captions::validateCaptionTiming(generated, 0, 0.0, 1300.0).wasOk())
            return juce::Result::fail("overlap with the next caption must be rejected");

        auto caption = makeCaption("one two three", 0.0, 900.0);
        caption.endMs = 1200.0;
        Cutline::Captions::redistributeWords(caption);
        if (caption.words.size() != 3 || !nearlyEqual(caption.words[2].startMs, 800.0) || caption.words[2].word != "three")
            return juce::Result::fail("redistribute must keep the words and spread the new span");

        caption.text = "just two";
        Cutline::Captions::retimeFromText(caption);
        if (caption.words.size() != 2 || !nearlyEqual(caption.words[1].startMs, 600.0))
            return juce::Result::fail("retime must rebuild words from the text");

        return juce::Result::ok();
    }
    juce::Result testFrameRangeLimits()
    {
        const auto maxFrame = Cutline::kMaxFrame;

        Cutline::Core::OverlayStore store;
        Cutline::OverlayId id = 0;
        if (addOverlay(store, makeTextOverlay(maxFrame - 10, 20, 0), id).wasOk())
            return juce::Result::fail("an overlay ending past the last frame must be rejected");

        auto result = addOverlay(store, makeTextOverlay(maxFrame - 20, 20, 0), id);
        if (result.failed())
            return juce::Result::fail("an overlay ending exactly on the last frame must be accepted: " + result.getErrorMessage());

        if (Cutline::Core::RowLayout::timelineEnd(store.overlays()) != maxFrame)
            return juce::Result::fail("timeline end must reach the last frame without wrapping");
        if (!Cutline::Core::RowLayout::intervalsOverlap(maxFrame - 20, 20, maxFrame - 10, 5))
            return juce::Result::fail("overlap must be detected near the last frame");
        if (Cutline::Core::RowLayout::intervalsOverlap(maxFrame - 20, 20, 0, 10))
            return juce::Result::fail("distant intervals must not overlap");

        if (store.apply(Cutline::DuplicateOverlayAction { id }).wasOk() || store.overlays().size() != 1)
            return juce::Result::fail("a duplicate that cannot fit before the last frame must be rejected");

        Cutline::OverlayPatch shift;
        shift.from = maxFrame - 5;
        if (store.apply(Cutline::ChangeOverlayAction { id, shift }).wasOk())
            return juce::Result::fail("moving an overlay past the last frame must be rejected");

        Cutline::OverlayPatch both;
        both.from = maxFrame;
        both.durationInFrames = 2;
        if (store.apply(Cutline::ChangeOverlayAction { id, both }).wasOk())
            return juce::Result::fail("a patch ending past the last frame must be rejected");

        if (store.overlays().front().from != maxFrame - 20 || store.undoDepth() != 1)
            return juce::Result::fail("rejected edits must leave the timeline untouched");

        if (Cutline::Geometry::secondsToFrames(1.0e10, 30) != maxFrame
            || Cutline::Geometry::secondsToFrames(-1.0e10, 30) != -maxFrame)
            return juce::Result::fail("seconds to frames must saturate instead of wrapping");

        Cutline::MediaDescriptor longClip;
        longClip.type = Cutline::OverlayType::video;
        longClip.src = "long.mp4";
        longClip.durationSeconds = 1.0e10;

        Cutline::OverlayModel dropped;
        result = Cutline::MediaDrop::createOverlay(longClip, 1, 5, { 1280, 720 }, 30, dropped);
        if (result.failed() || dropped.durationInFrames != maxFrame)
            return juce::Result::fail("a very long clip must saturate its duration");
        if (addOverlay(store, dropped, id).wasOk())
            return juce::Result::fail("a saturated clip that starts after frame 0 cannot fit and must be rejected");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Split at frame 30", testSplitAtFrameThirty },
        { "Split keeps duration, ignores boundaries", testSplitPreservesDurationAndIgnoresBoundaries },
        { "Duplicate skips past conflicts", testDuplicateSkipsPastConflicts },
        { "Duplicate never overlaps", testDuplicateNeverOverlaps },
        { "Add/change respect rows", testAddAndChangeRespectRows },
        { "Style validation", testStyleValidation },
        { "Row operations", testRowOperations },
        { "Undo/redo and id allocation", testUndoRedoAndIdAllocation },
        { "Selection follows edits", testSelectionFollowsEdits },
        { "Media split offsets", testMediaSplitOffsets },
        { "Caption split", testCaptionSplit },
        { "SRT parsing", testSrtParsing },
        { "Caption timing rules", testCaptionTimingRules },
        { "Frame range limits", testFrameRangeLimits }
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

    std::cout << "Cutline timeline smoke passed." << std::endl;
    return 0;
}
