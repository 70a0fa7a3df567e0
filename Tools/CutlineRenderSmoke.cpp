#include <juce_core/juce_core.h>

#include "Cutline/Render/HttpRenderer.h"
#include "Cutline/Render/RenderOrchestrator.h"
#include "SmokeSupport.h"

#include <functional>
#include <iostream>
#include <vector>

namespace
{
    using Cutline::Render::RenderStatus;
    using CutlineSmoke::FakeRenderer;
    using CutlineSmoke::ManualScheduler;
    using CutlineSmoke::nearlyEqual;

    Cutline::CompositionProps makeComposition()
    {
        Cutline::CompositionProps props;
        props.overlays = { CutlineSmoke::makeTextOverlay(0, 90, 0) };
        props.durationInFrames = 90;
        props.width = 1280;
        props.height = 720;
        props.fps = 30;
        return props;
    }

    Cutline::Render::RenderSettings fastSettings()
    {
        Cutline::Render::RenderSettings settings;
        settings.pollingIntervalMs = 1000;
        settings.initialDelayMs = 0;
        settings.firstPollDelayMs = 100;
        return settings;
    }

    juce::Result startRender(Cutline::Render::RenderOrchestrator& orchestrator, FakeRenderer& renderer)
    {
        if (!orchestrator.renderMedia("Main", makeComposition()))
            return juce::Result::fail("renderMedia was rejected");
        if (orchestrator.getState().status != RenderStatus::invoking)
            return juce::Result::fail("status must be invoking after renderMedia");
        if (!renderer.replyStart(juce::Result::ok(), { "job-1", "bucket-a" }))
            return juce::Result::fail("renderer start was not called");
        if (orchestrator.getState().status != RenderStatus::rendering)
            return juce::Result::fail("status must be rendering after the start reply");

        return juce::Result::ok();
    }

    juce::Result testHappyPath()
    {
        FakeRenderer renderer;
        ManualScheduler scheduler;
        Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());

        std::vector<RenderStatus> transitions;
        orchestrator.onStateChanged = [&transitions](const Cutline::Render::RenderState& state)
        {
            if (transitions.empty() || transitions.back() != state.status)
                transitions.push_back(state.status);
        };

        auto result = startRender(orchestrator, renderer);
        if (result.failed())
            return result;

        if (renderer.lastCompositionId != "Main" || renderer.lastProps.width != 1280 || renderer.lastProps.overlays.size() != 1)
            return juce::Result::fail("renderer received the wrong composition");
        if (orchestrator.getState().renderId != "job-1" || orchestrator.getState().bucketName != "bucket-a")
            return juce::Result::fail("render id and bucket must be kept");

        scheduler.advance(99);
        if (renderer.progressCalls != 0)
            return juce::Result::fail("first poll must wait firstPollDelayMs");
        scheduler.advance(1);
        if (renderer.progressCalls != 1 || renderer.lastProgressRenderId != "job-1" || renderer.lastProgressBucket != "bucket-a")
            return juce::Result::fail("first poll must ask for job-1 in bucket-a");

        if (!renderer.replyProgressFraction(0.4))
            return juce::Result::fail("progress reply not delivered");
        if (!nearlyEqual(orchestrator.getState().progress, 0.4))
            return juce::Result::fail("progress must be reported");

        scheduler.advance(999);
        if (renderer.progressCalls != 1)
            return juce::Result::fail("next poll must wait pollingIntervalMs");
        scheduler.advance(1);
        if (renderer.progressCalls != 2)
            return juce::Result::fail("second poll missing");

        Cutline::Render::RenderProgress done;
        done.kind = Cutline::Render::RenderProgress::Kind::done;
        done.url = "https://cdn.example.com/out.mp4";
        done.size = 123456;
        renderer.replyProgress(juce::Result::ok(), done);

        const auto& state = orchestrator.getState();
        if (state.status != RenderStatus::done || state.url != done.url || state.size != 123456 || !nearlyEqual(state.progress, 1.0))
            return juce::Result::fail("done reply must finish the render");

        const std::vector<RenderStatus> expected { RenderStatus::invoking, RenderStatus::rendering, RenderStatus::done };
        if (transitions != expected)
            return juce::Result::fail("unexpected status transitions");

        scheduler.advance(5000);
        if (renderer.progressCalls != 2 || scheduler.pendingCount() != 0)
            return juce::Result::fail("polling must stop after done");

        return juce::Result::ok();
    }

    juce::Result testReentrancyGuard()
    {
        FakeRenderer renderer;
        ManualScheduler scheduler;
        Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());

        if (!orchestrator.renderMedia("Main", makeComposition()))
            return juce::Result::fail("first renderMedia rejected");
        if (orchestrator.renderMedia("Main", makeComposition()))
            return juce::Result::fail("renderMedia while invoking must be rejected");

        renderer.replyStart(juce::Result::ok(), { "job-1", {} });
        if (orchestrator.renderMedia("Main", makeComposition()))
            return juce::Result::fail("renderMedia while rendering must be rejected");
        if (renderer.startCalls != 1)
            return juce::Result::fail("busy renders must not start a second job");

        scheduler.advance(100);
        Cutline::Render::RenderProgress done;
        done.kind = Cutline::Render::RenderProgress::Kind::done;
        done.url = "out.mp4";
        renderer.replyProgress(juce::Result::ok(), done);

        if (!orchestrator.renderMedia("Main", makeComposition()) || renderer.startCalls != 2)
            return juce::Result::fail("a finished render must allow a new one");

        return juce::Result::ok();
    }

    juce::Result testFailuresKeepRenderId()
    {
        {
            FakeRenderer renderer;
            ManualScheduler scheduler;
            Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());

            orchestrator.renderMedia("Main", makeComposition());
            renderer.replyStart(juce::Result::fail("connection refused"), {});
            const auto& state = orchestrator.getState();
            if (state.status != RenderStatus::error || state.errorMessage != "connection refused" || state.renderId.isNotEmpty())
                return juce::Result::fail("start failure must end in error without a render id");
        }

        {
            FakeRenderer renderer;
            ManualScheduler scheduler;
            Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());

            auto result = startRender(orchestrator, renderer);
            if (result.failed())
                return result;

            scheduler.advance(100);
            Cutline::Render::RenderProgress failed;
            failed.kind = Cutline::Render::RenderProgress::Kind::error;
            failed.message = "lambda timed out";
            renderer.replyProgress(juce::Result::ok(), failed);

            const auto& state = orchestrator.getState();
            if (state.status != RenderStatus::error || state.errorMessage != "lambda timed out" || state.renderId != "job-1")
                return juce::Result::fail("backend error must keep the render id and message");
        }

        {
            FakeRenderer renderer;
            ManualScheduler scheduler;
            Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());

            auto result = startRender(orchestrator, renderer);
            if (result.failed())
                return result;

            scheduler.advance(100);
            renderer.replyProgressFraction(0.7);
            scheduler.advance(1000);
            renderer.replyProgress(juce::Result::fail("HTTP 502"), {});

            const auto& state = orchestrator.getState();
            if (state.status != RenderStatus::error || state.renderId != "job-1" || !nearlyEqual(state.progress, 0.7))
                return juce::Result::fail("transport failure while polling must keep id and last progress");
            if (!orchestrator.renderMedia("Main", makeComposition()))
                return juce::Result::fail("an errored render must allow a retry");
        }

        {
            FakeRenderer renderer;
            ManualScheduler scheduler;
            Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());

            auto invalid = makeComposition();
            invalid.fps = 0;
            if (!orchestrator.renderMedia("Main", invalid))
                return juce::Result::fail("invalid composition must still be accepted as a request");
            if (orchestrator.getState().status != RenderStatus::error || renderer.startCalls != 0)
                return juce::Result::fail("invalid composition must fail before reaching the renderer");
        }

        return juce::Result::ok();
    }

    juce::Result testUndoDropsLateReplies()
    {
        FakeRenderer renderer;
        ManualScheduler scheduler;
        Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());

        orchestrator.renderMedia("Main", makeComposition());
        orchestrator.undo();
        if (orchestrator.getState().status != RenderStatus::init)
            return juce::Result::fail("undo must reset to init");

        renderer.replyStart(juce::Result::ok(), { "stale-job", {} });
        if (orchestrator.getState().status != RenderStatus::init || orchestrator.getState().renderId.isNotEmpty())
            return juce::Result::fail("a stale start reply must be ignored");

        auto result = startRender(orchestrator, renderer);
        if (result.failed())
            return result;

        scheduler.advance(100);
        orchestrator.undo();
        renderer.replyProgressFraction(0.5);
        scheduler.advance(10000);

        if (orchestrator.getState().status != RenderStatus::init || renderer.progressCalls != 1)
            return juce::Result::fail("polling must stop after undo");

        return juce::Result::ok();
    }

    juce::Result testInitialDelay()
    {
        FakeRenderer renderer;
        ManualScheduler scheduler;
        auto settings = fastSettings();
        settings.initialDelayMs = 500;
        Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, settings);

        orchestrator.renderMedia("Main", makeComposition());
        renderer.replyStart(juce::Result::ok(), { "job-9", {} });
        if (orchestrator.getState().status != RenderStatus::invoking)
            return juce::Result::fail("status must stay invoking during the initial delay");

        scheduler.advance(500);
        if (orchestrator.getState().status != RenderStatus::rendering)
            return juce::Result::fail("rendering must begin after the initial delay");

        scheduler.advance(100);
        if (renderer.progressCalls != 1 || renderer.lastProgressBucket.isNotEmpty())
            return juce::Result::fail("poll without a bucket hint expected");

        return juce::Result::ok();
    }

    juce::Result testDestroyedOrchestratorIgnoresCallbacks()
    {
        FakeRenderer renderer;
        ManualScheduler scheduler;

        {
            Cutline::Render::RenderOrchestrator orchestrator(renderer, scheduler, fastSettings());
            auto result = startRender(orchestrator, renderer);
            if (result.failed())
                return result;
        }

        scheduler.advance(1000);
        if (renderer.progressCalls != 0)
            return juce::Result::fail("a destroyed orchestrator must not poll");

        return juce::Result::ok();
    }

    juce::Result testHttpWireFormat()
    {
        const auto startBody = Cutline::Render::HttpRenderer::buildStartRequestBody("Main", makeComposition());
        const auto startJson = juce::JSON::parse(startBody);
        if (startJson["id"].toString() != "Main")
            return juce::Result::fail("start body must carry the composition id");

        const auto inputProps = startJson["inputProps"];
        if (static_cast<int>(inputProps["width"]) != 1280 || static_cast<int>(inputProps["fps"]) != 30
            || static_cast<int>(inputProps["durationInFrames"]) != 90 || inputProps["overlays"].size() != 1)
            return juce::Result::fail("start body inputProps mismatch: " + startBody);

        const auto progressJson = juce::JSON::parse(Cutline::Render::HttpRenderer::buildProgressRequestBody("job-1", {}));
        if (progressJson["id"].toString() != "job-1" || progressJson.hasProperty("bucketName"))
            return juce::Result::fail("progress body must omit an empty bucket");

        Cutline::Render::RenderStartResponse started;
        auto result = Cutline::Render::HttpRenderer::parseStartResponse(R"({"renderId":"abc","bucketName":"b1"})", started);
        if (result.failed() || started.renderId != "abc" || started.bucketName != "b1")
            return juce::Result::fail("start reply parse failed");
        if (Cutline::Render::HttpRenderer::parseStartResponse(R"({"bucketName":"b1"})", started).wasOk())
            return juce::Result::fail("start reply without renderId must fail");
        if (Cutline::Render::HttpRenderer::parseStartResponse("not json", started).wasOk())
            return juce::Result::fail("malformed start reply must fail");

        Cutline::Render::RenderProgress reply;
        result = Cutline::Render::HttpRenderer::parseProgressResponse(R"({"type":"progress","progress":0.25})", reply);
        if (result.failed() || reply.kind != Cutline::Render::RenderProgress::Kind::progress || !nearlyEqual(reply.progress, 0.25))
            return juce::Result::fail("progress reply parse failed");

        result = Cutline::Render::HttpRenderer::parseProgressResponse(R"({"type":"done","url":"u.mp4","size":2048})", reply);
        if (result.failed() || reply.kind != Cutline::Render::RenderProgress::Kind::done || reply.url != "u.mp4" || reply.size != 2048)
            return juce::Result::fail("done reply parse failed");

        result = Cutline::Render::HttpRenderer::parseProgressResponse(R"({"type":"error","message":"boom"})", reply);
        if (result.failed() || reply.kind != Cutline::Render::RenderProgress::Kind::error || reply.message != "boom")
            return juce::Result::fail("error reply parse failed");

        if (Cutline::Render::HttpRenderer::parseProgressResponse(R"({"type":"done"})", reply).wasOk()
            || Cutline::Render::HttpRenderer::parseProgressResponse(R"({"type":"queued"})", reply).wasOk()
            || Cutline::Render::HttpRenderer::parseProgressResponse(R"([1,2])", reply).wasOk())
            return juce::Result::fail("malformed progress replies must fail");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Happy path", testHappyPath },
        { "Reentrancy guard", testReentrancyGuard },
        { "Failures keep render id", testFailuresKeepRenderId },
        { "Undo drops late replies", testUndoDropsLateReplies },
        { "Initial delay", testInitialDelay },
        { "Destroyed orchestrator ignores callbacks", testDestroyedOrchestratorIgnoresCallbacks },
        { "HTTP wire format", testHttpWireFormat }
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

    std::cout << "Cutline render smoke passed." << std::endl;
    return 0;
}
