#include "Cutline/Render/RenderOrchestrator.h"

#include "Cutline/Core/OverlayValidator.h"

namespace Cutline::Render
{
    juce::String renderStatusToKey(RenderStatus status)
    {
        switch (status)
        {
            case RenderStatus::init: return "init";
            case RenderStatus::invoking: return "invoking";
            case RenderStatus::rendering: return "rendering";
            case RenderStatus::done: return "done";
            case RenderStatus::error: return "error";
        }

        return {};
    }

    RenderOrchestrator::RenderOrchestrator(Renderer& rendererToUse,
                                           Scheduler& schedulerToUse,
                                           RenderSettings settingsToUse)
        : renderer(rendererToUse),
          scheduler(schedulerToUse),
          settings(settingsToUse)
    {
    }

    RenderOrchestrator::~RenderOrchestrator() = default;

    bool RenderOrchestrator::isBusy() const noexcept
    {
        return state.status == RenderStatus::invoking || state.status == RenderStatus::rendering;
    }

    bool RenderOrchestrator::renderMedia(const juce::String& compositionId, const CompositionProps& inputProps)
    {
        if (isBusy())
        {
            DBG("[Cutline][Render] render already in progress, ignoring request (status="
                + renderStatusToKey(state.status) + ")");
            return false;
        }

        const auto generation = ++currentGeneration;

        RenderState invoking;
        invoking.status = RenderStatus::invoking;
        setState(std::move(invoking));

        const auto validity = Core::OverlayValidator::validateComposition(inputProps);
        if (validity.failed())
        {
            fail({}, "invalid composition: " + validity.getErrorMessage());
            return true;
        }

        juce::WeakReference<RenderOrchestrator> weakThis(this);
        renderer.start(compositionId,
                       inputProps,
                       [weakThis, generation](juce::Result result, RenderStartResponse response)
                       {
                           if (auto* self = weakThis.get())
                               self->handleStartReply(generation, std::move(result), std::move(response));
                       });
        return true;
    }

    void RenderOrchestrator::undo()
    {
        ++currentGeneration;
        setState({});
    }

    void RenderOrchestrator::handleStartReply(std::uint64_t generation,
                                              juce::Result result,
                                              RenderStartResponse response)
    {
        if (!isCurrent(generation) || state.status != RenderStatus::invoking)
            return;

        if (result.failed())
        {
            fail({}, result.getErrorMessage());
            return;
        }

        if (response.renderId.isEmpty())
        {
            fail({}, "renderer returned no render id");
            return;
        }

        state.renderId = response.renderId;
        state.bucketName = response.bucketName;

        if (settings.initialDelayMs > 0)
        {
            juce::WeakReference<RenderOrchestrator> weakThis(this);
            scheduler.callAfter(settings.initialDelayMs,
                                [weakThis, generation]
                                {
                                    if (auto* self = weakThis.get())
                                        self->enterRendering(generation);
                                });
            return;
        }

        enterRendering(generation);
    }

    void RenderOrchestrator::enterRendering(std::uint64_t generation)
    {
        if (!isCurrent(generation) || state.status != RenderStatus::invoking)
            return;

        auto rendering = state;
        rendering.status = RenderStatus::rendering;
        rendering.progress = 0.0;
        setState(std::move(rendering));

        juce::WeakReference<RenderOrchestrator> weakThis(this);
        scheduler.callAfter(settings.firstPollDelayMs,
                            [weakThis, generation]
                            {
                                if (auto* self = weakThis.get())
                                    self->poll(generation);
                            });
    }

    void RenderOrchestrator::poll(std::uint64_t generation)
    {
        if (!isCurrent(generation) || state.status != RenderStatus::rendering)
            return;

        juce::WeakReference<RenderOrchestrator> weakThis(this);
        renderer.progress(state.renderId,
                          state.bucketName,
                          [weakThis, generation](juce::Result result, RenderProgress reply)
                          {
                              if (auto* self = weakThis.get())
                                  self->handleProgressReply(generation, std::move(result), std::move(reply));
                          });
    }

    void RenderOrchestrator::handleProgressReply(std::uint64_t generation,
                                                 juce::Result result,
                                                 RenderProgress reply)
    {
        if (!isCurrent(generation) || state.status != RenderStatus::rendering)
            return;

        if (result.failed())
        {
            fail(state.renderId, result.getErrorMessage());
            return;
        }

        switch (reply.kind)
        {
            case RenderProgress::Kind::error:
                fail(state.renderId, reply.message);
                return;

            case RenderProgress::Kind::done:
            {
                auto done = state;
                done.status = RenderStatus::done;
                done.progress = 1.0;
                done.url = reply.url;
                done.size = reply.size;
                DBG("[Cutline][Render] render complete: url=" + reply.url + ", size=" + juce::String(reply.size));
                setState(std::move(done));
                return;
            }

            case RenderProgress::Kind::progress:
            {
                auto rendering = state;
                rendering.progress = juce::jlimit(0.0, 1.0, reply.progress);
                setState(std::move(rendering));

                juce::WeakReference<RenderOrchestrator> weakThis(this);
                scheduler.callAfter(settings.pollingIntervalMs,
                                    [weakThis, generation]
                                    {
                                        if (auto* self = weakThis.get())
                                            self->poll(generation);
                                    });
                return;
            }
        }
    }

    void RenderOrchestrator::fail(juce::String renderId, juce::String message)
    {
        DBG("[Cutline][Render] render failed"
            + (renderId.isNotEmpty() ? " (renderId=" + renderId + ")" : juce::String())
            + ": " + message);

        RenderState failed;
        failed.status = RenderStatus::error;
        failed.renderId = std::move(renderId);
        failed.bucketName = state.bucketName;
        failed.progress = state.progress;
        failed.errorMessage = message.isNotEmpty() ? std::move(message) : juce::String("render failed");
        setState(std::move(failed));
    }

    void RenderOrchestrator::setState(RenderState next)
    {
        state = std::move(next);
        if (onStateChanged != nullptr)
            onStateChanged(state);
    }
}
