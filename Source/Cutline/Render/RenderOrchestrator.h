#pragma once

#include "Cutline/Render/Renderer.h"
#include "Cutline/Render/Scheduler.h"
#include <cstdint>
#include <functional>

namespace Cutline::Render
{
    enum class RenderStatus
    {
        init,
        invoking,
        rendering,
        done,
        error
    };

    juce::String renderStatusToKey(RenderStatus status);

    struct RenderState
    {
        RenderStatus status = RenderStatus::init;
        juce::String renderId;                // empty when no job was issued
        juce::String bucketName;
        double progress = 0.0;
        juce::String url;
        juce::int64 size = 0;
        juce::String errorMessage;
    };

    struct RenderSettings
    {
        int pollingIntervalMs = 1000;
        int initialDelayMs = 0;
        int firstPollDelayMs = 100;
    };

    // init -> invoking -> rendering -> { done | error }
    // At most one render is in flight. undo() abandons it without cancelling
    // the backend job; late callbacks from it are dropped.
    class RenderOrchestrator
    {
    public:
        RenderOrchestrator(Renderer& rendererToUse,
                           Scheduler& schedulerToUse,
                           RenderSettings settingsToUse = {});
        ~RenderOrchestrator();

        RenderOrchestrator(const RenderOrchestrator&) = delete;
        RenderOrchestrator& operator=(const RenderOrchestrator&) = delete;

        const RenderState& getState() const noexcept { return state; }
        bool isBusy() const noexcept;

        const RenderSettings& getSettings() const noexcept { return settings; }
        void setSettings(RenderSettings newSettings) noexcept { settings = newSettings; }

        // Returns false when the request was ignored because a render is in flight.
        bool renderMedia(const juce::String& compositionId, const CompositionProps& inputProps);
        void undo();

        std::function<void(const RenderState&)> onStateChanged;

    private:
        void handleStartReply(std::uint64_t generation, juce::Result result, RenderStartResponse response);
        void enterRendering(std::uint64_t generation);
        void poll(std::uint64_t generation);
        void handleProgressReply(std::uint64_t generation, juce::Result result, RenderProgress reply);
        void fail(juce::String renderId, juce::String message);
        void setState(RenderState next);
        bool isCurrent(std::uint64_t generation) const noexcept { return generation == currentGeneration; }

        Renderer& renderer;
        Scheduler& scheduler;
        RenderSettings settings;
        RenderState state;
        std::uint64_t currentGeneration = 0;

        JUCE_DECLARE_WEAK_REFERENCEABLE(RenderOrchestrator)
    };
}
