#pragma once

#include "Cutline/Public/Types.h"
#include <functional>

namespace Cutline::Render
{
    struct RenderStartResponse
    {
        juce::String renderId;
        juce::String bucketName;              // empty when the backend gives no hint
    };

    struct RenderProgress
    {
        enum class Kind
        {
            progress,
            done,
            error
        };

        Kind kind = Kind::progress;
        double progress = 0.0;                // [0, 1]
        juce::String url;
        juce::int64 size = 0;
        juce::String message;
    };

    // Asynchronous renderer contract. Callbacks arrive on the message thread.
    // A failed Result means the call itself failed (transport, malformed reply).
    class Renderer
    {
    public:
        using StartCallback = std::function<void(juce::Result, RenderStartResponse)>;
        using ProgressCallback = std::function<void(juce::Result, RenderProgress)>;

        virtual ~Renderer() = default;

        virtual void start(const juce::String& compositionId,
                           const CompositionProps& inputProps,
                           StartCallback callback) = 0;

        virtual void progress(const juce::String& renderId,
                              const juce::String& bucketName,
                              ProgressCallback callback) = 0;
    };
}
