#pragma once

#include "Cutline/Render/Renderer.h"

namespace Cutline::Render
{
    // POST <base>/render   {id, inputProps}     -> {renderId, bucketName?}
    // POST <base>/progress {id, bucketName?}    -> {type: progress|done|error, ...}
    class HttpRenderer final : public Renderer
    {
    public:
        explicit HttpRenderer(juce::URL baseUrl, int timeoutMs = 30000);
        ~HttpRenderer() override;

        void start(const juce::String& compositionId,
                   const CompositionProps& inputProps,
                   StartCallback callback) override;

        void progress(const juce::String& renderId,
                      const juce::String& bucketName,
                      ProgressCallback callback) override;

        static juce::String buildStartRequestBody(const juce::String& compositionId, const CompositionProps& inputProps);
        static juce::String buildProgressRequestBody(const juce::String& renderId, const juce::String& bucketName);

        static juce::Result parseStartResponse(const juce::String& body, RenderStartResponse& responseOut);
        static juce::Result parseProgressResponse(const juce::String& body, RenderProgress& progressOut);

    private:
        using ResponseHandler = std::function<void(juce::Result, juce::String)>;

        void post(const juce::String& endpoint, const juce::String& body, ResponseHandler handler);

        juce::URL baseUrl;
        int timeoutMs = 30000;

        JUCE_DECLARE_WEAK_REFERENCEABLE(HttpRenderer)
    };
}
