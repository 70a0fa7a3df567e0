#include "Cutline/Render/HttpRenderer.h"

#include "Cutline/Serialization/SessionJson.h"
#include <juce_events/juce_events.h>

namespace
{
    struct HttpReply
    {
        juce::Result result = juce::Result::ok();
        juce::String body;
    };

    // Blocking; runs on a background thread.
    HttpReply performPost(const juce::URL& url, const juce::String& body, int timeoutMs)
    {
        int statusCode = 0;
        const auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inPostData)
                                 .withExtraHeaders("Content-Type: application/json")
                                 .withConnectionTimeoutMs(timeoutMs)
                                 .withStatusCode(&statusCode);

        auto stream = url.withPOSTData(body).createInputStream(options);
        if (stream == nullptr)
            return { juce::Result::fail("Failed to connect to " + url.toString(false)), {} };

        auto responseBody = stream->readEntireStreamAsString();
        if (statusCode < 200 || statusCode >= 300)
        {
            return { juce::Result::fail("HTTP " + juce::String(statusCode) + " from " + url.toString(false)
                                        + (responseBody.isNotEmpty() ? ": " + responseBody : juce::String())),
                     {} };
        }

        return { juce::Result::ok(), std::move(responseBody) };
    }

    juce::Result parseJsonObject(const juce::String& body, const juce::NamedValueSet*& propsOut, juce::var& holder)
    {
        const auto parseResult = juce::JSON::parse(body, holder);
        if (parseResult.failed())
            return juce::Result::fail("Malformed renderer reply: " + parseResult.getErrorMessage());

        const auto* object = holder.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("Renderer reply must be a JSON object");

        propsOut = &object->getProperties();
        return juce::Result::ok();
    }
}

namespace Cutline::Render
{
    HttpRenderer::HttpRenderer(juce::URL baseUrlToUse, int timeoutMsToUse)
        : baseUrl(std::move(baseUrlToUse)),
          timeoutMs(timeoutMsToUse)
    {
    }

    HttpRenderer::~HttpRenderer() = default;

    juce::String HttpRenderer::buildStartRequestBody(const juce::String& compositionId, const CompositionProps& inputProps)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", compositionId);
        object->setProperty("inputProps", Serialization::serializeCompositionProps(inputProps));
        return juce::JSON::toString(juce::var(object.release()), true);
    }

    juce::String HttpRenderer::buildProgressRequestBody(const juce::String& renderId, const juce::String& bucketName)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", renderId);
        if (bucketName.isNotEmpty())
            object->setProperty("bucketName", bucketName);
        return juce::JSON::toString(juce::var(object.release()), true);
    }

    juce::Result HttpRenderer::parseStartResponse(const juce::String& body, RenderStartResponse& responseOut)
    {
        juce::var holder;
        const juce::NamedValueSet* props = nullptr;
        const auto parsed = parseJsonObject(body, props, holder);
        if (parsed.failed())
            return parsed;

        const auto renderId = (*props)["renderId"].toString();
        if (renderId.isEmpty())
            return juce::Result::fail("Renderer reply has no renderId");

        responseOut.renderId = renderId;
        responseOut.bucketName = (*props)["bucketName"].toString();
        return juce::Result::ok();
    }

    juce::Result HttpRenderer::parseProgressResponse(const juce::String& body, RenderProgress& progressOut)
    {
        juce::var holder;
        const juce::NamedValueSet* props = nullptr;
        const auto parsed = parseJsonObject(body, props, holder);
        if (parsed.failed())
            return parsed;

        const auto type = (*props)["type"].toString();
        RenderProgress reply;

        if (type == "progress")
        {
            if (!isNumericVar((*props)["progress"]))
                return juce::Result::fail("Progress reply requires numeric progress");

            reply.kind = RenderProgress::Kind::progress;
            reply.progress = static_cast<double>((*props)["progress"]);
        }
        else if (type == "done")
        {
            reply.kind = RenderProgress::Kind::done;
            reply.url = (*props)["url"].toString();
            if (isNumericVar((*props)["size"]))
                reply.size = static_cast<juce::int64>((*props)["size"]);
            if (reply.url.isEmpty())
                return juce::Result::fail("Done reply requires url");
        }
        else if (type == "error")
        {
            reply.kind = RenderProgress::Kind::error;
            reply.message = (*props)["message"].toString();
        }
        else
        {
            return juce::Result::fail("Unknown progress reply type: " + type);
        }

        progressOut = std::move(reply);
        return juce::Result::ok();
    }

    void HttpRenderer::start(const juce::String& compositionId,
                             const CompositionProps& inputProps,
                             StartCallback callback)
    {
        post("render",
             buildStartRequestBody(compositionId, inputProps),
             [callback = std::move(callback)](juce::Result result, juce::String body)
             {
                 RenderStartResponse response;
                 if (result.wasOk())
                     result = parseStartResponse(body, response);

                 if (callback != nullptr)
                     callback(result, response);
             });
    }

    void HttpRenderer::progress(const juce::String& renderId,
                                const juce::String& bucketName,
                                ProgressCallback callback)
    {
        post("progress",
             buildProgressRequestBody(renderId, bucketName),
             [callback = std::move(callback)](juce::Result result, juce::String body)
             {
                 RenderProgress reply;
                 if (result.wasOk())
                     result = parseProgressResponse(body, reply);

                 if (callback != nullptr)
                     callback(result, reply);
             });
    }

    void HttpRenderer::post(const juce::String& endpoint, const juce::String& body, ResponseHandler handler)
    {
        const auto url = baseUrl.getChildURL(endpoint);
        const auto timeout = timeoutMs;
        juce::WeakReference<HttpRenderer> weakThis(this);

        juce::Thread::launch([url, body, timeout, weakThis, handler = std::move(handler)]() mutable
        {
            auto reply = performPost(url, body, timeout);

            juce::MessageManager::callAsync([weakThis, handler = std::move(handler), reply = std::move(reply)]() mutable
            {
                if (weakThis.get() == nullptr)
                    return;

                handler(reply.result, std::move(reply.body));
            });
        });
    }
}
