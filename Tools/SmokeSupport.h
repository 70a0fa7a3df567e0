#pragma once

#include "Cutline/Public/Types.h"
#include "Cutline/Render/Renderer.h"
#include "Cutline/Render/Scheduler.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <vector>

namespace CutlineSmoke
{
    inline bool nearlyEqual(double lhs, double rhs, double epsilon = 1.0e-6)
    {
        return std::abs(lhs - rhs) <= epsilon;
    }

    inline Cutline::OverlayModel makeTextOverlay(Cutline::FrameIndex from,
                                                 Cutline::FrameIndex duration,
                                                 int row,
                                                 juce::Rectangle<int> bounds = { 100, 100, 200, 80 })
    {
        Cutline::OverlayModel overlay;
        overlay.from = from;
        overlay.durationInFrames = duration;
        overlay.row = row;
        overlay.bounds = bounds;
        overlay.styles.set(Cutline::StyleKeys::opacity, 1.0);
        overlay.payload = Cutline::TextContent { "Title" };
        return overlay;
    }

    inline const Cutline::OverlayModel* findOverlay(const std::vector<Cutline::OverlayModel>& overlays,
                                                    Cutline::OverlayId id)
    {
        const auto it = std::find_if(overlays.begin(),
                                     overlays.end(),
                                     [id](const Cutline::OverlayModel& overlay)
                                     {
                                         return overlay.id == id;
                                     });
        return it == overlays.end() ? nullptr : &(*it);
    }

    inline bool rowHasOverlap(const std::vector<Cutline::OverlayModel>& overlays, int row)
    {
        for (size_t i = 0; i < overlays.size(); ++i)
        {
            for (size_t j = i + 1; j < overlays.size(); ++j)
            {
                const auto& a = overlays[i];
                const auto& b = overlays[j];
                if (a.row != row || b.row != row)
                    continue;

                if (a.from < b.endFrame() && b.from < a.endFrame())
                    return true;
            }
        }

        return false;
    }

    // Deterministic clock. Tasks run only when advance() passes their due time.
    class ManualScheduler final : public Cutline::Render::Scheduler
    {
    public:
        void callAfter(int delayMs, std::function<void()> task) override
        {
            pending.push_back({ now + std::max(0, delayMs), sequence++, std::move(task) });
        }

        juce::int64 nowMs() const override
        {
            return now;
        }

        void advance(juce::int64 deltaMs)
        {
            const auto target = now + deltaMs;

            for (;;)
            {
                auto next = std::min_element(pending.begin(),
                                             pending.end(),
                                             [](const Pending& lhs, const Pending& rhs)
                                             {
                                                 return lhs.dueMs != rhs.dueMs ? lhs.dueMs < rhs.dueMs
                                                                              : lhs.sequence < rhs.sequence;
                                             });

                if (next == pending.end() || next->dueMs > target)
                    break;

                now = next->dueMs;
                auto task = std::move(next->task);
                pending.erase(next);
                task();
            }

            now = target;
        }

        size_t pendingCount() const noexcept
        {
            return pending.size();
        }

    private:
        struct Pending
        {
            juce::int64 dueMs = 0;
            juce::uint64 sequence = 0;
            std::function<void()> task;
        };

        std::vector<Pending> pending;
        juce::int64 now = 0;
        juce::uint64 sequence = 0;
    };

    // Records every request; replies are delivered when the test says so.
    class FakeRenderer final : public Cutline::Render::Renderer
    {
    public:
        void start(const juce::String& compositionId,
                   const Cutline::CompositionProps& inputProps,
                   StartCallback callback) override
        {
            ++startCalls;
            lastCompositionId = compositionId;
            lastProps = inputProps;
            pendingStart = std::move(callback);
        }

        void progress(const juce::String& renderId,
                      const juce::String& bucketName,
                      ProgressCallback callback) override
        {
            ++progressCalls;
            lastProgressRenderId = renderId;
            lastProgressBucket = bucketName;
            pendingProgress = std::move(callback);
        }

        bool replyStart(juce::Result result, Cutline::Render::RenderStartResponse response)
        {
            if (pendingStart == nullptr)
                return false;

            auto callback = std::move(pendingStart);
            pendingStart = nullptr;
            callback(result, response);
            return true;
        }

        bool replyProgress(juce::Result result, Cutline::Render::RenderProgress reply)
        {
            if (pendingProgress == nullptr)
                return false;

            auto callback = std::move(pendingProgress);
            pendingProgress = nullptr;
            callback(result, reply);
            return true;
        }

        bool replyProgressFraction(double fraction)
        {
            Cutline::Render::RenderProgress reply;
            reply.kind = Cutline::Render::RenderProgress::Kind::progress;
            reply.progress = fraction;
            return replyProgress(juce::Result::ok(), reply);
        }

        int startCalls = 0;
        int progressCalls = 0;
        juce::String lastCompositionId;
        Cutline::CompositionProps lastProps;
        juce::String lastProgressRenderId;
        juce::String lastProgressBucket;
        StartCallback pendingStart;
        ProgressCallback pendingProgress;
    };
}
