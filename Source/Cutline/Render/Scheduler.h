#pragma once

#include <juce_core/juce_core.h>
#include <functional>

namespace Cutline::Render
{
    class Scheduler
    {
    public:
        virtual ~Scheduler() = default;

        virtual void callAfter(int delayMs, std::function<void()> task) = 0;
        virtual juce::int64 nowMs() const = 0;
    };

    // Runs tasks on the JUCE message thread.
    class MessageThreadScheduler final : public Scheduler
    {
    public:
        void callAfter(int delayMs, std::function<void()> task) override;
        juce::int64 nowMs() const override;
    };
}
