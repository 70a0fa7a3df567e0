#include "Cutline/Render/Scheduler.h"

#include <juce_events/juce_events.h>

namespace Cutline::Render
{
    void MessageThreadScheduler::callAfter(int delayMs, std::function<void()> task)
    {
        if (!task)
            return;

        if (delayMs <= 0)
        {
            juce::MessageManager::callAsync(std::move(task));
            return;
        }

        juce::Timer::callAfterDelay(delayMs, std::move(task));
    }

    juce::int64 MessageThreadScheduler::nowMs() const
    {
        return juce::Time::currentTimeMillis();
    }
}
