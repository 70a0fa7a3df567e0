#pragma once

#include "Cutline/Public/Types.h"
#include <vector>

namespace Cutline::Persistence
{
    // One JSON record per project id under a single directory.
    class AutosaveStore
    {
    public:
        explicit AutosaveStore(juce::File directory);

        static juce::File defaultDirectory();

        const juce::File& getDirectory() const noexcept { return directory; }
        juce::File fileForProject(const juce::String& projectId) const;

        juce::Result save(const SavedSessionRecord& record);
        juce::Result load(const juce::String& projectId, SavedSessionRecord& recordOut) const;
        bool hasRecord(const juce::String& projectId) const;

        // Newest first. Unreadable files are skipped and reported in skippedOut.
        juce::Result list(std::vector<SavedSessionRecord>& recordsOut,
                          juce::StringArray* skippedOut = nullptr) const;

        juce::Result remove(const juce::String& projectId);
        juce::Result clear();

    private:
        juce::Result ensureDirectory() const;

        juce::File directory;
    };
}
