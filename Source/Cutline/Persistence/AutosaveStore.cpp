#include "Cutline/Persistence/AutosaveStore.h"

#include "Cutline/Serialization/SessionJson.h"
#include <algorithm>

namespace
{
    const juce::String kRecordExtension { ".json" };
}

namespace Cutline::Persistence
{
    AutosaveStore::AutosaveStore(juce::File directoryToUse)
        : directory(std::move(directoryToUse))
    {
    }

    juce::File AutosaveStore::defaultDirectory()
    {
        return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
            .getChildFile("Cutline")
            .getChildFile("autosave");
    }

    juce::File AutosaveStore::fileForProject(const juce::String& projectId) const
    {
        return directory.getChildFile(juce::File::createLegalFileName(projectId.trim()) + kRecordExtension);
    }

    juce::Result AutosaveStore::ensureDirectory() const
    {
        if (directory.isDirectory())
            return juce::Result::ok();

        const auto created = directory.createDirectory();
        if (created.failed())
            return juce::Result::fail("Failed to create autosave directory " + directory.getFullPathName()
                                      + ": " + created.getErrorMessage());

        return juce::Result::ok();
    }

    juce::Result AutosaveStore::save(const SavedSessionRecord& record)
    {
        if (record.projectId.trim().isEmpty())
            return juce::Result::fail("Autosave requires a project id");

        const auto directoryResult = ensureDirectory();
        if (directoryResult.failed())
            return directoryResult;

        return Serialization::saveSessionRecordToFile(fileForProject(record.projectId), record);
    }

    juce::Result AutosaveStore::load(const juce::String& projectId, SavedSessionRecord& recordOut) const
    {
        const auto file = fileForProject(projectId);
        if (!file.existsAsFile())
            return juce::Result::fail("No autosave for project " + projectId);

        SavedSessionRecord record;
        const auto result = Serialization::loadSessionRecordFromFile(file, record);
        if (result.failed())
            return result;

        if (record.projectId != projectId.trim())
            return juce::Result::fail("Autosave file " + file.getFileName() + " belongs to project " + record.projectId);

        recordOut = std::move(record);
        return juce::Result::ok();
    }

    bool AutosaveStore::hasRecord(const juce::String& projectId) const
    {
        return fileForProject(projectId).existsAsFile();
    }

    juce::Result AutosaveStore::list(std::vector<SavedSessionRecord>& recordsOut,
                                     juce::StringArray* skippedOut) const
    {
        recordsOut.clear();
        if (!directory.isDirectory())
            return juce::Result::ok();

        for (const auto& file : directory.findChildFiles(juce::File::findFiles, false, "*" + kRecordExtension))
        {
            SavedSessionRecord record;
            const auto result = Serialization::loadSessionRecordFromFile(file, record);
            if (result.failed())
            {
                DBG("[Cutline][Autosave] skipping " + file.getFileName() + ": " + result.getErrorMessage());
                if (skippedOut != nullptr)
                    skippedOut->add(file.getFileName());
                continue;
            }

            recordsOut.push_back(std::move(record));
        }

        std::stable_sort(recordsOut.begin(),
                         recordsOut.end(),
                         [](const SavedSessionRecord& lhs, const SavedSessionRecord& rhs)
                         {
                             return lhs.timestampMs > rhs.timestampMs;
                         });
        return juce::Result::ok();
    }

    juce::Result AutosaveStore::remove(const juce::String& projectId)
    {
        const auto file = fileForProject(projectId);
        if (!file.existsAsFile())
            return juce::Result::ok();

        if (!file.deleteFile())
            return juce::Result::fail("Failed to delete autosave " + file.getFullPathName());

        return juce::Result::ok();
    }

    juce::Result AutosaveStore::clear()
    {
        if (!directory.isDirectory())
            return juce::Result::ok();

        for (const auto& file : directory.findChildFiles(juce::File::findFiles, false, "*" + kRecordExtension))
        {
            if (!file.deleteFile())
                return juce::Result::fail("Failed to delete autosave " + file.getFullPathName());
        }

        return juce::Result::ok();
    }
}
