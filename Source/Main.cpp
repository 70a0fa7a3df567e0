#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include "Cutline/Core/Geometry.h"
#include "Cutline/Persistence/AutosaveStore.h"
#include "Cutline/Public/EditorSession.h"
#include "Cutline/Render/HttpRenderer.h"
#include "Cutline/Serialization/SessionJson.h"
#include <iostream>
#include <memory>
#include <optional>

namespace
{
    struct CliContext
    {
        Cutline::EditorSettings settings;
        std::unique_ptr<Cutline::Persistence::AutosaveStore> store;
    };

    CliContext makeContext(const juce::ArgumentList& args)
    {
        CliContext context;

        std::unique_ptr<juce::PropertiesFile> settingsFile;
        if (args.containsOption("--settings"))
            settingsFile = std::make_unique<juce::PropertiesFile>(args.getFileForOption("--settings"),
                                                                  Cutline::EditorSettings::defaultFileOptions());
        else
            settingsFile = std::make_unique<juce::PropertiesFile>(Cutline::EditorSettings::defaultFileOptions());

        context.settings = Cutline::EditorSettings::loadFrom(*settingsFile);

        const auto settingsCheck = context.settings.validate();
        if (settingsCheck.failed())
            juce::ConsoleApplication::fail("Invalid settings: " + settingsCheck.getErrorMessage());

        if (args.containsOption("--renderer"))
            context.settings.rendererBaseUrl = args.getValueForOption("--renderer");

        const auto directory = args.containsOption("--dir")
                                   ? args.getFileForOption("--dir")
                                   : Cutline::Persistence::AutosaveStore::defaultDirectory();
        context.store = std::make_unique<Cutline::Persistence::AutosaveStore>(directory);
        return context;
    }

    juce::String positional(const juce::ArgumentList& args, int index, const juce::String& name)
    {
        int seen = 0;
        for (int i = 1; i < args.size(); ++i)
        {
            const auto& arg = args[i];
            if (arg.isOption())
            {
                // Options given as "--key value" swallow the next argument.
                if (!arg.text.contains("=") && i + 1 < args.size() && !args[i + 1].isOption())
                    ++i;
                continue;
            }

            if (seen++ == index)
                return arg.text;
        }

        juce::ConsoleApplication::fail("Missing argument: " + name);
        return {};
    }

    int intOption(const juce::ArgumentList& args, const juce::String& option, int fallback)
    {
        if (!args.containsOption(option))
            return fallback;

        const auto text = args.getValueForOption(option).trim();
        if (text.isEmpty() || !text.containsOnly("-0123456789"))
            juce::ConsoleApplication::fail(option + " expects an integer");

        return text.getIntValue();
    }

    juce::int64 overlayIdArgument(const juce::ArgumentList& args, int index)
    {
        const auto text = positional(args, index, "overlay id").trim();
        if (!text.containsOnly("0123456789"))
            juce::ConsoleApplication::fail("overlay id must be a non-negative integer");

        return text.getLargeIntValue();
    }

    std::unique_ptr<Cutline::EditorSession> openSession(CliContext& context,
                                                        const juce::String& projectId,
                                                        Cutline::Render::Renderer* renderer = nullptr,
                                                        bool mustExist = true)
    {
        Cutline::EditorSession::Collaborators collaborators;
        collaborators.autosaveStore = context.store.get();
        collaborators.renderer = renderer;

        auto session = std::make_unique<Cutline::EditorSession>(projectId, context.settings, collaborators);
        if (session->hasSavedState())
        {
            const auto restored = session->restoreSaved();
            if (restored.failed())
                juce::ConsoleApplication::fail("Failed to open " + projectId + ": " + restored.getErrorMessage());
        }
        else if (mustExist)
        {
            juce::ConsoleApplication::fail("No saved project named " + projectId);
        }

        return session;
    }

    void saveOrFail(Cutline::EditorSession& session)
    {
        const auto saved = session.saveNow();
        if (saved.failed())
            juce::ConsoleApplication::fail("Failed to save " + session.projectId() + ": " + saved.getErrorMessage());
    }

    void requireEdit(bool ok, const Cutline::EditorSession& session)
    {
        if (!ok)
            juce::ConsoleApplication::fail(session.lastEditResult().getErrorMessage());
    }

    void printOverlay(const Cutline::OverlayModel& overlay)
    {
        std::cout << "  #" << overlay.id
                  << " " << Cutline::overlayTypeToKey(overlay.type())
                  << " row=" << overlay.row
                  << " from=" << overlay.from
                  << " duration=" << overlay.durationInFrames
                  << " bounds=" << overlay.bounds.toString()
                  << std::endl;
    }

    void printSession(const Cutline::EditorSession& session)
    {
        const auto canvas = session.canvasSize();
        std::cout << session.projectId()
                  << " aspect=" << Cutline::aspectRatioToKey(session.aspectRatio())
                  << " canvas=" << canvas.width << "x" << canvas.height
                  << " fps=" << session.fps()
                  << " duration=" << session.durationInFrames()
                  << " overlays=" << session.overlays().size()
                  << std::endl;

        for (const auto& overlay : session.overlays())
            printOverlay(overlay);
    }

    std::optional<Cutline::OverlayType> mediaTypeFromKey(const juce::String& key)
    {
        if (key.equalsIgnoreCase("audio"))
            return Cutline::OverlayType::sound;

        return Cutline::overlayTypeFromKey(key);
    }

    void runNew(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        const auto projectId = positional(args, 0, "project id");
        if (context.store->hasRecord(projectId))
            juce::ConsoleApplication::fail("Project already exists: " + projectId);

        auto session = openSession(context, projectId, nullptr, false);
        if (args.containsOption("--aspect"))
        {
            const auto ratio = Cutline::aspectRatioFromKey(args.getValueForOption("--aspect"));
            if (!ratio.has_value())
                juce::ConsoleApplication::fail("Unknown aspect ratio " + args.getValueForOption("--aspect"));
            session->setAspectRatioWithoutTransform(*ratio);
        }

        saveOrFail(*session);
        printSession(*session);
    }

    void runList(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);

        std::vector<Cutline::SavedSessionRecord> records;
        juce::StringArray skipped;
        const auto listed = context.store->list(records, &skipped);
        if (listed.failed())
            juce::ConsoleApplication::fail(listed.getErrorMessage());

        for (const auto& record : records)
        {
            std::cout << record.projectId
                      << "  " << juce::Time(record.timestampMs).toISO8601(true)
                      << "  overlays=" << record.editorState.overlays.size()
                      << std::endl;
        }

        for (const auto& name : skipped)
            std::cerr << "skipped unreadable record " << name << std::endl;
    }

    void runShow(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));
        printSession(*session);
    }

    void runAddMedia(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));

        const auto type = mediaTypeFromKey(positional(args, 1, "media type"));
        if (!type.has_value())
            juce::ConsoleApplication::fail("Unknown media type");

        Cutline::MediaDescriptor media;
        media.type = *type;
        media.src = positional(args, 2, "source");
        media.label = args.getValueForOption("--label");
        if (args.containsOption("--duration"))
            media.durationSeconds = args.getValueForOption("--duration").getDoubleValue();

        const auto id = session->addMedia(media, intOption(args, "--row", 0), intOption(args, "--at", 0));
        requireEdit(id.has_value(), *session);

        saveOrFail(*session);
        std::cout << "added overlay " << *id << std::endl;
    }

    void runImportSrt(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));

        const juce::File srtFile = juce::File::getCurrentWorkingDirectory().getChildFile(positional(args, 1, "srt file"));
        if (!srtFile.existsAsFile())
            juce::ConsoleApplication::fail("File not found: " + srtFile.getFullPathName());

        const auto id = session->importSrt(srtFile.loadFileAsString(), intOption(args, "--row", 0), intOption(args, "--at", 0));
        requireEdit(id.has_value(), *session);

        saveOrFail(*session);
        std::cout << "added caption overlay " << *id << std::endl;
    }

    void runSplit(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));

        const auto frameText = positional(args, 2, "frame");
        const auto id = session->splitOverlay(overlayIdArgument(args, 1), frameText.getIntValue());
        requireEdit(id.has_value(), *session);

        saveOrFail(*session);
        std::cout << "split into overlay " << *id << std::endl;
    }

    void runDuplicate(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));

        const auto id = session->duplicateOverlay(overlayIdArgument(args, 1));
        requireEdit(id.has_value(), *session);

        saveOrFail(*session);
        std::cout << "duplicated as overlay " << *id << std::endl;
    }

    void runDelete(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));

        requireEdit(session->deleteOverlay(overlayIdArgument(args, 1)), *session);
        saveOrFail(*session);
    }

    void runAspect(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));

        const auto key = positional(args, 1, "aspect ratio");
        const auto ratio = Cutline::aspectRatioFromKey(key);
        if (!ratio.has_value())
            juce::ConsoleApplication::fail("Unknown aspect ratio " + key);

        requireEdit(session->setAspectRatio(*ratio), *session);
        saveOrFail(*session);
        printSession(*session);
    }

    void runExport(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        auto session = openSession(context, positional(args, 0, "project id"));

        juce::String json;
        const auto serialized = Cutline::Serialization::compositionPropsToJsonString(session->compositionProps(), json);
        if (serialized.failed())
            juce::ConsoleApplication::fail(serialized.getErrorMessage());

        if (args.containsOption("--out"))
        {
            const auto outFile = args.getFileForOption("--out");
            if (!outFile.replaceWithText(json))
                juce::ConsoleApplication::fail("Failed to write " + outFile.getFullPathName());
            return;
        }

        std::cout << json << std::endl;
    }

    void runRender(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        if (context.settings.rendererBaseUrl.isEmpty())
            juce::ConsoleApplication::fail("No renderer configured, pass --renderer=<url>");

        juce::ScopedJuceInitialiser_GUI juceInitialiser;
        Cutline::Render::HttpRenderer renderer(juce::URL(context.settings.rendererBaseUrl));
        auto session = openSession(context, positional(args, 0, "project id"), &renderer);

        session->onRenderStateChanged = [](const Cutline::Render::RenderState& state)
        {
            if (state.status == Cutline::Render::RenderStatus::rendering)
                std::cout << "rendering " << juce::roundToInt(state.progress * 100.0) << "%" << std::endl;
        };

        if (!session->renderMedia())
            juce::ConsoleApplication::fail("Render request was not accepted");

        const auto timeoutMs = intOption(args, "--timeout", 30 * 60 * 1000);
        const auto startedAt = juce::Time::getMillisecondCounter();

        while (session->renderState().status == Cutline::Render::RenderStatus::invoking
               || session->renderState().status == Cutline::Render::RenderStatus::rendering)
        {
            if (static_cast<int>(juce::Time::getMillisecondCounter() - startedAt) > timeoutMs)
                juce::ConsoleApplication::fail("Render timed out");

            juce::MessageManager::getInstance()->runDispatchLoopUntil(50);
        }

        const auto& state = session->renderState();
        if (state.status == Cutline::Render::RenderStatus::error)
            juce::ConsoleApplication::fail("Render failed: " + state.errorMessage);

        std::cout << "done " << state.url << " (" << state.size << " bytes)" << std::endl;
    }

    void runRemove(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        const auto removed = context.store->remove(positional(args, 0, "project id"));
        if (removed.failed())
            juce::ConsoleApplication::fail(removed.getErrorMessage());
    }

    void runClear(const juce::ArgumentList& args)
    {
        auto context = makeContext(args);
        const auto cleared = context.store->clear();
        if (cleared.failed())
            juce::ConsoleApplication::fail(cleared.getErrorMessage());
    }
}

int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;
    app.addHelpCommand("--help|-h", "Usage: cutline <command> [--dir=<autosave dir>] [--settings=<file>]", true);

    app.addCommand({ "new", "new <project> [--aspect=16:9]", "Creates an empty project.", {}, runNew });
    app.addCommand({ "list", "list", "Lists saved projects, newest first.", {}, runList });
    app.addCommand({ "show", "show <project>", "Prints the project's overlays.", {}, runShow });
    app.addCommand({ "add-media", "add-media <project> <video|image|audio|text> <src> [--duration=s] [--row=n] [--at=frame] [--label=text]",
                     "Drops a media item on the timeline.", {}, runAddMedia });
    app.addCommand({ "import-srt", "import-srt <project> <file.srt> [--row=n] [--at=frame]",
                     "Adds a caption overlay from an SRT file.", {}, runImportSrt });
    app.addCommand({ "split", "split <project> <overlay> <frame>", "Splits an overlay at a frame.", {}, runSplit });
    app.addCommand({ "duplicate", "duplicate <project> <overlay>", "Duplicates an overlay on its row.", {}, runDuplicate });
    app.addCommand({ "delete", "delete <project> <overlay>", "Deletes an overlay.", {}, runDelete });
    app.addCommand({ "aspect", "aspect <project> <16:9|1:1|4:5|9:16>", "Changes the canvas and rescales overlays.", {}, runAspect });
    app.addCommand({ "export", "export <project> [--out=file]", "Writes the composition payload as JSON.", {}, runExport });
    app.addCommand({ "render", "render <project> [--renderer=url] [--timeout=ms]", "Renders through the HTTP renderer.", {}, runRender });
    app.addCommand({ "remove", "remove <project>", "Deletes a saved project.", {}, runRemove });
    app.addCommand({ "clear", "clear", "Deletes every saved project.", {}, runClear });

    return app.findAndRunCommand(juce::ArgumentList(argc, argv), true);
}
