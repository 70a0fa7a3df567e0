#include "Cutline/Serialization/SessionJson.h"

#include "Cutline/Core/OverlayValidator.h"
#include <cmath>
#include <limits>

namespace
{
    juce::var serializeSchemaVersion(const Cutline::SchemaVersion& version)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("major", version.major);
        object->setProperty("minor", version.minor);
        object->setProperty("patch", version.patch);
        return juce::var(object.release());
    }

    std::optional<Cutline::SchemaVersion> parseSchemaVersion(const juce::var& value)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return std::nullopt;

        const auto& props = object->getProperties();
        if (!Cutline::isNumericVar(props["major"]) || !Cutline::isNumericVar(props["minor"]) || !Cutline::isNumericVar(props["patch"]))
            return std::nullopt;

        Cutline::SchemaVersion version;
        version.major = static_cast<int>(props["major"]);
        version.minor = static_cast<int>(props["minor"]);
        version.patch = static_cast<int>(props["patch"]);
        return version;
    }

    juce::Result parseRequiredNumber(const juce::NamedValueSet& props,
                                     const juce::Identifier& key,
                                     const juce::String& context,
                                     double& outValue)
    {
        const auto& value = props[key];
        if (!Cutline::isNumericVar(value))
            return juce::Result::fail(context + "." + key.toString() + " must be numeric");

        const auto parsed = static_cast<double>(value);
        if (!std::isfinite(parsed))
            return juce::Result::fail(context + "." + key.toString() + " must be finite");

        outValue = parsed;
        return juce::Result::ok();
    }

    juce::Result parseRequiredInt(const juce::NamedValueSet& props,
                                  const juce::Identifier& key,
                                  const juce::String& context,
                                  int& outValue)
    {
        double parsed = 0.0;
        const auto result = parseRequiredNumber(props, key, context, parsed);
        if (result.failed())
            return result;

        if (std::floor(parsed) != parsed
            || parsed < static_cast<double>(std::numeric_limits<int>::min())
            || parsed > static_cast<double>(std::numeric_limits<int>::max()))
            return juce::Result::fail(context + "." + key.toString() + " must be an integer");

        outValue = static_cast<int>(parsed);
        return juce::Result::ok();
    }

    juce::Result parseOptionalNumber(const juce::NamedValueSet& props,
                                     const juce::Identifier& key,
                                     const juce::String& context,
                                     std::optional<double>& outValue)
    {
        const auto* value = props.getVarPointer(key);
        if (value == nullptr || value->isVoid() || value->isUndefined())
        {
            outValue.reset();
            return juce::Result::ok();
        }

        double parsed = 0.0;
        const auto result = parseRequiredNumber(props, key, context, parsed);
        if (result.failed())
            return result;

        outValue = parsed;
        return juce::Result::ok();
    }

    juce::Result parseNumberOr(const juce::NamedValueSet& props,
                               const juce::Identifier& key,
                               const juce::String& context,
                               double fallback,
                               double& outValue)
    {
        std::optional<double> parsed;
        const auto result = parseOptionalNumber(props, key, context, parsed);
        if (result.failed())
            return result;

        outValue = parsed.value_or(fallback);
        return juce::Result::ok();
    }

    juce::String stringOr(const juce::NamedValueSet& props, const juce::Identifier& key, const juce::String& fallback = {})
    {
        const auto* value = props.getVarPointer(key);
        if (value == nullptr || !value->isString())
            return fallback;
        return value->toString();
    }

    juce::var serializeStyles(const Cutline::PropertyBag& styles)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        for (int i = 0; i < styles.size(); ++i)
            object->setProperty(styles.getName(i), styles.getValueAt(i));

        return juce::var(object.release());
    }

    juce::Result parseStyles(const juce::var& value, Cutline::PropertyBag& outStyles)
    {
        outStyles.clear();
        if (value.isVoid() || value.isUndefined())
            return juce::Result::ok();

        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("overlay.styles must be object");

        const auto& props = object->getProperties();
        for (int i = 0; i < props.size(); ++i)
            outStyles.set(props.getName(i), props.getValueAt(i));

        return Cutline::Core::OverlayValidator::validateStyles(outStyles);
    }

    juce::var serializeWord(const Cutline::CaptionWord& word)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("word", word.word);
        object->setProperty("startMs", word.startMs);
        object->setProperty("endMs", word.endMs);
        object->setProperty("confidence", word.confidence);
        return juce::var(object.release());
    }

    juce::var serializeCaption(const Cutline::Caption& caption)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("text", caption.text);
        object->setProperty("startMs", caption.startMs);
        object->setProperty("endMs", caption.endMs);
        object->setProperty("timestampMs", caption.timestampMs.has_value() ? juce::var(*caption.timestampMs) : juce::var());
        object->setProperty("confidence", caption.confidence.has_value() ? juce::var(*caption.confidence) : juce::var());

        juce::Array<juce::var> words;
        for (const auto& word : caption.words)
            words.add(serializeWord(word));
        object->setProperty("words", juce::var(words));

        return juce::var(object.release());
    }

    juce::Result parseCaption(const juce::var& value, Cutline::Caption& outCaption)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("caption must be object");

        const auto& props = object->getProperties();
        Cutline::Caption caption;
        caption.text = stringOr(props, "text");

        auto result = parseRequiredNumber(props, "startMs", "caption", caption.startMs);
        if (result.wasOk())
            result = parseRequiredNumber(props, "endMs", "caption", caption.endMs);
        if (result.wasOk())
            result = parseOptionalNumber(props, "timestampMs", "caption", caption.timestampMs);
        if (result.wasOk())
            result = parseOptionalNumber(props, "confidence", "caption", caption.confidence);
        if (result.failed())
            return result;

        if (const auto* words = props["words"].getArray())
        {
            for (const auto& wordValue : *words)
            {
                const auto* wordObject = wordValue.getDynamicObject();
                if (wordObject == nullptr)
                    return juce::Result::fail("caption.words entries must be objects");

                const auto& wordProps = wordObject->getProperties();
                Cutline::CaptionWord word;
                word.word = stringOr(wordProps, "word");

                auto wordResult = parseRequiredNumber(wordProps, "startMs", "caption.word", word.startMs);
                if (wordResult.wasOk())
                    wordResult = parseRequiredNumber(wordProps, "endMs", "caption.word", word.endMs);
                if (wordResult.wasOk())
                    wordResult = parseNumberOr(wordProps, "confidence", "caption.word", 1.0, word.confidence);
                if (wordResult.failed())
                    return wordResult;

                caption.words.push_back(std::move(word));
            }
        }

        outCaption = std::move(caption);
        return juce::Result::ok();
    }

    juce::var serializeWaveform(const Cutline::WaveformData& waveform)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        juce::Array<juce::var> peaks;
        for (const auto peak : waveform.peaks)
            peaks.add(static_cast<double>(peak));

        object->setProperty("peaks", juce::var(peaks));
        object->setProperty("length", waveform.length);
        return juce::var(object.release());
    }

    juce::Result parseWaveform(const juce::var& value, Cutline::WaveformData& outWaveform)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("waveformData must be object");

        const auto& props = object->getProperties();
        const auto* peaks = props["peaks"].getArray();
        if (peaks == nullptr)
            return juce::Result::fail("waveformData.peaks must be array");

        Cutline::WaveformData waveform;
        waveform.peaks.reserve(static_cast<size_t>(peaks->size()));
        for (const auto& peak : *peaks)
        {
            if (!Cutline::isNumericVar(peak))
                return juce::Result::fail("waveformData.peaks must be numeric");
            waveform.peaks.push_back(static_cast<float>(static_cast<double>(peak)));
        }

        const auto lengthResult = parseRequiredInt(props, "length", "waveformData", waveform.length);
        if (lengthResult.failed())
            return lengthResult;

        outWaveform = std::move(waveform);
        return juce::Result::ok();
    }

    void serializePayload(const Cutline::OverlayPayload& payload, juce::DynamicObject& object)
    {
        std::visit([&object](const auto& content)
                   {
                       using T = std::decay_t<decltype(content)>;

                       if constexpr (!std::is_same_v<T, Cutline::CaptionContent>)
                           object.setProperty("content", content.content);

                       if constexpr (std::is_same_v<T, Cutline::ImageContent>)
                       {
                           object.setProperty("src", content.src);
                       }
                       else if constexpr (std::is_same_v<T, Cutline::VideoContent>)
                       {
                           object.setProperty("src", content.src);
                           object.setProperty("videoStartTime", content.videoStartTime);
                           object.setProperty("speed", content.speed);
                           if (content.mediaSrcDuration.has_value())
                               object.setProperty("mediaSrcDuration", *content.mediaSrcDuration);
                       }
                       else if constexpr (std::is_same_v<T, Cutline::SoundContent>)
                       {
                           object.setProperty("src", content.src);
                           object.setProperty("startFromSound", content.startFromSound);
                           if (content.mediaSrcDuration.has_value())
                               object.setProperty("mediaSrcDuration", *content.mediaSrcDuration);
                           if (content.waveform.has_value())
                               object.setProperty("waveformData", serializeWaveform(*content.waveform));
                       }
                       else if constexpr (std::is_same_v<T, Cutline::CaptionContent>)
                       {
                           juce::Array<juce::var> captions;
                           for (const auto& caption : content.captions)
                               captions.add(serializeCaption(caption));
                           object.setProperty("captions", juce::var(captions));
                           if (content.templateKey.isNotEmpty())
                               object.setProperty("template", content.templateKey);
                       }
                       else if constexpr (std::is_same_v<T, Cutline::StickerContent>)
                       {
                           object.setProperty("category", content.category);
                       }
                   },
                   payload);
    }

    juce::Result parsePayload(Cutline::OverlayType type,
                              const juce::NamedValueSet& props,
                              Cutline::OverlayPayload& outPayload)
    {
        const auto content = stringOr(props, "content");

        switch (type)
        {
            case Cutline::OverlayType::text:
                outPayload = Cutline::TextContent { content };
                return juce::Result::ok();

            case Cutline::OverlayType::image:
                outPayload = Cutline::ImageContent { stringOr(props, "src"), content };
                return juce::Result::ok();

            case Cutline::OverlayType::shape:
                outPayload = Cutline::ShapeContent { content };
                return juce::Result::ok();

            case Cutline::OverlayType::video:
            {
                Cutline::VideoContent video;
                video.src = stringOr(props, "src");
                video.content = content;

                auto result = parseNumberOr(props, "videoStartTime", "video", 0.0, video.videoStartTime);
                if (result.wasOk())
                    result = parseNumberOr(props, "speed", "video", 1.0, video.speed);
                if (result.wasOk())
                    result = parseOptionalNumber(props, "mediaSrcDuration", "video", video.mediaSrcDuration);
                if (result.failed())
                    return result;

                outPayload = std::move(video);
                return juce::Result::ok();
            }

            case Cutline::OverlayType::sound:
            {
                Cutline::SoundContent sound;
                sound.src = stringOr(props, "src");
                sound.content = content;

                auto result = parseNumberOr(props, "startFromSound", "sound", 0.0, sound.startFromSound);
                if (result.wasOk())
                    result = parseOptionalNumber(props, "mediaSrcDuration", "sound", sound.mediaSrcDuration);
                if (result.failed())
                    return result;

                if (props.contains("waveformData") && !props["waveformData"].isVoid())
                {
                    Cutline::WaveformData waveform;
                    const auto waveformResult = parseWaveform(props["waveformData"], waveform);
                    if (waveformResult.failed())
                        return waveformResult;
                    sound.waveform = std::move(waveform);
                }

                outPayload = std::move(sound);
                return juce::Result::ok();
            }

            case Cutline::OverlayType::caption:
            {
                Cutline::CaptionContent captions;
                captions.templateKey = stringOr(props, "template");

                if (props.contains("captions"))
                {
                    const auto* array = props["captions"].getArray();
                    if (array == nullptr)
                        return juce::Result::fail("caption.captions must be array");

                    for (const auto& captionValue : *array)
                    {
                        Cutline::Caption caption;
                        const auto captionResult = parseCaption(captionValue, caption);
                        if (captionResult.failed())
                            return captionResult;
                        captions.captions.push_back(std::move(caption));
                    }
                }

                outPayload = std::move(captions);
                return juce::Result::ok();
            }

            case Cutline::OverlayType::sticker:
                outPayload = Cutline::StickerContent { content, stringOr(props, "category") };
                return juce::Result::ok();
        }

        return juce::Result::fail("unsupported overlay type");
    }

    juce::var serializeIdArray(const std::vector<Cutline::OverlayId>& ids)
    {
        juce::Array<juce::var> array;
        for (const auto id : ids)
            array.add(static_cast<juce::int64>(id));

        return juce::var(array);
    }

    juce::Result parseIdArray(const juce::var& value,
                              std::vector<Cutline::OverlayId>& outIds,
                              const juce::String& context)
    {
        outIds.clear();
        if (value.isVoid() || value.isUndefined())
            return juce::Result::ok();

        const auto* array = value.getArray();
        if (array == nullptr)
            return juce::Result::fail(context + " must be array");

        for (const auto& item : *array)
        {
            if (!item.isInt() && !item.isInt64())
                return juce::Result::fail(context + " entries must be integer ids");
            outIds.push_back(static_cast<juce::int64>(item));
        }

        return juce::Result::ok();
    }

    juce::Result verifySchemaCompatibility(const Cutline::SchemaVersion& loaded)
    {
        return Cutline::Core::OverlayValidator::validateSchemaVersion(loaded);
    }
}

namespace Cutline::Serialization
{
    juce::var serializeOverlay(const OverlayModel& overlay)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", static_cast<juce::int64>(overlay.id));
        object->setProperty("type", overlayTypeToKey(overlay.type()));
        object->setProperty("from", overlay.from);
        object->setProperty("durationInFrames", overlay.durationInFrames);
        object->setProperty("row", overlay.row);
        object->setProperty("left", overlay.bounds.getX());
        object->setProperty("top", overlay.bounds.getY());
        object->setProperty("width", overlay.bounds.getWidth());
        object->setProperty("height", overlay.bounds.getHeight());
        object->setProperty("rotation", overlay.rotation);
        object->setProperty("styles", serializeStyles(overlay.styles));
        serializePayload(overlay.payload, *object);
        return juce::var(object.release());
    }

    juce::Result parseOverlay(const juce::var& value, OverlayModel& overlayOut)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("overlay must be object");

        const auto& props = object->getProperties();
        if (!props["id"].isInt() && !props["id"].isInt64())
            return juce::Result::fail("overlay.id must be an integer");

        const auto type = overlayTypeFromKey(props["type"].toString());
        if (!type.has_value())
            return juce::Result::fail("overlay.type is unknown: " + props["type"].toString());

        OverlayModel overlay;
        overlay.id = static_cast<juce::int64>(props["id"]);

        int left = 0;
        int top = 0;
        int width = 0;
        int height = 0;

        auto result = parseRequiredInt(props, "from", "overlay", overlay.from);
        if (result.wasOk())
            result = parseRequiredInt(props, "durationInFrames", "overlay", overlay.durationInFrames);
        if (result.wasOk())
            result = parseRequiredInt(props, "row", "overlay", overlay.row);
        if (result.wasOk())
            result = parseRequiredInt(props, "left", "overlay", left);
        if (result.wasOk())
            result = parseRequiredInt(props, "top", "overlay", top);
        if (result.wasOk())
            result = parseRequiredInt(props, "width", "overlay", width);
        if (result.wasOk())
            result = parseRequiredInt(props, "height", "overlay", height);
        if (result.wasOk())
            result = parseNumberOr(props, "rotation", "overlay", 0.0, overlay.rotation);
        if (result.wasOk())
            result = parseStyles(props["styles"], overlay.styles);
        if (result.wasOk())
            result = parsePayload(*type, props, overlay.payload);
        if (result.failed())
            return juce::Result::fail("overlay " + juce::String(overlay.id) + ": " + result.getErrorMessage());

        overlay.bounds = { left, top, width, height };

        const auto validity = Core::OverlayValidator::validateOverlay(overlay);
        if (validity.failed())
            return juce::Result::fail("overlay " + juce::String(overlay.id) + ": " + validity.getErrorMessage());

        overlayOut = std::move(overlay);
        return juce::Result::ok();
    }

    juce::var serializeOverlays(const std::vector<OverlayModel>& overlays)
    {
        juce::Array<juce::var> array;
        for (const auto& overlay : overlays)
            array.add(serializeOverlay(overlay));

        return juce::var(array);
    }

    juce::Result parseOverlays(const juce::var& value, std::vector<OverlayModel>& overlaysOut)
    {
        const auto* array = value.getArray();
        if (array == nullptr)
            return juce::Result::fail("overlays must be array");

        std::vector<OverlayModel> overlays;
        overlays.reserve(static_cast<size_t>(array->size()));
        for (const auto& overlayValue : *array)
        {
            OverlayModel overlay;
            const auto result = parseOverlay(overlayValue, overlay);
            if (result.failed())
                return result;
            overlays.push_back(std::move(overlay));
        }

        const auto validity = Core::OverlayValidator::validateOverlays(overlays);
        if (validity.failed())
            return validity;

        overlaysOut = std::move(overlays);
        return juce::Result::ok();
    }

    juce::var serializeSessionState(const SessionStateModel& state)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("overlays", serializeOverlays(state.overlays));
        object->setProperty("selectedOverlayIds", serializeIdArray(state.selectedOverlayIds));
        object->setProperty("aspectRatio", aspectRatioToKey(state.aspectRatio));
        object->setProperty("playbackRate", state.playbackRate);
        object->setProperty("backgroundColor", state.backgroundColor);
        object->setProperty("durationInFrames", state.durationInFrames);
        object->setProperty("currentFrame", state.currentFrame);
        return juce::var(object.release());
    }

    juce::Result parseSessionState(const juce::var& value, SessionStateModel& stateOut)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail("editorState must be object");

        const auto& props = object->getProperties();
        SessionStateModel state;

        auto result = parseOverlays(props["overlays"], state.overlays);
        if (result.wasOk())
            result = parseIdArray(props["selectedOverlayIds"], state.selectedOverlayIds, "editorState.selectedOverlayIds");
        if (result.wasOk())
            result = parseNumberOr(props, "playbackRate", "editorState", 1.0, state.playbackRate);
        if (result.failed())
            return result;

        if (props.contains("aspectRatio"))
        {
            const auto ratio = aspectRatioFromKey(props["aspectRatio"].toString());
            if (!ratio.has_value())
                return juce::Result::fail("editorState.aspectRatio is unknown: " + props["aspectRatio"].toString());
            state.aspectRatio = *ratio;
        }

        state.backgroundColor = stringOr(props, "backgroundColor", state.backgroundColor);

        // Derived fields; tolerated when absent.
        double durationInFrames = state.durationInFrames;
        double currentFrame = 0.0;
        result = parseNumberOr(props, "durationInFrames", "editorState", durationInFrames, durationInFrames);
        if (result.wasOk())
            result = parseNumberOr(props, "currentFrame", "editorState", 0.0, currentFrame);
        if (result.failed())
            return result;

        state.durationInFrames = static_cast<FrameIndex>(durationInFrames);
        state.currentFrame = static_cast<FrameIndex>(currentFrame);

        stateOut = std::move(state);
        return juce::Result::ok();
    }

    juce::var serializeCompositionProps(const CompositionProps& props)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("overlays", serializeOverlays(props.overlays));
        object->setProperty("durationInFrames", props.durationInFrames);
        object->setProperty("width", props.width);
        object->setProperty("height", props.height);
        object->setProperty("fps", props.fps);
        object->setProperty("src", props.src);
        return juce::var(object.release());
    }

    juce::Result compositionPropsToJsonString(const CompositionProps& props, juce::String& jsonOut)
    {
        const auto validity = Core::OverlayValidator::validateComposition(props);
        if (validity.failed())
            return validity;

        jsonOut = juce::JSON::toString(serializeCompositionProps(props), false);
        return juce::Result::ok();
    }

    juce::Result serializeSessionRecordToJsonString(const SavedSessionRecord& record, juce::String& jsonOut)
    {
        if (record.projectId.trim().isEmpty())
            return juce::Result::fail("session record requires a project id");

        const auto validity = Core::OverlayValidator::validateOverlays(record.editorState.overlays);
        if (validity.failed())
            return validity;

        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("version", serializeSchemaVersion(currentSchemaVersion()));
        root->setProperty("id", record.projectId);
        root->setProperty("timestamp", record.timestampMs);
        root->setProperty("editorState", serializeSessionState(record.editorState));

        jsonOut = juce::JSON::toString(juce::var(root.release()), true);
        return juce::Result::ok();
    }

    juce::Result parseSessionRecordFromJsonString(const juce::String& json, SavedSessionRecord& recordOut)
    {
        juce::var rootVar;
        const auto parseResult = juce::JSON::parse(json, rootVar);
        if (parseResult.failed())
            return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

        const auto* rootObject = rootVar.getDynamicObject();
        if (rootObject == nullptr)
            return juce::Result::fail("Root must be object");

        const auto& rootProps = rootObject->getProperties();
        if (!rootProps.contains("id") || !rootProps.contains("editorState"))
            return juce::Result::fail("Session record requires id and editorState");

        if (rootProps.contains("version"))
        {
            const auto parsedVersion = parseSchemaVersion(rootProps["version"]);
            if (!parsedVersion.has_value())
                return juce::Result::fail("Invalid version field");

            const auto versionCheck = verifySchemaCompatibility(*parsedVersion);
            if (versionCheck.failed())
                return versionCheck;
        }

        SavedSessionRecord record;
        record.projectId = rootProps["id"].toString();
        if (isNumericVar(rootProps["timestamp"]))
            record.timestampMs = static_cast<juce::int64>(rootProps["timestamp"]);

        const auto stateResult = parseSessionState(rootProps["editorState"], record.editorState);
        if (stateResult.failed())
            return stateResult;

        recordOut = std::move(record);
        return juce::Result::ok();
    }

    juce::Result saveSessionRecordToFile(const juce::File& file, const SavedSessionRecord& record)
    {
        juce::String json;
        const auto serializeResult = serializeSessionRecordToJsonString(record, json);
        if (serializeResult.failed())
            return serializeResult;

        if (!file.replaceWithText(json))
            return juce::Result::fail("Failed to write JSON file: " + file.getFullPathName());

        return juce::Result::ok();
    }

    juce::Result loadSessionRecordFromFile(const juce::File& file, SavedSessionRecord& recordOut)
    {
        if (!file.existsAsFile())
            return juce::Result::fail("File not found: " + file.getFullPathName());

        return parseSessionRecordFromJsonString(file.loadFileAsString(), recordOut);
    }
}
