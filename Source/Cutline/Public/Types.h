#pragma once

#include <juce_core/juce_core.h>
#include <cstdint>
#include <limits>
#include <optional>
#include <variant>
#include <vector>

namespace Cutline
{
    using OverlayId = std::int64_t;
    using FrameIndex = int;
    using PropertyBag = juce::NamedValueSet;

    constexpr int kDefaultFps = 30;
    constexpr OverlayId kFirstOverlayId = 0;
    constexpr FrameIndex kMaxFrame = std::numeric_limits<FrameIndex>::max();

    // [from, from + duration) must end at or before kMaxFrame.
    inline bool frameRangeFits(FrameIndex from, FrameIndex duration) noexcept
    {
        return from >= 0 && duration >= 0 && duration <= kMaxFrame - from;
    }

    enum class OverlayType
    {
        text,
        image,
        shape,
        video,
        sound,
        caption,
        sticker
    };

    enum class AspectRatio
    {
        widescreen,     // 16:9
        square,         // 1:1
        portraitMedium, // 4:5
        portraitLong    // 9:16
    };

    struct CanvasSize
    {
        int width = 0;
        int height = 0;

        bool operator==(const CanvasSize& other) const noexcept
        {
            return width == other.width && height == other.height;
        }

        bool operator!=(const CanvasSize& other) const noexcept
        {
            return !(*this == other);
        }
    };

    struct CropRect
    {
        double x = 0.0;
        double y = 0.0;
        double width = 100.0;
        double height = 100.0;

        bool isDefault() const noexcept
        {
            return x == 0.0 && y == 0.0 && width == 100.0 && height == 100.0;
        }
    };

    struct CaptionWord
    {
        juce::String word;
        double startMs = 0.0;
        double endMs = 0.0;
        double confidence = 1.0;
    };

    struct Caption
    {
        juce::String text;
        double startMs = 0.0;
        double endMs = 0.0;
        std::optional<double> timestampMs;
        std::optional<double> confidence;
        std::vector<CaptionWord> words;
    };

    // Cached peaks for drawing the timeline waveform without decoding the source.
    struct WaveformData
    {
        std::vector<float> peaks;
        int length = 0;
    };

    struct TextContent
    {
        juce::String content;
    };

    struct ImageContent
    {
        juce::String src;
        juce::String content;
    };

    struct ShapeContent
    {
        juce::String content;
    };

    struct VideoContent
    {
        juce::String src;
        juce::String content;
        double videoStartTime = 0.0;           // seconds into the source
        double speed = 1.0;
        std::optional<double> mediaSrcDuration; // seconds
    };

    struct SoundContent
    {
        juce::String src;
        juce::String content;
        double startFromSound = 0.0;           // seconds into the source
        std::optional<double> mediaSrcDuration;
        std::optional<WaveformData> waveform;
    };

    struct CaptionContent
    {
        std::vector<Caption> captions;         // times relative to the overlay start
        juce::String templateKey;
    };

    struct StickerContent
    {
        juce::String content;
        juce::String category;
    };

    // Alternative order must follow OverlayType.
    using OverlayPayload = std::variant<TextContent,
                                        ImageContent,
                                        ShapeContent,
                                        VideoContent,
                                        SoundContent,
                                        CaptionContent,
                                        StickerContent>;

    struct OverlayModel
    {
        OverlayId id = kFirstOverlayId;
        FrameIndex from = 0;
        FrameIndex durationInFrames = 1;
        int row = 0;
        juce::Rectangle<int> bounds;
        double rotation = 0.0;
        PropertyBag styles;
        OverlayPayload payload;

        OverlayType type() const noexcept
        {
            return static_cast<OverlayType>(payload.index());
        }

        FrameIndex endFrame() const noexcept
        {
            return from + durationInFrames;
        }
    };

    struct SchemaVersion
    {
        int major = 1;
        int minor = 0;
        int patch = 0;
    };

    inline SchemaVersion currentSchemaVersion() noexcept
    {
        return {};
    }

    inline int compareSchemaVersion(const SchemaVersion& lhs, const SchemaVersion& rhs) noexcept
    {
        if (lhs.major != rhs.major)
            return lhs.major < rhs.major ? -1 : 1;
        if (lhs.minor != rhs.minor)
            return lhs.minor < rhs.minor ? -1 : 1;
        if (lhs.patch != rhs.patch)
            return lhs.patch < rhs.patch ? -1 : 1;
        return 0;
    }

    struct TimelineModel
    {
        SchemaVersion schemaVersion = currentSchemaVersion();
        std::vector<OverlayModel> overlays;
    };

    // Input handed to the renderer for one composition.
    struct CompositionProps
    {
        std::vector<OverlayModel> overlays;
        FrameIndex durationInFrames = 0;
        int width = 0;
        int height = 0;
        int fps = kDefaultFps;
        juce::String src;
    };

    struct EditorStateModel
    {
        // Canonical multi-selection. The primary selection is the first entry.
        std::vector<OverlayId> selection;

        std::optional<OverlayId> primarySelection() const noexcept
        {
            if (selection.empty())
                return std::nullopt;
            return selection.front();
        }
    };

    // Everything autosave writes for one editing session.
    struct SessionStateModel
    {
        std::vector<OverlayModel> overlays;
        std::vector<OverlayId> selectedOverlayIds;
        AspectRatio aspectRatio = AspectRatio::widescreen;
        double playbackRate = 1.0;
        juce::String backgroundColor { "white" };
        FrameIndex durationInFrames = kDefaultFps;
        FrameIndex currentFrame = 0;
    };

    struct SavedSessionRecord
    {
        juce::String projectId;
        juce::int64 timestampMs = 0;
        SessionStateModel editorState;
    };

    inline juce::String overlayTypeToKey(OverlayType type)
    {
        switch (type)
        {
            case OverlayType::text: return "text";
            case OverlayType::image: return "image";
            case OverlayType::shape: return "shape";
            case OverlayType::video: return "video";
            case OverlayType::sound: return "sound";
            case OverlayType::caption: return "caption";
            case OverlayType::sticker: return "sticker";
        }

        return {};
    }

    inline std::optional<OverlayType> overlayTypeFromKey(const juce::String& key)
    {
        const auto normalized = key.trim().toLowerCase();
        if (normalized == "text") return OverlayType::text;
        if (normalized == "image") return OverlayType::image;
        if (normalized == "shape") return OverlayType::shape;
        if (normalized == "video") return OverlayType::video;
        if (normalized == "sound") return OverlayType::sound;
        if (normalized == "caption") return OverlayType::caption;
        if (normalized == "sticker") return OverlayType::sticker;
        return std::nullopt;
    }

    inline juce::String aspectRatioToKey(AspectRatio ratio)
    {
        switch (ratio)
        {
            case AspectRatio::widescreen: return "16:9";
            case AspectRatio::square: return "1:1";
            case AspectRatio::portraitMedium: return "4:5";
            case AspectRatio::portraitLong: return "9:16";
        }

        return {};
    }

    inline std::optional<AspectRatio> aspectRatioFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "16:9") return AspectRatio::widescreen;
        if (normalized == "1:1") return AspectRatio::square;
        if (normalized == "4:5") return AspectRatio::portraitMedium;
        if (normalized == "9:16") return AspectRatio::portraitLong;
        return std::nullopt;
    }

    inline bool isNumericVar(const juce::var& value) noexcept
    {
        return value.isInt() || value.isInt64() || value.isDouble();
    }

    inline bool isScalarVar(const juce::var& value) noexcept
    {
        return value.isBool() || isNumericVar(value) || value.isString();
    }

    inline bool isFlatObjectVar(const juce::var& value) noexcept
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return false;

        const auto& props = object->getProperties();
        for (int i = 0; i < props.size(); ++i)
        {
            if (!isScalarVar(props.getValueAt(i)))
                return false;
        }

        return true;
    }

    namespace StyleKeys
    {
        inline const juce::Identifier opacity { "opacity" };
        inline const juce::Identifier zIndex { "zIndex" };
        inline const juce::Identifier volume { "volume" };
        inline const juce::Identifier fadeIn { "fadeIn" };
        inline const juce::Identifier fadeOut { "fadeOut" };
        inline const juce::Identifier animation { "animation" };
        inline const juce::Identifier cropEnabled { "cropEnabled" };
        inline const juce::Identifier cropX { "cropX" };
        inline const juce::Identifier cropY { "cropY" };
        inline const juce::Identifier cropWidth { "cropWidth" };
        inline const juce::Identifier cropHeight { "cropHeight" };
        inline const juce::Identifier clipPath { "clipPath" };
    }

    inline bool isCropStyleKey(const juce::Identifier& key) noexcept
    {
        return key == StyleKeys::cropX
            || key == StyleKeys::cropY
            || key == StyleKeys::cropWidth
            || key == StyleKeys::cropHeight;
    }
}
