#include "Cutline/Session/MediaDrop.h"

#include "Cutline/Core/Captions.h"
#include "Cutline/Core/Geometry.h"
#include <cmath>

namespace
{
    juce::var makeAnimation()
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("enter", "none");
        object->setProperty("exit", "none");
        return juce::var(object.release());
    }

    Cutline::PropertyBag visualMediaStyles()
    {
        Cutline::PropertyBag styles;
        styles.set(Cutline::StyleKeys::opacity, 1.0);
        styles.set(Cutline::StyleKeys::zIndex, 100);
        styles.set("transform", "none");
        styles.set("objectFit", "contain");
        styles.set(Cutline::StyleKeys::animation, makeAnimation());
        return styles;
    }

    juce::var makeHighlightStyle()
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("backgroundColor", "#3b82f6");
        object->setProperty("color", "#FFFFFF");
        object->setProperty("scale", 1.1);
        object->setProperty("fontWeight", 800);
        object->setProperty("padding", "4px 8px");
        return juce::var(object.release());
    }

    Cutline::PropertyBag captionStyles()
    {
        Cutline::PropertyBag styles;
        styles.set("fontFamily", "Outfit");
        styles.set("fontSize", "36px");
        styles.set("lineHeight", 1.3);
        styles.set("textAlign", "center");
        styles.set("color", "#FFFFFF");
        styles.set("fontWeight", 600);
        styles.set("textShadow", "1px 1px 4px rgba(0,0,0,0.5)");
        styles.set("highlightStyle", makeHighlightStyle());
        return styles;
    }

    double durationOr(const Cutline::MediaDescriptor& media, double fallback)
    {
        if (media.durationSeconds.has_value() && std::isfinite(*media.durationSeconds) && *media.durationSeconds > 0.0)
            return *media.durationSeconds;
        return fallback;
    }
}

namespace Cutline::MediaDrop
{
    juce::Result createOverlay(const MediaDescriptor& media,
                               int row,
                               FrameIndex startFrame,
                               CanvasSize canvas,
                               int fps,
                               OverlayModel& overlayOut)
    {
        if (row < 0)
            return juce::Result::fail("media drop row must be >= 0");
        if (startFrame < 0)
            return juce::Result::fail("media drop frame must be >= 0");
        if (fps < 1)
            return juce::Result::fail("media drop fps must be >= 1");

        OverlayModel overlay;
        overlay.from = startFrame;
        overlay.row = row;
        overlay.rotation = 0.0;

        switch (media.type)
        {
            case OverlayType::video:
            {
                const auto seconds = durationOr(media, kDefaultClipSeconds);
                overlay.durationInFrames = Geometry::secondsToFrames(seconds, fps);
                overlay.bounds = { 0, 0, canvas.width, canvas.height };
                overlay.styles = visualMediaStyles();

                VideoContent video;
                video.src = media.src;
                video.content = media.label;
                video.mediaSrcDuration = seconds;
                overlay.payload = std::move(video);
                break;
            }

            case OverlayType::image:
                overlay.durationInFrames = kDefaultImageFrames;
                overlay.bounds = { 0, 0, canvas.width, canvas.height };
                overlay.styles = visualMediaStyles();
                overlay.payload = ImageContent { media.src, media.src };
                break;

            case OverlayType::sound:
            {
                const auto seconds = durationOr(media, kDefaultClipSeconds);
                overlay.durationInFrames = Geometry::secondsToFrames(seconds, fps);
                overlay.bounds = { 0, 0, 1920, 100 };
                overlay.styles.set(StyleKeys::opacity, 1.0);

                SoundContent sound;
                sound.src = media.src;
                sound.content = media.label.isNotEmpty() ? media.label : juce::String("Audio");
                sound.mediaSrcDuration = seconds;
                overlay.payload = std::move(sound);
                break;
            }

            case OverlayType::text:
                overlay.durationInFrames = Geometry::secondsToFrames(durationOr(media, kDefaultTextSeconds), fps);
                overlay.bounds = { 100, 100, 500, 180 };
                overlay.styles.set(StyleKeys::opacity, 1.0);
                overlay.styles.set(StyleKeys::zIndex, 1);
                overlay.styles.set("transform", "none");
                overlay.styles.set("fontSizeScale", 1.0);
                overlay.payload = TextContent { media.label.isNotEmpty() ? media.label : media.src };
                break;

            case OverlayType::shape:
            case OverlayType::caption:
            case OverlayType::sticker:
                return juce::Result::fail("media drop does not support " + overlayTypeToKey(media.type) + " items");
        }

        overlay.durationInFrames = juce::jmax(1, overlay.durationInFrames);
        overlayOut = std::move(overlay);
        return juce::Result::ok();
    }

    juce::Result createCaptionOverlay(std::vector<Caption> captions,
                                      int row,
                                      FrameIndex startFrame,
                                      CanvasSize canvas,
                                      int fps,
                                      OverlayModel& overlayOut)
    {
        if (captions.empty())
            return juce::Result::fail("caption overlay needs at least one caption");
        if (row < 0 || startFrame < 0 || fps < 1)
            return juce::Result::fail("caption overlay placement is invalid");

        const auto timing = Captions::validateCaptions(captions);
        if (timing.failed())
            return timing;

        const auto endSeconds = Captions::captionsEndMs(captions) / 1000.0;

        OverlayModel overlay;
        overlay.from = startFrame;
        overlay.row = row;
        overlay.durationInFrames = juce::jmax(1, static_cast<FrameIndex>(std::ceil(endSeconds * fps)));

        // Lower band, proportioned like 1520/300 on a 1920-high portrait canvas.
        const auto top = static_cast<int>(std::floor(canvas.height * 1520.0 / 1920.0 + 0.5));
        const auto height = static_cast<int>(std::floor(canvas.height * 300.0 / 1920.0 + 0.5));
        overlay.bounds = { 0, top, canvas.width, height };
        overlay.styles = captionStyles();

        CaptionContent content;
        content.captions = std::move(captions);
        overlay.payload = std::move(content);

        overlayOut = std::move(overlay);
        return juce::Result::ok();
    }
}
