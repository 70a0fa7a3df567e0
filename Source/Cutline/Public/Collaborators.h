#pragma once

#include "Cutline/Core/Geometry.h"
#include "Cutline/Public/Types.h"
#include <optional>

namespace Cutline
{
    class PlaybackPositionProvider
    {
    public:
        virtual ~PlaybackPositionProvider() = default;

        virtual FrameIndex currentFrame() const = 0;
        virtual bool isPlaying() const = 0;
        virtual void play() = 0;
        virtual void pause() = 0;
        virtual void seekTo(FrameIndex frame) = 0;
    };

    class CanvasDimensionProvider
    {
    public:
        virtual ~CanvasDimensionProvider() = default;

        virtual CanvasSize dimensionsFor(const juce::String& aspectRatioKey) const = 0;
    };

    // Playback position without a player attached (headless sessions, tools).
    class StoppedPlaybackPosition final : public PlaybackPositionProvider
    {
    public:
        FrameIndex currentFrame() const override { return frame; }
        bool isPlaying() const override { return playing; }
        void play() override { playing = true; }
        void pause() override { playing = false; }
        void seekTo(FrameIndex newFrame) override { frame = juce::jmax(0, newFrame); }

    private:
        FrameIndex frame = 0;
        bool playing = false;
    };

    class FixedTableCanvasDimensions final : public CanvasDimensionProvider
    {
    public:
        CanvasSize dimensionsFor(const juce::String& aspectRatioKey) const override
        {
            return Geometry::canvasForAspectRatioKey(aspectRatioKey);
        }
    };

    struct MediaDescriptor
    {
        OverlayType type = OverlayType::video;
        std::optional<double> durationSeconds;
        juce::String src;
        juce::String label;
    };
}
