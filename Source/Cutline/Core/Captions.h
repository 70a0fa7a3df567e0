#pragma once

#include "Cutline/Public/Types.h"
#include <optional>
#include <vector>

namespace Cutline::Captions
{
    constexpr double kImportedConfidence = 0.95;
    constexpr double kGeneratedConfidence = 0.99;

    juce::StringArray splitWords(const juce::String& text);
    juce::String joinWords(const std::vector<CaptionWord>& words);

    // Evenly spreads the words across [startMs, endMs); each boundary is rounded half up.
    std::vector<CaptionWord> distributeWordTiming(const juce::StringArray& words,
                                                  double startMs,
                                                  double endMs,
                                                  double confidence = kImportedConfidence);

    // Re-times the existing words in place, keeping their text and confidence.
    void redistributeWords(Caption& caption);

    // Rebuilds the words from caption.text, then re-times them.
    void retimeFromText(Caption& caption);

    // start < end and no overlap with the neighbouring captions.
    juce::Result validateCaptionTiming(const std::vector<Caption>& captions,
                                       size_t index,
                                       double startMs,
                                       double endMs);

    juce::Result validateCaptions(const std::vector<Caption>& captions);

    struct SplitCaptions
    {
        std::vector<Caption> first;
        std::vector<Caption> second;
    };

    // splitOffsetMs is relative to the overlay start.
    SplitCaptions splitCaptions(const std::vector<Caption>& captions, double splitOffsetMs);

    double captionsEndMs(const std::vector<Caption>& captions) noexcept;

    struct SrtIssue
    {
        juce::String message;
        int block = 0;                        // 1-based, 0 when not tied to a block
    };

    struct SrtParseResult
    {
        std::vector<Caption> captions;
        std::vector<SrtIssue> errors;

        bool succeeded() const noexcept
        {
            return !captions.empty() && errors.empty();
        }

        juce::String describeErrors() const;
    };

    std::optional<double> parseSrtTimestamp(const juce::String& text);
    SrtParseResult parseSrt(const juce::String& content);

    std::vector<Caption> generateFromText(const juce::String& text,
                                          double wordsPerMinute = 160.0,
                                          double sentenceGapMs = 500.0);
}
