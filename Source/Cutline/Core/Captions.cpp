#include "Cutline/Core/Captions.h"

#include <algorithm>
#include <cmath>

namespace
{
    double roundMs(double value) noexcept
    {
        return std::floor(value + 0.5);
    }

    juce::String stripMarkup(const juce::String& text)
    {
        juce::String cleaned;
        auto insideTag = false;
        auto insideBrace = false;

        for (auto p = text.getCharPointer(); !p.isEmpty(); ++p)
        {
            const auto c = *p;
            if (!insideBrace && c == '<')
            {
                insideTag = true;
                continue;
            }
            if (insideTag)
            {
                insideTag = c != '>';
                continue;
            }
            if (c == '{')
            {
                insideBrace = true;
                continue;
            }
            if (insideBrace)
            {
                insideBrace = c != '}';
                continue;
            }

            cleaned += juce::String::charToString(c);
        }

        return cleaned.trim();
    }

    bool isSrtTimestampShape(const juce::String& text)
    {
        // HH:MM:SS,mmm
        if (text.length() != 12)
            return false;

        for (int i = 0; i < 12; ++i)
        {
            const auto c = text[i];
            if (i == 2 || i == 5)
            {
                if (c != ':')
                    return false;
            }
            else if (i == 8)
            {
                if (c != ',')
                    return false;
            }
            else if (!juce::CharacterFunctions::isDigit(c))
            {
                return false;
            }
        }

        return true;
    }

    juce::StringArray splitBlocks(const juce::String& content)
    {
        juce::StringArray lines;
        lines.addLines(content.replace("\r\n", "\n").replace("\r", "\n"));

        juce::StringArray blocks;
        juce::String current;

        for (const auto& line : lines)
        {
            if (line.trim().isEmpty())
            {
                if (current.isNotEmpty())
                    blocks.add(current);
                current.clear();
                continue;
            }

            current += (current.isEmpty() ? juce::String() : juce::String("\n")) + line.trim();
        }

        if (current.isNotEmpty())
            blocks.add(current);

        return blocks;
    }
}

namespace Cutline::Captions
{
    juce::StringArray splitWords(const juce::String& text)
    {
        juce::StringArray words;
        words.addTokens(text, " \t\r\n", "");
        words.trim();
        words.removeEmptyStrings();
        return words;
    }

    juce::String joinWords(const std::vector<CaptionWord>& words)
    {
        juce::StringArray parts;
        for (const auto& word : words)
            parts.add(word.word);

        return parts.joinIntoString(" ");
    }

    std::vector<CaptionWord> distributeWordTiming(const juce::StringArray& words,
                                                  double startMs,
                                                  double endMs,
                                                  double confidence)
    {
        std::vector<CaptionWord> timed;
        if (words.isEmpty())
            return timed;

        const auto wordDuration = (endMs - startMs) / static_cast<double>(words.size());
        timed.reserve(static_cast<size_t>(words.size()));

        for (int i = 0; i < words.size(); ++i)
        {
            CaptionWord word;
            word.word = words[i].trim();
            word.startMs = roundMs(startMs + i * wordDuration);
            word.endMs = roundMs(startMs + (i + 1) * wordDuration);
            word.confidence = confidence;
            timed.push_back(std::move(word));
        }

        return timed;
    }

    void redistributeWords(Caption& caption)
    {
        if (caption.words.empty())
            return;

        const auto wordDuration = (caption.endMs - caption.startMs) / static_cast<double>(caption.words.size());
        for (size_t i = 0; i < caption.words.size(); ++i)
        {
            caption.words[i].startMs = roundMs(caption.startMs + static_cast<double>(i) * wordDuration);
            caption.words[i].endMs = roundMs(caption.startMs + static_cast<double>(i + 1) * wordDuration);
        }
    }

    void retimeFromText(Caption& caption)
    {
        caption.words = distributeWordTiming(splitWords(caption.text),
                                             caption.startMs,
                                             caption.endMs,
                                             caption.confidence.value_or(1.0));
    }

    juce::Result validateCaptionTiming(const std::vector<Caption>& captions,
                                       size_t index,
                                       double startMs,
                                       double endMs)
    {
        if (!std::isfinite(startMs) || !std::isfinite(endMs))
            return juce::Result::fail("caption times must be finite");
        if (startMs < 0.0)
            return juce::Result::fail("caption start must not be negative");
        if (startMs >= endMs)
            return juce::Result::fail("caption start must be before its end");

        if (index > 0 && index - 1 < captions.size() && startMs < captions[index - 1].endMs)
            return juce::Result::fail("caption overlaps the previous caption");

        if (index + 1 < captions.size() && endMs > captions[index + 1].startMs)
            return juce::Result::fail("caption overlaps the next caption");

        return juce::Result::ok();
    }

    juce::Result validateCaptions(const std::vector<Caption>& captions)
    {
        for (size_t i = 0; i < captions.size(); ++i)
        {
            const auto& caption = captions[i];
            const auto timing = validateCaptionTiming(captions, i, caption.startMs, caption.endMs);
            if (timing.failed())
                return juce::Result::fail("caption " + juce::String(static_cast<int>(i)) + ": " + timing.getErrorMessage());

            // Word boundaries are rounded to whole milliseconds.
            constexpr double roundingSlackMs = 0.5;
            double previousEnd = caption.startMs - roundingSlackMs;
            for (const auto& word : caption.words)
            {
                if (word.startMs < caption.startMs - roundingSlackMs
                    || word.endMs > caption.endMs + roundingSlackMs
                    || word.startMs > word.endMs)
                    return juce::Result::fail("caption word timing must lie within its caption");
                if (word.startMs < previousEnd)
                    return juce::Result::fail("caption words must be in reading order");

                previousEnd = word.endMs;
            }
        }

        return juce::Result::ok();
    }

    SplitCaptions splitCaptions(const std::vector<Caption>& captions, double splitOffsetMs)
    {
        SplitCaptions result;

        for (const auto& caption : captions)
        {
            if (caption.startMs < splitOffsetMs)
            {
                auto head = caption;
                head.words.clear();
                for (const auto& word : caption.words)
                {
                    if (word.startMs >= splitOffsetMs)
                        continue;

                    auto kept = word;
                    kept.endMs = std::min(kept.endMs, splitOffsetMs);
                    head.words.push_back(std::move(kept));
                }

                if (!head.words.empty())
                {
                    const auto truncated = caption.endMs > splitOffsetMs;
                    head.endMs = std::min(caption.endMs, splitOffsetMs);
                    head.text = joinWords(head.words);
                    if (truncated)
                        redistributeWords(head);

                    result.first.push_back(std::move(head));
                }
            }

            if (caption.endMs > splitOffsetMs)
            {
                auto tail = caption;
                tail.words.clear();
                for (const auto& word : caption.words)
                {
                    if (word.endMs <= splitOffsetMs)
                        continue;

                    auto kept = word;
                    kept.startMs = std::max(0.0, kept.startMs - splitOffsetMs);
                    kept.endMs = kept.endMs - splitOffsetMs;
                    tail.words.push_back(std::move(kept));
                }

                if (!tail.words.empty())
                {
                    const auto truncated = caption.startMs < splitOffsetMs;
                    tail.startMs = std::max(0.0, caption.startMs - splitOffsetMs);
                    tail.endMs = caption.endMs - splitOffsetMs;
                    if (tail.timestampMs.has_value())
                        tail.timestampMs = std::max(0.0, *tail.timestampMs - splitOffsetMs);
                    tail.text = joinWords(tail.words);
                    if (truncated)
                        redistributeWords(tail);

                    result.second.push_back(std::move(tail));
                }
            }
        }

        return result;
    }

    double captionsEndMs(const std::vector<Caption>& captions) noexcept
    {
        double end = 0.0;
        for (const auto& caption : captions)
            end = std::max(end, caption.endMs);
        return end;
    }

    juce::String SrtParseResult::describeErrors() const
    {
        juce::StringArray lines;
        for (const auto& issue : errors)
        {
            if (issue.block > 0)
                lines.add("block " + juce::String(issue.block) + ": " + issue.message);
            else
                lines.add(issue.message);
        }

        return lines.joinIntoString("\n");
    }

    std::optional<double> parseSrtTimestamp(const juce::String& text)
    {
        const auto trimmed = text.trim();
        if (!isSrtTimestampShape(trimmed))
            return std::nullopt;

        const auto hours = trimmed.substring(0, 2).getIntValue();
        const auto minutes = trimmed.substring(3, 5).getIntValue();
        const auto seconds = trimmed.substring(6, 8).getIntValue();
        const auto millis = trimmed.substring(9, 12).getIntValue();

        if (minutes >= 60 || seconds >= 60)
            return std::nullopt;

        return static_cast<double>((hours * 3600 + minutes * 60 + seconds) * 1000 + millis);
    }

    SrtParseResult parseSrt(const juce::String& content)
    {
        SrtParseResult result;

        if (content.trim().isEmpty())
        {
            result.errors.push_back({ "file is empty", 0 });
            return result;
        }

        if (!content.contains("-->"))
        {
            result.errors.push_back({ "no SRT timestamps found, expected HH:MM:SS,mmm --> HH:MM:SS,mmm", 0 });
            return result;
        }

        const auto blocks = splitBlocks(content);
        for (int blockIndex = 0; blockIndex < blocks.size(); ++blockIndex)
        {
            const auto blockNumber = blockIndex + 1;

            juce::StringArray lines;
            lines.addLines(blocks[blockIndex]);

            if (!lines[0].containsOnly("0123456789"))
            {
                result.errors.push_back({ "invalid subtitle number \"" + lines[0] + "\"", blockNumber });
                continue;
            }

            if (lines.size() < 2 || !lines[1].contains("-->"))
            {
                result.errors.push_back({ "missing timing line", blockNumber });
                continue;
            }

            const auto start = parseSrtTimestamp(lines[1].upToFirstOccurrenceOf("-->", false, false));
            const auto end = parseSrtTimestamp(lines[1].fromFirstOccurrenceOf("-->", false, false));
            if (!start.has_value() || !end.has_value())
            {
                result.errors.push_back({ "invalid timing \"" + lines[1] + "\"", blockNumber });
                continue;
            }

            if (*start >= *end)
            {
                result.errors.push_back({ "start time must be before end time", blockNumber });
                continue;
            }

            if (lines.size() < 3)
            {
                result.errors.push_back({ "no subtitle text", blockNumber });
                continue;
            }

            juce::StringArray textLines;
            for (int i = 2; i < lines.size(); ++i)
                textLines.add(lines[i]);

            const auto text = stripMarkup(textLines.joinIntoString("\n"));
            if (text.isEmpty())
            {
                result.errors.push_back({ "empty subtitle text", blockNumber });
                continue;
            }

            Caption caption;
            caption.text = text;
            caption.startMs = *start;
            caption.endMs = *end;
            caption.confidence = kImportedConfidence;
            caption.words = distributeWordTiming(splitWords(text), *start, *end, kImportedConfidence);
            result.captions.push_back(std::move(caption));
        }

        std::stable_sort(result.captions.begin(),
                         result.captions.end(),
                         [](const Caption& lhs, const Caption& rhs)
                         {
                             return lhs.startMs < rhs.startMs;
                         });

        for (size_t i = 1; i < result.captions.size(); ++i)
        {
            if (result.captions[i - 1].endMs > result.captions[i].startMs)
            {
                result.errors.push_back({ "subtitles " + juce::String(static_cast<int>(i))
                                              + " and " + juce::String(static_cast<int>(i + 1)) + " overlap",
                                          0 });
            }
        }

        return result;
    }

    std::vector<Caption> generateFromText(const juce::String& text,
                                          double wordsPerMinute,
                                          double sentenceGapMs)
    {
        std::vector<Caption> captions;
        if (wordsPerMinute <= 0.0)
            return captions;

        juce::StringArray sentences;
        sentences.addTokens(text, ".!?", "");
        sentences.trim();
        sentences.removeEmptyStrings();

        const auto msPerWord = 60000.0 / wordsPerMinute;
        double cursor = 0.0;

        for (const auto& sentence : sentences)
        {
            const auto words = splitWords(sentence);
            if (words.isEmpty())
                continue;

            Caption caption;
            caption.text = sentence;
            caption.startMs = cursor;
            caption.endMs = cursor + words.size() * msPerWord;
            caption.confidence = kGeneratedConfidence;
            caption.words = distributeWordTiming(words, caption.startMs, caption.endMs, kGeneratedConfidence);

            cursor = caption.endMs + sentenceGapMs;
            captions.push_back(std::move(caption));
        }

        return captions;
    }
}
