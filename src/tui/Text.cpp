// SPDX-License-Identifier: Apache-2.0
#include <libunicode/convert.h>
#include <libunicode/utf8_grapheme_segmenter.h>
#include <libunicode/width.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <tui/Text.hpp>

namespace llmtui::tui
{

namespace
{
    constexpr auto Ellipsis = std::string_view { "…" };
    constexpr auto ReplacementCharacter = std::string_view { "\xEF\xBF\xBD" };
    constexpr auto TabWidth = 4;
    constexpr auto EmojiPresentation = U'\uFE0F';

    struct Cluster
    {
        std::size_t offset;
        int width;
    };

    auto clusterWidth(std::string_view bytes) -> int
    {
        auto const codepoints = unicode::convert_to<char32_t>(bytes);
        if (codepoints.empty())
            return 0;
        if (codepoints.find(EmojiPresentation) != std::u32string::npos)
            return 2;
        return std::max(0, unicode::width(codepoints.front()));
    }

    /// Splits @p text into grapheme clusters with their byte offset and cell width.
    auto clusters(std::string_view text) -> std::vector<Cluster>
    {
        auto result = std::vector<Cluster> {};
        auto segmenter = unicode::utf8_grapheme_segmenter(text);
        for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
            result.push_back(Cluster { static_cast<std::size_t>(it._clusterStart - text.data()), 0 });

        for (auto i = std::size_t { 0 }; i < result.size(); ++i)
        {
            auto const end = i + 1 < result.size() ? result[i + 1].offset : text.size();
            result[i].width = clusterWidth(text.substr(result[i].offset, end - result[i].offset));
        }
        return result;
    }

    /// Returns the byte length of the longest cluster prefix that fits in @p cells.
    auto prefixBytes(std::string_view text, int cells) -> std::size_t
    {
        auto used = 0;
        for (auto const& cluster: clusters(text))
        {
            if (used + cluster.width > cells)
                return cluster.offset;
            used += cluster.width;
        }
        return text.size();
    }

    /// Returns the byte length of the first cluster of @p text.
    auto firstClusterBytes(std::string_view text) -> std::size_t
    {
        auto const all = clusters(text);
        return all.size() > 1 ? all[1].offset : text.size();
    }

    auto isC1Control(std::string_view text, std::size_t pos) -> bool
    {
        return static_cast<unsigned char>(text[pos]) == 0xC2 && pos + 1 < text.size()
               && static_cast<unsigned char>(text[pos + 1]) >= 0x80
               && static_cast<unsigned char>(text[pos + 1]) <= 0x9F;
    }

    void wrapParagraph(std::string_view paragraph, int width, std::vector<std::string>& lines)
    {
        auto line = std::string {};
        auto lineWidth = 0;

        auto const flush = [&]() {
            lines.push_back(std::move(line));
            line.clear();
            lineWidth = 0;
        };

        auto pos = std::size_t { 0 };
        while (pos < paragraph.size())
        {
            auto const start = paragraph.find_first_not_of(' ', pos);
            if (start == std::string_view::npos)
                break;
            auto const end = std::min(paragraph.find(' ', start), paragraph.size());
            auto word = paragraph.substr(start, end - start);
            pos = end;

            auto wordWidth = displayWidth(word);
            if (lineWidth > 0 && lineWidth + 1 + wordWidth > width)
                flush();

            while (wordWidth > width)
            {
                auto cut = prefixBytes(word, width - lineWidth);
                if (cut == 0)
                    cut = firstClusterBytes(word);
                line.append(word.substr(0, cut));
                flush();
                word.remove_prefix(cut);
                wordWidth = displayWidth(word);
            }

            if (lineWidth > 0)
            {
                line += ' ';
                ++lineWidth;
            }
            line.append(word);
            lineWidth += wordWidth;
        }
        lines.push_back(std::move(line));
    }
} // namespace

auto hasControlCharacters(std::string_view text) -> bool
{
    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        auto const ch = static_cast<unsigned char>(text[i]);
        if (ch < 0x20 || ch == 0x7F || isC1Control(text, i))
            return true;
    }
    return false;
}

auto sanitize(std::string_view text, bool keepNewlines) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());
    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        auto const ch = static_cast<unsigned char>(text[i]);
        if (ch == '\n' && keepNewlines)
            result += '\n';
        else if (ch == '\r' && keepNewlines && i + 1 < text.size() && text[i + 1] == '\n')
            continue;
        else if (ch == '\t')
            result.append(static_cast<std::size_t>(TabWidth), ' ');
        else if (ch < 0x20 || ch == 0x7F)
            result += ReplacementCharacter;
        else if (isC1Control(text, i))
        {
            result += ReplacementCharacter;
            ++i;
        }
        else
            result += static_cast<char>(ch);
    }
    return result;
}

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;
    for (auto const& cluster: clusters(text))
        width += cluster.width;
    return width;
}

auto truncate(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return {};

    auto const clean = sanitize(text);
    if (displayWidth(clean) <= width)
        return clean;

    auto result = clean.substr(0, prefixBytes(clean, width - 1));
    result += Ellipsis;
    return result;
}

auto dropColumns(std::string_view text, int cells) -> std::string_view
{
    auto used = 0;
    for (auto const& cluster: clusters(text))
    {
        if (used >= cells)
            return text.substr(cluster.offset);
        used += cluster.width;
    }
    return {};
}

auto fitWidth(std::string_view text, int width) -> std::string
{
    auto result = truncate(text, width);
    auto const used = displayWidth(result);
    if (used < width)
        result.append(static_cast<std::size_t>(width - used), ' ');
    return result;
}

auto wordWrap(std::string_view text, int width) -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};
    if (width <= 0)
        return lines;

    auto const clean = sanitize(text, true);
    auto const view = std::string_view { clean };
    auto pos = std::size_t { 0 };
    while (true)
    {
        auto const newline = view.find('\n', pos);
        auto const paragraph =
            view.substr(pos, newline == std::string_view::npos ? std::string_view::npos : newline - pos);
        wrapParagraph(paragraph, width, lines);
        if (newline == std::string_view::npos)
            break;
        pos = newline + 1;
    }
    return lines;
}

} // namespace llmtui::tui
