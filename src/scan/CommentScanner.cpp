//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/scan/CommentScanner.cpp
// Purpose: Implements quote-aware line comment classification and removal.
// Key invariants: Spans partition the input; literal contents pass through untouched.
// Ownership/Lifetime: Stateless; operates on caller-owned text.
// Links: src/scan/CommentScanner.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Comment scanner shared by the buffer cleaner and the line reader.
/// @details Both cleaners must agree on what a comment is, so the whole rule
///          lives here.  Quote matching is per literal: a literal closes at the
///          first matching quote on its line, which keeps comment markers
///          between two literals on the same line classified as comments.

#include "scan/CommentScanner.hpp"

namespace jstrip::scan
{
namespace
{

/// @brief Find the quote closing the literal opened at @p open.
/// @return Offset of the closing quote, or npos when the line ends first.
std::size_t findClosingQuote(std::string_view text, std::size_t open) noexcept
{
    const char quote = text[open];
    for (std::size_t i = open + 1; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == quote)
            return i;
        if (isLineTerminator(ch))
            break;
    }
    return std::string_view::npos;
}

[[nodiscard]] bool startsComment(const Cursor &cur) noexcept
{
    const char ch = cur.peek();
    return ch == '#' || (ch == '/' && cur.peek(1) == '/');
}

} // namespace

/// @brief Classify @p text in one forward pass.
/// @details Plain text accumulates until a literal or comment starts; each
///          span records the cursor position where it began.
std::vector<Span> scanSpans(std::string_view text)
{
    std::vector<Span> spans;
    Cursor cur(text);

    std::size_t plainBegin = 0;
    SourcePos plainPos = cur.pos();

    auto flushPlain = [&](std::size_t end)
    {
        if (end > plainBegin)
            spans.push_back(Span{SpanKind::Plain, plainBegin, end - plainBegin, plainPos});
    };
    auto restartPlain = [&]
    {
        plainBegin = cur.offset();
        plainPos = cur.pos();
    };

    while (!cur.atEnd())
    {
        const std::size_t here = cur.offset();
        const SourcePos herePos = cur.pos();
        const char ch = cur.peek();

        if (ch == '"' || ch == '\'')
        {
            const std::size_t close = findClosingQuote(text, here);
            if (close == std::string_view::npos)
            {
                // Unpaired quote: plain text, keep scanning after it.
                cur.advance();
                continue;
            }
            flushPlain(here);
            cur.seek(close + 1);
            spans.push_back(Span{SpanKind::Literal, here, close + 1 - here, herePos});
            restartPlain();
            continue;
        }

        if (startsComment(cur))
        {
            flushPlain(here);
            cur.consumeWhile([](char c) { return !isLineTerminator(c); });
            spans.push_back(Span{SpanKind::Comment, here, cur.offset() - here, herePos});
            restartPlain();
            continue;
        }

        cur.advance();
    }

    flushPlain(text.size());
    return spans;
}

/// @brief Rebuild the text without its comment spans.
/// @details Spaces touching a dropped comment on either side go with it.
std::string joinRetained(std::string_view text, const std::vector<Span> &spans)
{
    std::string out;
    out.reserve(text.size());
    bool afterComment = false;
    for (const Span &span : spans)
    {
        if (span.kind == SpanKind::Comment)
        {
            // Literals end in a quote, so this only eats plain spacing.
            while (!out.empty() && out.back() == ' ')
                out.pop_back();
            afterComment = true;
            continue;
        }

        std::string_view piece = span.text(text);
        if (afterComment)
        {
            const std::size_t first = piece.find_first_not_of(' ');
            piece.remove_prefix(first == std::string_view::npos ? piece.size() : first);
            afterComment = false;
        }
        out.append(piece);
    }
    return out;
}

/// @brief Scan and join in one call.
std::string stripLineComments(std::string_view text)
{
    return joinRetained(text, scanSpans(text));
}

/// @brief Skip leading blanks and test for a comment marker.
bool isWholeLineComment(std::string_view line) noexcept
{
    Cursor cur(line);
    cur.consumeWhile([](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; });
    return startsComment(cur);
}

} // namespace jstrip::scan
