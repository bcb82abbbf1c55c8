//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/scan/CommentScanner.hpp
// Purpose: Quote-aware classification of '#' and '//' line comments.
// Key invariants: Concatenating scanSpans(text) in order reproduces text exactly;
//                 comment markers inside a closed quote pair are never comments.
// Ownership/Lifetime: Returned spans reference the caller's text by offset.
// Links: src/scan/Span.hpp, include/jstrip/scan/Cursor.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "scan/Span.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jstrip::scan
{

/// @brief True for the characters that end a comment or an open quote.
[[nodiscard]] constexpr bool isLineTerminator(char ch) noexcept
{
    return ch == '\n' || ch == '\r';
}

/// @brief Split @p text into plain, literal and comment spans.
///
/// A single left-to-right pass.  At each position, in priority order:
/// a '"' or '\'' whose partner occurs later on the same line opens a literal
/// that closes at that first partner; '#' or '//' opens a comment that runs to
/// the next line terminator; anything else extends the current plain span.
/// A quote without a partner on its line is plain text.
[[nodiscard]] std::vector<Span> scanSpans(std::string_view text);

/// @brief Concatenate the non-comment spans of @p text.
/// @details The ' ' characters bracketing each dropped comment are removed as
///          well: trailing spaces before it and leading spaces after it.  Tabs
///          and every other space in the text are kept.
[[nodiscard]] std::string joinRetained(std::string_view text, const std::vector<Span> &spans);

/// @brief Remove every comment span from @p text.
[[nodiscard]] std::string stripLineComments(std::string_view text);

/// @brief True when the first non-whitespace characters of @p line are '#' or '//'.
/// @details Cheaper than scanning; used to drop whole comment lines before
///          any span classification happens.
[[nodiscard]] bool isWholeLineComment(std::string_view line) noexcept;

} // namespace jstrip::scan
