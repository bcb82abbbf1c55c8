//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/scan/Span.hpp
// Purpose: Classified slice of scanned text.
// Key invariants: Spans produced for one input partition it without gaps or overlaps.
// Ownership/Lifetime: Spans store offsets only; text() views caller-owned storage.
// Links: src/scan/CommentScanner.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jstrip/scan/Cursor.hpp"

#include <cstddef>
#include <string_view>

namespace jstrip::scan
{

/// @brief Classification of a span.
enum class SpanKind
{
    Plain,   ///< Ordinary JSON syntax, whitespace and unterminated quotes.
    Literal, ///< Quoted string token, delimiters included; opaque to comment detection.
    Comment  ///< '#' or '//' marker plus the rest of its line, terminator excluded.
};

/// @brief Contiguous run of scanned text with its classification.
struct Span
{
    SpanKind kind = SpanKind::Plain;
    std::size_t offset = 0; ///< Byte offset of the first character.
    std::size_t length = 0; ///< Number of bytes covered.
    SourcePos start{};      ///< Line/column of the first character.

    /// @brief One-past-the-end byte offset.
    [[nodiscard]] std::size_t end() const noexcept
    {
        return offset + length;
    }

    /// @brief View this span inside the text it was scanned from.
    [[nodiscard]] std::string_view text(std::string_view source) const noexcept
    {
        return source.substr(offset, length);
    }
};

/// @brief Human-readable name of @p kind.
[[nodiscard]] constexpr std::string_view toString(SpanKind kind) noexcept
{
    switch (kind)
    {
        case SpanKind::Plain:
            return "plain";
        case SpanKind::Literal:
            return "literal";
        case SpanKind::Comment:
            return "comment";
    }
    return "";
}

} // namespace jstrip::scan
