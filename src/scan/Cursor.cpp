//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/scan/Cursor.cpp
// Purpose: Provide out-of-line helpers for the scan::Cursor utility.
// Key invariants: Position tracking stays consistent with the byte offset.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: include/jstrip/scan/Cursor.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the character cursor used by the comment scanner.

#include "jstrip/scan/Cursor.hpp"

namespace jstrip::scan
{

/// @brief Construct a cursor over the provided source buffer.
/// @param text Source text to traverse.
Cursor::Cursor(std::string_view text) noexcept : text_(text), index_(0), pos_()
{
}

/// @brief Inspect the current character without advancing.
/// @return Character at the current cursor position or '\0' at end.
char Cursor::peek() const noexcept
{
    return atEnd() ? '\0' : text_[index_];
}

/// @brief Inspect a character ahead of the cursor without advancing.
/// @param ahead Distance from the current position; 0 behaves like peek().
char Cursor::peek(std::size_t ahead) const noexcept
{
    const std::size_t idx = index_ + ahead;
    return idx < text_.size() ? text_[idx] : '\0';
}

/// @brief Update the tracked source position after consuming @p ch.
/// @details Handles newlines by incrementing the line counter and resetting the
///          column; other characters simply increment the column.
void Cursor::applyAdvance(char ch) noexcept
{
    if (ch == '\n')
    {
        ++pos_.line;
        pos_.column = 0;
    }
    else
    {
        ++pos_.column;
    }
}

/// @brief Consume the current character and update the position.
/// @details Safely returns when already at end-of-input.
void Cursor::advance() noexcept
{
    if (atEnd())
        return;
    const char ch = text_[index_++];
    applyAdvance(ch);
}

/// @brief Move the cursor forward to @p offset within the source buffer.
/// @details Every skipped character goes through advance() so the line/column
///          position stays exact.  Offsets at or before the cursor are ignored;
///          offsets past the end clamp to the end.
/// @param offset Zero-based index into the source buffer.
void Cursor::seek(std::size_t offset) noexcept
{
    if (offset > text_.size())
        offset = text_.size();
    while (index_ < offset)
        advance();
}

} // namespace jstrip::scan
