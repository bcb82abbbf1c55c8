//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jstrip/scan/Cursor.hpp
// Purpose: Declare a lightweight text cursor for the comment scanner.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller; no allocations.
// Links: src/scan/CommentScanner.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the character cursor the comment scanner walks text with.
/// @details The cursor tracks a byte offset and a line/column position and
///          exposes the handful of consumption helpers the scanner needs:
///          lookahead, predicate runs and forward seeking.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace jstrip::scan
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Represents a line/column pair within a textual buffer.
struct SourcePos
{
    unsigned line = 1;      ///< 1-based line number.
    std::size_t column = 0; ///< 0-based column offset within the current line.
};

/// @brief Lightweight cursor for scanning JSON-like text.
class Cursor
{
  public:
    /// @brief Construct a cursor at the first character of @p text.
    explicit Cursor(std::string_view text) noexcept;

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Inspect the current character without consuming it.
    [[nodiscard]] char peek() const noexcept;

    /// @brief Inspect the character @p ahead positions past the cursor.
    /// @return The character, or '\0' beyond the end of the buffer.
    [[nodiscard]] char peek(std::size_t ahead) const noexcept;

    /// @brief Report the current line/column location.
    [[nodiscard]] SourcePos pos() const noexcept
    {
        return pos_;
    }

    /// @brief Retrieve the absolute byte offset within the buffer.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            advance();
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Advance by a single character if not already at end.
    void advance() noexcept;

    /// @brief Advance to @p offset within the buffer; never moves backwards.
    void seek(std::size_t offset) noexcept;

  private:
    void applyAdvance(char ch) noexcept;

    std::string_view text_;
    std::size_t index_ = 0;
    SourcePos pos_{};
};

} // namespace jstrip::scan
