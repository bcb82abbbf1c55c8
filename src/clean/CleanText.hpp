//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/clean/CleanText.hpp
// Purpose: Whole-buffer comment removal exposed as an immutable text value.
// Key invariants: Content is cleaned exactly once, at construction, and never mutated.
// Ownership/Lifetime: CleanText owns its characters; views it hands out live as long as it does.
// Links: src/scan/CommentScanner.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace jstrip::clean
{

/// @brief Remove every '#' and '//' comment from @p raw.
/// @details Scans the whole buffer once.  Never fails: malformed or already
///          clean input passes through with zero or more spans removed.
[[nodiscard]] std::string stripComments(std::string_view raw);

/// @brief Immutable text whose content has had its comments removed.
///
/// Behaves like a read-only std::string: indexing, slicing, searching,
/// iteration, comparison and concatenation are all available.  Concatenation
/// yields a plain std::string and is not cleaned again.
class CleanText
{
  public:
    using size_type = std::string::size_type;
    using const_iterator = std::string::const_iterator;

    static constexpr size_type npos = std::string::npos;

    /// @brief Empty text.
    CleanText() = default;

    /// @brief Clean @p raw and keep the result.
    explicit CleanText(std::string_view raw);

    /// @brief Adopt @p text that is already free of comments without rescanning.
    [[nodiscard]] static CleanText fromCleaned(std::string text);

    [[nodiscard]] const std::string &str() const noexcept
    {
        return text_;
    }

    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    operator std::string_view() const noexcept
    {
        return text_;
    }

    [[nodiscard]] const char *c_str() const noexcept
    {
        return text_.c_str();
    }

    [[nodiscard]] size_type size() const noexcept
    {
        return text_.size();
    }

    [[nodiscard]] size_type length() const noexcept
    {
        return text_.length();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return text_.empty();
    }

    char operator[](size_type pos) const
    {
        return text_[pos];
    }

    /// @brief Bounds-checked access; throws std::out_of_range like std::string::at.
    [[nodiscard]] char at(size_type pos) const
    {
        return text_.at(pos);
    }

    /// @brief Slice of the text; throws std::out_of_range when @p pos > size().
    [[nodiscard]] std::string substr(size_type pos = 0, size_type count = npos) const
    {
        return text_.substr(pos, count);
    }

    [[nodiscard]] size_type find(std::string_view needle, size_type pos = 0) const noexcept
    {
        return view().find(needle, pos);
    }

    [[nodiscard]] size_type find(char ch, size_type pos = 0) const noexcept
    {
        return text_.find(ch, pos);
    }

    [[nodiscard]] bool contains(std::string_view needle) const noexcept
    {
        return find(needle) != npos;
    }

    [[nodiscard]] const_iterator begin() const noexcept
    {
        return text_.cbegin();
    }

    [[nodiscard]] const_iterator end() const noexcept
    {
        return text_.cend();
    }

    friend bool operator==(const CleanText &, const CleanText &) = default;
    friend std::strong_ordering operator<=>(const CleanText &, const CleanText &) = default;

    friend bool operator==(const CleanText &lhs, std::string_view rhs) noexcept
    {
        return lhs.view() == rhs;
    }

    friend bool operator==(const CleanText &lhs, const char *rhs) noexcept
    {
        return lhs.view() == std::string_view(rhs);
    }

    friend std::string operator+(const CleanText &lhs, std::string_view rhs)
    {
        std::string out = lhs.text_;
        out.append(rhs);
        return out;
    }

    friend std::string operator+(std::string_view lhs, const CleanText &rhs)
    {
        std::string out(lhs);
        out.append(rhs.text_);
        return out;
    }

    friend std::string operator+(const CleanText &lhs, const CleanText &rhs)
    {
        return lhs + rhs.view();
    }

    friend std::ostream &operator<<(std::ostream &os, const CleanText &text)
    {
        return os << text.text_;
    }

  private:
    struct AdoptTag
    {
    };

    CleanText(AdoptTag, std::string text) : text_(std::move(text)) {}

    std::string text_;
};

} // namespace jstrip::clean

namespace std
{
template <> struct hash<jstrip::clean::CleanText>
{
    std::size_t operator()(const jstrip::clean::CleanText &text) const noexcept
    {
        return std::hash<std::string_view>{}(text.view());
    }
};
} // namespace std
