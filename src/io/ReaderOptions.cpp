//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/ReaderOptions.cpp
// Purpose: Mode and encoding validation for the comment-free reader.
// Key invariants: Every rejection is a catalogued configuration diagnostic.
// Ownership/Lifetime: Stateless helpers.
// Links: src/io/ReaderOptions.hpp, include/jstrip/diag/StripDiag.hpp
//
//===----------------------------------------------------------------------===//

#include "io/ReaderOptions.hpp"

#include "jstrip/diag/StripDiag.hpp"

#include <cctype>
#include <cstdint>

namespace jstrip::io
{

using jstrip::diag::StripDiag;
using jstrip::support::Expected;

/// @brief Check an fopen-style mode string.
/// @details A binary request is reported first so "rb", "br" and "wb" all name
///          the actual problem.  Otherwise only 'r', 't' and '+' are accepted,
///          each at most once, and 'r' is mandatory: the reader neither creates
///          nor truncates files.
Expected<OpenMode> parseOpenMode(std::string_view mode)
{
    const std::string modeText(mode);
    if (mode.find('b') != std::string_view::npos)
    {
        return Expected<OpenMode>(
            diag::makeDiag(StripDiag::BinaryMode, {}, {}, {{"mode", modeText}}));
    }

    bool sawRead = false;
    bool sawText = false;
    bool sawUpdate = false;
    for (const char ch : mode)
    {
        bool *seen = nullptr;
        switch (ch)
        {
            case 'r':
                seen = &sawRead;
                break;
            case 't':
                seen = &sawText;
                break;
            case '+':
                seen = &sawUpdate;
                break;
            default:
                break;
        }
        if (!seen || *seen)
        {
            return Expected<OpenMode>(
                diag::makeDiag(StripDiag::UnsupportedMode, {}, {}, {{"mode", modeText}}));
        }
        *seen = true;
    }

    if (!sawRead)
    {
        return Expected<OpenMode>(
            diag::makeDiag(StripDiag::UnsupportedMode, {}, {}, {{"mode", modeText}}));
    }

    return Expected<OpenMode>(OpenMode{modeText, sawUpdate});
}

/// @brief Resolve an encoding name to one of the supported encodings.
/// @details Case is ignored and '_' is treated as '-', so "UTF_8" and "utf-8"
///          agree.  The diagnostic quotes the name as supplied.
Expected<Encoding> normalizeEncoding(std::string_view name)
{
    std::string key;
    key.reserve(name.size());
    for (const char ch : name)
    {
        key.push_back(ch == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (key == "utf-8" || key == "utf8")
        return Expected<Encoding>(Encoding::Utf8);
    if (key == "utf-8-sig" || key == "utf8-sig")
        return Expected<Encoding>(Encoding::Utf8Sig);
    if (key == "ascii" || key == "us-ascii")
        return Expected<Encoding>(Encoding::Ascii);

    return Expected<Encoding>(
        diag::makeDiag(StripDiag::UnsupportedEncoding, {}, {}, {{"encoding", name}}));
}

/// @brief Canonical spelling of @p encoding.
std::string_view encodingName(Encoding encoding) noexcept
{
    switch (encoding)
    {
        case Encoding::Utf8:
            return "utf-8";
        case Encoding::Utf8Sig:
            return "utf-8-sig";
        case Encoding::Ascii:
            return "ascii";
    }
    return "";
}

namespace
{

/// @brief Length of the UTF-8 sequence introduced by @p lead, or 0 if invalid.
std::size_t utf8SequenceLength(unsigned char lead) noexcept
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 0;
}

} // namespace

/// @brief Walk @p text sequence by sequence and stop at the first bad byte.
/// @details ASCII bytes are accepted under every encoding.  For UTF-8 the
///          sequence length comes from the lead byte; the decoded code point
///          is then checked for overlong forms, surrogates and the U+10FFFF
///          ceiling.
std::optional<std::size_t> findUndecodable(std::string_view text, Encoding encoding) noexcept
{
    std::size_t index = 0;
    while (index < text.size())
    {
        const unsigned char lead = static_cast<unsigned char>(text[index]);
        if (lead < 0x80)
        {
            ++index;
            continue;
        }
        if (encoding == Encoding::Ascii)
            return index;

        const std::size_t length = utf8SequenceLength(lead);
        if (length == 0 || index + length > text.size())
            return index;

        uint32_t codePoint = lead & (0xFF >> (length + 1));
        for (std::size_t k = 1; k < length; ++k)
        {
            const unsigned char cc = static_cast<unsigned char>(text[index + k]);
            if ((cc & 0xC0) != 0x80)
                return index;
            codePoint = (codePoint << 6) | (cc & 0x3F);
        }

        if ((length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800) ||
            (length == 4 && (codePoint < 0x10000 || codePoint > 0x10FFFF)) ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF))
        {
            return index;
        }
        index += length;
    }
    return std::nullopt;
}

} // namespace jstrip::io
