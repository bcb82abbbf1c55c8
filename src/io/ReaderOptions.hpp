//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/ReaderOptions.hpp
// Purpose: Construction-time settings for CommentFreeReader and their validation.
// Key invariants: Validation never touches the filesystem.
// Ownership/Lifetime: Value types.
// Links: src/io/CommentFreeReader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "io/ReaderTrace.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace jstrip::io
{

/// @brief Settings accepted by CommentFreeReader::open.
struct ReaderOptions
{
    /// @brief Access mode; text read modes only ("r", "rt", "r+", ...).
    std::string mode = "r";

    /// @brief Declared encoding of the source.  Bytes are passed through unchanged.
    std::string encoding = "utf-8";

    /// @brief Open the file during open(); otherwise start Closed.
    bool openImmediately = true;

    /// @brief Lifecycle tracing; off unless JSTRIP_TRACE says otherwise.
    TraceConfig trace = TraceConfig::fromEnvironment();
};

/// @brief Validated access mode.
struct OpenMode
{
    std::string text;    ///< Mode string as supplied.
    bool update = false; ///< '+' present: the file is opened for reading and writing.
};

/// @brief Encodings the reader accepts.
enum class Encoding
{
    Utf8,    ///< "utf-8"
    Utf8Sig, ///< "utf-8-sig": a leading byte-order mark is dropped
    Ascii    ///< "ascii"
};

/// @brief Validate @p mode.
/// @return The parsed mode, or a configuration diagnostic: BinaryMode when the
///         mode contains 'b', UnsupportedMode when it is not a text read mode.
[[nodiscard]] jstrip::support::Expected<OpenMode> parseOpenMode(std::string_view mode);

/// @brief Resolve @p name (case-insensitive, '_' accepted for '-') to an Encoding.
/// @return The encoding, or an UnsupportedEncoding configuration diagnostic.
[[nodiscard]] jstrip::support::Expected<Encoding> normalizeEncoding(std::string_view name);

/// @brief Canonical spelling of @p encoding.
[[nodiscard]] std::string_view encodingName(Encoding encoding) noexcept;

/// @brief Locate the first byte of @p text that @p encoding cannot decode.
/// @details ASCII accepts bytes below 0x80 only.  The UTF-8 variants accept
///          well-formed sequences and reject stray continuation bytes, truncated
///          sequences, overlong forms, surrogates and code points past U+10FFFF.
/// @return Byte offset of the offending sequence, or std::nullopt when the
///         whole text decodes.
[[nodiscard]] std::optional<std::size_t> findUndecodable(std::string_view text,
                                                         Encoding encoding) noexcept;

} // namespace jstrip::io
