//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jstrip/diag/StripDiag.hpp
// Purpose: Catalogue of every diagnostic the comment-stripping reader reports.
// Key invariants: Each enumerator has a unique id, code, kind and template.
// Ownership/Lifetime: Metadata records are static; returned views never dangle.
// Links: src/diag/StripDiag.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace jstrip::diag
{

/// @brief Enumeration of all reader diagnostics.
enum class StripDiag
{
    BinaryMode,          ///< Access mode requests binary I/O.
    UnsupportedMode,     ///< Access mode is not a text read mode.
    UnsupportedEncoding, ///< Encoding name outside the accepted set.
    OpenFailed,          ///< Underlying file could not be opened.
    ReadFailed,          ///< Underlying stream failed while reading a line.
    ReadOnClosed,        ///< Line read requested on a closed reader.
    DecodeFailed,        ///< Byte not valid in the declared encoding.
    UnknownAttribute     ///< Metadata lookup for a key the reader does not export.
};

/// @brief Broad error family a diagnostic belongs to.
enum class ErrorKind
{
    Configuration,  ///< Rejected construction arguments; no I/O was attempted.
    IO,             ///< Open or read failure of the underlying source.
    AttributeLookup ///< Metadata key unknown to the reader.
};

/// @brief A key/value pair used for placeholder substitution in diagnostic messages.
struct Replacement
{
    std::string_view key;   ///< Placeholder name (without delimiters).
    std::string_view value; ///< Replacement text to substitute.
};

/// @brief Static metadata record for a single diagnostic.
struct StripDiagInfo
{
    std::string_view id;               ///< Unique diagnostic identifier string.
    std::string_view code;             ///< Stable code for programmatic use.
    ErrorKind kind;                    ///< Error family.
    jstrip::support::Severity severity; ///< Severity level.
    std::string_view format;           ///< Message format string with {placeholders}.
};

/// @brief Retrieve the full metadata record for a diagnostic.
[[nodiscard]] const StripDiagInfo &getInfo(StripDiag diag);

/// @brief Retrieve the identifier string for a diagnostic.
[[nodiscard]] std::string_view getId(StripDiag diag);

/// @brief Retrieve the code string for a diagnostic.
[[nodiscard]] std::string_view getCode(StripDiag diag);

/// @brief Retrieve the error family for a diagnostic.
[[nodiscard]] ErrorKind getKind(StripDiag diag);

/// @brief Retrieve the raw format string for a diagnostic.
[[nodiscard]] std::string_view getFormat(StripDiag diag);

/// @brief Format a diagnostic message with placeholder substitution.
/// @param diag The diagnostic enumerator.
/// @param replacements Key/value pairs substituted for "{key}" in the format.
/// @return The fully formatted message.  Unknown placeholders are left as-is.
[[nodiscard]] std::string formatMessage(StripDiag diag,
                                        std::initializer_list<Replacement> replacements = {});

/// @brief Build a complete diagnostic record for @p diag.
/// @param diag The diagnostic enumerator.
/// @param path Source path the diagnostic refers to.
/// @param loc Line/column, or a default location when not applicable.
/// @param replacements Placeholder substitutions for the message.
[[nodiscard]] jstrip::support::Diagnostic makeDiag(
    StripDiag diag,
    std::string path,
    jstrip::support::SourceLoc loc = {},
    std::initializer_list<Replacement> replacements = {});

/// @brief Map a diagnostic back to its catalogue entry using its code.
/// @return The enumerator, or std::nullopt for uncatalogued diagnostics.
[[nodiscard]] std::optional<StripDiag> lookup(const jstrip::support::Diagnostic &d);

/// @brief Classify a diagnostic into its error family.
/// @return The family, or std::nullopt for uncatalogued diagnostics.
[[nodiscard]] std::optional<ErrorKind> errorKind(const jstrip::support::Diagnostic &d);

} // namespace jstrip::diag
