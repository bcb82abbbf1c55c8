//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/diag/StripDiag.cpp
// Purpose: Static diagnostic table and message formatting for the reader.
// Key invariants: Table order matches the StripDiag enumerators.
// Ownership/Lifetime: Table entries have static storage duration.
// Links: include/jstrip/diag/StripDiag.hpp
//
//===----------------------------------------------------------------------===//

#include "jstrip/diag/StripDiag.hpp"

#include <array>
#include <cstddef>
#include <utility>

namespace jstrip::diag
{
namespace
{
using jstrip::support::Severity;

constexpr std::array<StripDiagInfo, 8> kInfos{{
    {"BinaryMode",
     "S1001",
     ErrorKind::Configuration,
     Severity::Error,
     "binary mode '{mode}' is not supported; the reader is text-only"},
    {"UnsupportedMode",
     "S1002",
     ErrorKind::Configuration,
     Severity::Error,
     "mode '{mode}' is not a text read mode"},
    {"UnsupportedEncoding",
     "S1003",
     ErrorKind::Configuration,
     Severity::Error,
     "unsupported encoding '{encoding}'"},
    {"OpenFailed", "S2001", ErrorKind::IO, Severity::Error, "unable to open {path}"},
    {"ReadFailed", "S2002", ErrorKind::IO, Severity::Error, "read failed in {path}"},
    {"ReadOnClosed", "S2003", ErrorKind::IO, Severity::Error, "read on closed reader"},
    {"DecodeFailed",
     "S2004",
     ErrorKind::IO,
     Severity::Error,
     "invalid {encoding} byte 0x{byte} in {path}"},
    {"UnknownAttribute",
     "S3001",
     ErrorKind::AttributeLookup,
     Severity::Error,
     "reader has no attribute '{name}'"},
}};

} // namespace

/// @brief Fetch the catalogue record for @p diag.
/// @details The table is indexed by enumerator value, so its order must follow
///          the StripDiag declaration.
const StripDiagInfo &getInfo(StripDiag diag)
{
    return kInfos[static_cast<std::size_t>(diag)];
}

/// @brief Enumerator name of @p diag as text.
std::string_view getId(StripDiag diag)
{
    return getInfo(diag).id;
}

/// @brief Stable "Snnnn" code of @p diag.
std::string_view getCode(StripDiag diag)
{
    return getInfo(diag).code;
}

/// @brief Error family of @p diag.
ErrorKind getKind(StripDiag diag)
{
    return getInfo(diag).kind;
}

/// @brief Unexpanded message template of @p diag.
std::string_view getFormat(StripDiag diag)
{
    return getInfo(diag).format;
}

/// @brief Expand "{key}" placeholders in the diagnostic's format string.
/// @details Scans the template once.  A brace pair whose key has no matching
///          replacement is copied through unchanged so missing arguments are
///          visible in the output rather than silently dropped.
std::string formatMessage(StripDiag diag, std::initializer_list<Replacement> replacements)
{
    const std::string_view format = getFormat(diag);
    std::string out;
    out.reserve(format.size());

    std::size_t i = 0;
    while (i < format.size())
    {
        const char ch = format[i];
        if (ch == '{')
        {
            const std::size_t close = format.find('}', i + 1);
            if (close != std::string_view::npos)
            {
                const std::string_view key = format.substr(i + 1, close - i - 1);
                bool replaced = false;
                for (const auto &r : replacements)
                {
                    if (r.key == key)
                    {
                        out.append(r.value);
                        replaced = true;
                        break;
                    }
                }
                if (!replaced)
                    out.append(format.substr(i, close - i + 1));
                i = close + 1;
                continue;
            }
        }
        out.push_back(ch);
        ++i;
    }
    return out;
}

/// @brief Assemble a diagnostic record from the catalogue entry for @p diag.
/// @details Severity and code come from the table; the message is expanded
///          with @p replacements.
jstrip::support::Diagnostic makeDiag(StripDiag diag,
                                     std::string path,
                                     jstrip::support::SourceLoc loc,
                                     std::initializer_list<Replacement> replacements)
{
    const StripDiagInfo &info = getInfo(diag);
    return jstrip::support::Diagnostic{info.severity,
                                       formatMessage(diag, replacements),
                                       loc,
                                       std::string(info.code),
                                       std::move(path)};
}

/// @brief Find the catalogue entry whose code matches @p d.code.
/// @details Linear scan; the catalogue is small and lookups happen only on
///          error paths.
std::optional<StripDiag> lookup(const jstrip::support::Diagnostic &d)
{
    for (std::size_t i = 0; i < kInfos.size(); ++i)
    {
        if (kInfos[i].code == d.code)
            return static_cast<StripDiag>(i);
    }
    return std::nullopt;
}

/// @brief Error family of @p d, via its catalogue entry.
std::optional<ErrorKind> errorKind(const jstrip::support::Diagnostic &d)
{
    if (auto diag = lookup(d))
        return getKind(*diag);
    return std::nullopt;
}

} // namespace jstrip::diag
