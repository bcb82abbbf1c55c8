//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record carried by Expected errors.
// Key invariants: A catalogued diagnostic has a non-empty code.
// Ownership/Lifetime: Plain value type.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>

namespace jstrip::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional line/column
    std::string code;    ///< Catalogue code such as "S2001"; empty when uncatalogued
    std::string path;    ///< Source the diagnostic refers to; empty when none
};

} // namespace jstrip::support
