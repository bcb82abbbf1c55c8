//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jstrip/Strip.hpp
// Purpose: Stable façade for comment stripping of JSON-like text.
// Key invariants: Re-exports the supported interfaces.  The cleaner and reader
//                 headers live beside their sources under src/, which the
//                 jstrip target exports as a public include root together
//                 with include/.
// Ownership/Lifetime: Types mirror the underlying implementations.
// Links: src/io/CommentFreeReader.hpp, src/clean/CleanText.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clean/CleanText.hpp"
#include "io/CommentFreeReader.hpp"
#include "jstrip/diag/StripDiag.hpp"
#include "scan/CommentScanner.hpp"
#include "support/diag_expected.hpp"

/// @file include/jstrip/Strip.hpp
/// @brief Aggregated public header.  Provides the buffer cleaner
///        (jstrip::clean::stripComments, jstrip::clean::CleanText), the
///        streaming reader (jstrip::io::CommentFreeReader), the span scanner
///        they share, and the diagnostic types their errors are reported with.
