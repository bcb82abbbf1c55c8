//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/clean/CleanText.cpp
// Purpose: Whole-buffer cleaning on top of the comment scanner.
// Key invariants: The buffer is scanned once; comment spans never reach the output.
// Ownership/Lifetime: Results own their storage.
// Links: src/clean/CleanText.hpp
//
//===----------------------------------------------------------------------===//

#include "clean/CleanText.hpp"

#include "scan/CommentScanner.hpp"

#include <utility>

namespace jstrip::clean
{

/// @brief Run the scanner over the whole buffer.
/// @details Comment spans stop at the next line terminator, so scanning the
///          buffer in one piece classifies exactly what scanning it line by
///          line would; only the space trimming differs, because plain spans
///          may cross line boundaries here.
std::string stripComments(std::string_view raw)
{
    return scan::stripLineComments(raw);
}

/// @brief Clean @p raw once and keep the result.
CleanText::CleanText(std::string_view raw) : text_(stripComments(raw)) {}

/// @brief Wrap text that came out of the reader without scanning it again.
CleanText CleanText::fromCleaned(std::string text)
{
    return CleanText(AdoptTag{}, std::move(text));
}

} // namespace jstrip::clean
