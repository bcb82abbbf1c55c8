//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/ReaderTrace.cpp
// Purpose: Emit reader lifecycle traces.
// Key invariants: One event per line; nothing is written when tracing is Off.
// Ownership/Lifetime: Borrowed output stream must outlive the sink.
// Links: src/io/ReaderTrace.hpp
//
//===----------------------------------------------------------------------===//

#include "io/ReaderTrace.hpp"

#include <cstdlib>
#include <iostream>

namespace jstrip::io
{

/// @brief Report whether any trace record will be written.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

/// @brief Map a JSTRIP_TRACE value onto a trace mode.
/// @details Matching is exact and case-sensitive; unrecognised values turn
///          tracing off rather than failing, matching how the variable is
///          treated when unset.
/// @param value Raw environment value.
/// @return The selected mode.
TraceConfig::Mode TraceConfig::parseMode(std::string_view value)
{
    if (value == "lines")
        return Lines;
    if (value == "lifecycle" || value == "1")
        return Lifecycle;
    return Off;
}

/// @brief Build a configuration from the process environment.
/// @details Reads JSTRIP_TRACE once; the stream stays null so records go to
///          std::cerr.
TraceConfig TraceConfig::fromEnvironment()
{
    TraceConfig cfg;
    if (const char *env = std::getenv("JSTRIP_TRACE"))
        cfg.mode = parseMode(env);
    return cfg;
}

/// @brief Create a sink that writes according to @p cfg.
TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

/// @brief Resolve the destination stream, defaulting to std::cerr.
std::ostream &TraceSink::out() const
{
    return cfg.os ? *cfg.os : std::cerr;
}

/// @brief Emit "open" for the first acquisition and "reopen" afterwards.
/// @param path Path of the opened file.
/// @param reopen True when the reader had been opened before.
void TraceSink::onOpen(std::string_view path, bool reopen)
{
    if (!cfg.enabled())
        return;
    out() << "[jstrip] " << (reopen ? "reopen " : "open ") << path << '\n';
}

/// @brief Emit a close record naming why the stream was released.
/// @param path Path of the closed file.
/// @param reason One of "explicit", "exhausted", "replaced" or "destroyed".
void TraceSink::onClose(std::string_view path, std::string_view reason)
{
    if (!cfg.enabled())
        return;
    out() << "[jstrip] close " << path << " (" << reason << ")\n";
}

/// @brief Emit a record for a dropped whole-line comment (Lines mode only).
void TraceSink::onDropLine(uint32_t line)
{
    if (cfg.mode != TraceConfig::Lines)
        return;
    out() << "[jstrip] drop line " << line << '\n';
}

/// @brief Emit a record for a trailing comment removed from a kept line.
/// @details Written in Lines mode only.  The column locates the first comment
///          on the line so the record can be matched against the source.
void TraceSink::onStripTrailing(uint32_t line, std::size_t column, std::size_t removedBytes)
{
    if (cfg.mode != TraceConfig::Lines)
        return;
    out() << "[jstrip] strip line " << line << ':' << column << " (" << removedBytes
          << " bytes)\n";
}

} // namespace jstrip::io
