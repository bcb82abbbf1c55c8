//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/ReaderTrace.hpp
// Purpose: Declare tracing configuration and sink for reader lifecycle events.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value; the stream is borrowed.
// Links: src/io/CommentFreeReader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace jstrip::io
{

/// @brief Configuration for reader tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,       ///< Tracing disabled
        Lifecycle, ///< Open, reopen, close and exhaustion
        Lines      ///< Lifecycle plus dropped and trimmed comment lines
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *os = nullptr;

    /// @brief Check whether tracing is enabled.
    [[nodiscard]] bool enabled() const;

    /// @brief Build a configuration from the JSTRIP_TRACE environment variable.
    /// @details "lines" selects Lines; "lifecycle" or "1" selects Lifecycle;
    ///          anything else, including unset, is Off.
    [[nodiscard]] static TraceConfig fromEnvironment();

    /// @brief Parse a JSTRIP_TRACE value.
    [[nodiscard]] static Mode parseMode(std::string_view value);
};

/// @brief Sink that formats and emits trace lines prefixed with "[jstrip]".
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record a successful open of @p path; @p reopen marks Closed -> Open.
    void onOpen(std::string_view path, bool reopen);

    /// @brief Record that the reader released its source.
    void onClose(std::string_view path, std::string_view reason);

    /// @brief Record a whole-line comment dropped at physical line @p line.
    void onDropLine(uint32_t line);

    /// @brief Record a trailing comment removed from physical line @p line.
    /// @param column 1-based column where the first removed comment starts.
    /// @param removedBytes Bytes dropped from the line, trimmed spaces included.
    void onStripTrailing(uint32_t line, std::size_t column, std::size_t removedBytes);

  private:
    std::ostream &out() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace jstrip::io
