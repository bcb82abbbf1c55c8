//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/CommentFreeReader.hpp
// Purpose: Line-oriented text file reader that hides '#' and '//' comments.
// Key invariants: Whole-line comments are never surfaced; every surfaced line has
//                 its trailing comment removed; lines keep source order.
// Ownership/Lifetime: The reader exclusively owns its stream while Open and
//                     releases it on close, exhaustion, session exit or destruction.
// Links: src/scan/CommentScanner.hpp, src/io/ReaderOptions.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clean/CleanText.hpp"
#include "io/ReaderOptions.hpp"
#include "io/ReaderTrace.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jstrip::io
{

class ReaderSession;

/// @brief Text file reader returning comment-free lines.
///
/// The reader is Open or Closed.  open() validates the mode and encoding
/// before touching the filesystem and, unless told otherwise, opens the file.
/// Exhausting lines() or calling close() moves it to Closed; lines() and
/// session() reopen a Closed reader from the original path, starting again at
/// the first line.  readLine() never reopens.
///
/// Lines are returned with their terminator normalised to '\n'; a final line
/// without a terminator is returned without one.
class CommentFreeReader
{
  public:
    class LineIterator;
    class LineRange;

    /// @brief Validate @p options and construct a reader for @p path.
    /// @return The reader, a configuration diagnostic for a rejected mode or
    ///         encoding (no I/O attempted), or an I/O diagnostic when
    ///         options.openImmediately is set and the file cannot be opened.
    [[nodiscard]] static jstrip::support::Expected<CommentFreeReader> open(std::string path,
                                                                           ReaderOptions options = {});

    CommentFreeReader(CommentFreeReader &&other) noexcept = default;
    CommentFreeReader &operator=(CommentFreeReader &&other) noexcept;
    CommentFreeReader(const CommentFreeReader &) = delete;
    CommentFreeReader &operator=(const CommentFreeReader &) = delete;
    ~CommentFreeReader();

    /// @brief Next non-comment line with its trailing comment removed.
    /// @return std::nullopt at end of stream; an S2003 diagnostic when the
    ///         reader is Closed; an S2002 diagnostic when the stream fails; an
    ///         S2004 diagnostic when a byte is invalid in the encoding.  After
    ///         an S2004 the reader stays Open and the next call continues with
    ///         the following line.
    [[nodiscard]] jstrip::support::Expected<std::optional<std::string>> readLine();

    /// @brief Every remaining cleaned line; reopens a Closed reader first.
    [[nodiscard]] jstrip::support::Expected<std::vector<std::string>> readAllLines();

    /// @brief Every remaining cleaned line joined without separator.
    [[nodiscard]] jstrip::support::Expected<jstrip::clean::CleanText> readAllText();

    /// @brief Begin iteration, reopening a Closed reader.
    /// @details The returned range is single-pass and views this reader; it
    ///          must not outlive it.  Reaching the end closes the reader.  A
    ///          read failure ends the range early and is kept in lastError().
    [[nodiscard]] jstrip::support::Expected<LineRange> lines();

    /// @brief Scoped use: reopen if Closed and close when the guard goes away.
    [[nodiscard]] jstrip::support::Expected<ReaderSession> session();

    /// @brief Release the underlying stream.  Closing a Closed reader is a no-op.
    void close();

    /// @brief Path the reader was created for.
    [[nodiscard]] const std::string &name() const noexcept
    {
        return path_;
    }

    /// @brief Access mode as supplied to open().
    [[nodiscard]] const std::string &mode() const noexcept
    {
        return mode_.text;
    }

    /// @brief Canonical encoding name.
    [[nodiscard]] std::string_view encoding() const noexcept
    {
        return encodingName(encoding_);
    }

    [[nodiscard]] bool closed() const noexcept
    {
        return source_ == nullptr;
    }

    /// @brief Physical lines consumed since the last (re)open, comments included.
    [[nodiscard]] uint32_t lineNumber() const noexcept
    {
        return lineNo_;
    }

    /// @brief Look up re-exported metadata by name.
    /// @details Known keys: "name", "mode", "encoding", "closed" ("true" or
    ///          "false") and "line".  Any other key yields an S3001 diagnostic.
    [[nodiscard]] jstrip::support::Expected<std::string> attribute(std::string_view key) const;

    /// @brief Diagnostic that ended the most recent iteration early, if any.
    [[nodiscard]] const std::optional<jstrip::support::Diag> &lastError() const noexcept
    {
        return lastError_;
    }

  private:
    friend struct CommentFreeReaderTestHook; ///< Unit tests force stream failures

    CommentFreeReader(std::string path, OpenMode mode, Encoding encoding, TraceConfig trace);

    jstrip::support::Expected<void> openSource();
    jstrip::support::Expected<void> ensureOpen();
    jstrip::support::Expected<std::optional<std::string>> readPhysicalLine();
    void closeWith(std::string_view reason);

    std::string path_;
    OpenMode mode_;
    Encoding encoding_ = Encoding::Utf8;
    std::unique_ptr<std::fstream> source_;
    uint32_t lineNo_ = 0;
    uint32_t opens_ = 0;
    TraceSink trace_;
    std::optional<jstrip::support::Diag> lastError_;
};

/// @brief Single-pass input iterator over cleaned lines.
class CommentFreeReader::LineIterator
{
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string *;
    using reference = const std::string &;

    LineIterator() = default;

    /// @brief Start iterating @p reader; reads the first line immediately.
    explicit LineIterator(CommentFreeReader &reader);

    reference operator*() const
    {
        return current_;
    }

    pointer operator->() const
    {
        return &current_;
    }

    LineIterator &operator++();

    void operator++(int)
    {
        ++*this;
    }

    friend bool operator==(const LineIterator &it, std::default_sentinel_t) noexcept
    {
        return it.reader_ == nullptr;
    }

  private:
    void fetch();

    CommentFreeReader *reader_ = nullptr;
    std::string current_;
};

/// @brief Range adaptor returned by CommentFreeReader::lines().
class CommentFreeReader::LineRange
{
  public:
    explicit LineRange(CommentFreeReader &reader) : reader_(&reader) {}

    [[nodiscard]] LineIterator begin()
    {
        return LineIterator(*reader_);
    }

    [[nodiscard]] std::default_sentinel_t end() const noexcept
    {
        return {};
    }

  private:
    CommentFreeReader *reader_;
};

/// @brief RAII guard returned by CommentFreeReader::session().
/// @details Closes the reader when destroyed, on every exit path.  The reader
///          must not be moved while a session refers to it.
class ReaderSession
{
  public:
    explicit ReaderSession(CommentFreeReader &reader) : reader_(&reader) {}

    ReaderSession(ReaderSession &&other) noexcept : reader_(other.reader_)
    {
        other.reader_ = nullptr;
    }

    ReaderSession &operator=(ReaderSession &&) = delete;
    ReaderSession(const ReaderSession &) = delete;
    ReaderSession &operator=(const ReaderSession &) = delete;

    ~ReaderSession()
    {
        if (reader_)
            reader_->close();
    }

    [[nodiscard]] CommentFreeReader &reader() const noexcept
    {
        return *reader_;
    }

    CommentFreeReader *operator->() const noexcept
    {
        return reader_;
    }

  private:
    CommentFreeReader *reader_;
};

} // namespace jstrip::io
