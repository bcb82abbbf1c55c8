//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/CommentFreeReader.cpp
// Purpose: Implements the comment-free line reader and its Open/Closed lifecycle.
// Key invariants: Reopen happens only in lines() and session(); the line counter
//                 restarts at zero on every open.
// Ownership/Lifetime: The reader owns the std::fstream it opens.
// Links: src/io/CommentFreeReader.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Streaming counterpart of the buffer cleaner.
/// @details Pulls the source one physical line at a time.  A line whose first
///          non-whitespace characters are a comment marker is dropped before
///          any scanning; every other line goes through the same scanner the
///          buffer cleaner uses, so both surfaces agree on what a comment is.

#include "io/CommentFreeReader.hpp"

#include "jstrip/diag/StripDiag.hpp"
#include "scan/CommentScanner.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace jstrip::io
{

using jstrip::diag::StripDiag;
using jstrip::support::Diag;
using jstrip::support::Expected;

namespace
{
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Two upper-case hex digits for @p value.
std::string hexByte(unsigned char value)
{
    constexpr std::string_view kDigits = "0123456789ABCDEF";
    return {kDigits[value >> 4], kDigits[value & 0x0F]};
}
} // namespace

/// @brief Validate options and build a reader for @p path.
/// @details Mode and encoding are checked before any I/O so a rejected
///          configuration never touches the filesystem; the diagnostic is
///          stamped with @p path so callers can print it directly.  When
///          options.openImmediately is false the reader starts Closed and the
///          first lines() or session() call performs the open.
/// @param path File to read.
/// @param options Mode, encoding, open policy and tracing.
/// @return The reader or the first diagnostic encountered.
Expected<CommentFreeReader> CommentFreeReader::open(std::string path, ReaderOptions options)
{
    auto mode = parseOpenMode(options.mode);
    if (!mode)
    {
        Diag d = mode.error();
        d.path = path;
        return Expected<CommentFreeReader>(std::move(d));
    }

    auto encoding = normalizeEncoding(options.encoding);
    if (!encoding)
    {
        Diag d = encoding.error();
        d.path = path;
        return Expected<CommentFreeReader>(std::move(d));
    }

    CommentFreeReader reader(std::move(path), mode.value(), encoding.value(), options.trace);
    if (options.openImmediately)
    {
        if (auto opened = reader.openSource(); !opened)
            return Expected<CommentFreeReader>(opened.error());
    }
    return Expected<CommentFreeReader>(std::move(reader));
}

/// @brief Store validated settings; the stream is acquired separately.
CommentFreeReader::CommentFreeReader(std::string path,
                                     OpenMode mode,
                                     Encoding encoding,
                                     TraceConfig trace)
    : path_(std::move(path)), mode_(std::move(mode)), encoding_(encoding), trace_(trace)
{
}

/// @brief Take over @p other's stream after releasing our own.
/// @details The stream held before the assignment is closed with reason
///          "replaced" so the trace shows where it went.
CommentFreeReader &CommentFreeReader::operator=(CommentFreeReader &&other) noexcept
{
    if (this != &other)
    {
        closeWith("replaced");
        path_ = std::move(other.path_);
        mode_ = std::move(other.mode_);
        encoding_ = other.encoding_;
        source_ = std::move(other.source_);
        lineNo_ = other.lineNo_;
        opens_ = other.opens_;
        trace_ = other.trace_;
        lastError_ = std::move(other.lastError_);
    }
    return *this;
}

/// @brief Release the stream if still Open.
CommentFreeReader::~CommentFreeReader()
{
    closeWith("destroyed");
}

/// @brief Acquire a fresh stream for the stored path, mode and encoding.
/// @details Directories are rejected explicitly: a filebuf opens them without
///          complaint on POSIX and then reports an empty file.
Expected<void> CommentFreeReader::openSource()
{
    std::error_code ec;
    if (std::filesystem::is_directory(path_, ec))
        return Expected<void>(diag::makeDiag(StripDiag::OpenFailed, path_, {}, {{"path", path_}}));

    std::ios::openmode flags = std::ios::in;
    if (mode_.update)
        flags |= std::ios::out;

    auto stream = std::make_unique<std::fstream>(path_, flags);
    if (!stream->is_open())
        return Expected<void>(diag::makeDiag(StripDiag::OpenFailed, path_, {}, {{"path", path_}}));

    source_ = std::move(stream);
    lineNo_ = 0;
    trace_.onOpen(path_, opens_ > 0);
    ++opens_;
    return {};
}

/// @brief Reopen a Closed reader; a no-op while Open.
Expected<void> CommentFreeReader::ensureOpen()
{
    if (source_)
        return {};
    return openSource();
}

/// @brief Release the stream on request.  Safe to call repeatedly and after a
///        failed read.
void CommentFreeReader::close()
{
    closeWith("explicit");
}

/// @brief Close the stream and trace @p reason; nothing happens when Closed.
void CommentFreeReader::closeWith(std::string_view reason)
{
    if (!source_)
        return;
    source_->close();
    source_.reset();
    trace_.onClose(path_, reason);
}

/// @brief Read one physical line using universal newlines.
/// @details "\n", "\r\n" and a lone "\r" all end a line and come back as
///          "\n".  The line body is checked against the declared encoding
///          after any byte-order mark is dropped; the reported column counts
///          physical bytes from 1.  Returns std::nullopt when nothing is left.
Expected<std::optional<std::string>> CommentFreeReader::readPhysicalLine()
{
    std::string line;
    bool terminated = false;
    char ch = 0;
    while (source_->get(ch))
    {
        if (ch == '\n')
        {
            terminated = true;
            break;
        }
        if (ch == '\r')
        {
            if (source_->peek() == '\n')
                source_->get(ch);
            terminated = true;
            break;
        }
        line.push_back(ch);
    }

    if (source_->bad())
    {
        return Expected<std::optional<std::string>>(diag::makeDiag(
            StripDiag::ReadFailed, path_, {lineNo_ + 1, 0}, {{"path", path_}}));
    }

    if (!terminated && line.empty())
        return Expected<std::optional<std::string>>(std::optional<std::string>{});

    ++lineNo_;
    std::size_t bomBytes = 0;
    if (lineNo_ == 1 && encoding_ == Encoding::Utf8Sig && line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0)
    {
        line.erase(0, kUtf8Bom.size());
        bomBytes = kUtf8Bom.size();
    }

    if (const auto bad = findUndecodable(line, encoding_))
    {
        const std::string byte = hexByte(static_cast<unsigned char>(line[*bad]));
        const support::SourceLoc loc{lineNo_, static_cast<uint32_t>(*bad + bomBytes + 1)};
        return Expected<std::optional<std::string>>(diag::makeDiag(
            StripDiag::DecodeFailed,
            path_,
            loc,
            {{"encoding", encoding()}, {"byte", byte}, {"path", path_}}));
    }

    if (terminated)
        line.push_back('\n');
    return Expected<std::optional<std::string>>(std::optional<std::string>(std::move(line)));
}

/// @brief Return the next line that is not a whole-line comment.
/// @details Whole-line comments are skipped without scanning.  Every other
///          line is split into spans once; the first comment span's column goes
///          to the trace and the retained spans form the result.
Expected<std::optional<std::string>> CommentFreeReader::readLine()
{
    if (!source_)
    {
        return Expected<std::optional<std::string>>(
            diag::makeDiag(StripDiag::ReadOnClosed, path_, {}));
    }

    for (;;)
    {
        auto physical = readPhysicalLine();
        if (!physical)
            return physical;
        if (!physical.value())
            return physical;

        const std::string &raw = *physical.value();
        if (scan::isWholeLineComment(raw))
        {
            trace_.onDropLine(lineNo_);
            continue;
        }

        const std::vector<scan::Span> spans = scan::scanSpans(raw);
        std::string cleaned = scan::joinRetained(raw, spans);
        const auto comment = std::find_if(spans.begin(),
                                          spans.end(),
                                          [](const scan::Span &span)
                                          { return span.kind == scan::SpanKind::Comment; });
        if (comment != spans.end())
            trace_.onStripTrailing(lineNo_, comment->start.column + 1, raw.size() - cleaned.size());
        return Expected<std::optional<std::string>>(std::optional<std::string>(std::move(cleaned)));
    }
}

/// @brief Start a single pass over the cleaned lines.
/// @details Clears the previous pass's lastError() and reopens a Closed reader
///          so iterating again after exhaustion restarts from line 1.
Expected<CommentFreeReader::LineRange> CommentFreeReader::lines()
{
    lastError_.reset();
    if (auto opened = ensureOpen(); !opened)
        return Expected<LineRange>(opened.error());
    return Expected<LineRange>(LineRange(*this));
}

/// @brief Collect every remaining cleaned line.
/// @details Runs a full lines() pass.  A failure mid-pass is returned instead
///          of the partial result.
Expected<std::vector<std::string>> CommentFreeReader::readAllLines()
{
    auto range = lines();
    if (!range)
        return Expected<std::vector<std::string>>(range.error());

    std::vector<std::string> out;
    for (const std::string &line : range.value())
        out.push_back(line);

    if (lastError_)
        return Expected<std::vector<std::string>>(*lastError_);
    return Expected<std::vector<std::string>>(std::move(out));
}

/// @brief Concatenate every remaining cleaned line.
/// @details Lines keep their terminators, so the result has the shape of the
///          source minus comments.  The text is adopted without rescanning.
Expected<clean::CleanText> CommentFreeReader::readAllText()
{
    auto range = lines();
    if (!range)
        return Expected<clean::CleanText>(range.error());

    std::string text;
    for (const std::string &line : range.value())
        text.append(line);

    if (lastError_)
        return Expected<clean::CleanText>(*lastError_);
    return Expected<clean::CleanText>(clean::CleanText::fromCleaned(std::move(text)));
}

/// @brief Open if needed and return a guard that closes on scope exit.
Expected<ReaderSession> CommentFreeReader::session()
{
    if (auto opened = ensureOpen(); !opened)
        return Expected<ReaderSession>(opened.error());
    return Expected<ReaderSession>(ReaderSession(*this));
}

/// @brief Look up a re-exported metadata value by name.
/// @details The key set is closed; anything outside it is reported as S3001
///          rather than an empty string so typos surface.
/// @param key One of "name", "mode", "encoding", "closed" or "line".
/// @return The value rendered as text, or an S3001 diagnostic.
Expected<std::string> CommentFreeReader::attribute(std::string_view key) const
{
    if (key == "name")
        return Expected<std::string>(path_);
    if (key == "mode")
        return Expected<std::string>(mode_.text);
    if (key == "encoding")
        return Expected<std::string>(std::string(encoding()));
    if (key == "closed")
        return Expected<std::string>(std::string(closed() ? "true" : "false"));
    if (key == "line")
        return Expected<std::string>(std::to_string(lineNo_));
    return Expected<std::string>(
        diag::makeDiag(StripDiag::UnknownAttribute, path_, {}, {{"name", key}}));
}

/// @brief Bind to @p reader and pull the first line.
CommentFreeReader::LineIterator::LineIterator(CommentFreeReader &reader) : reader_(&reader)
{
    fetch();
}

/// @brief Advance to the next cleaned line.
CommentFreeReader::LineIterator &CommentFreeReader::LineIterator::operator++()
{
    fetch();
    return *this;
}

/// @brief Pull the next cleaned line or finish.
/// @details Normal exhaustion closes the reader.  A failure is parked in the
///          reader's lastError() and ends the iteration with the stream left
///          in place so the caller can still close it.
void CommentFreeReader::LineIterator::fetch()
{
    if (!reader_)
        return;

    if (reader_->closed())
    {
        reader_ = nullptr;
        return;
    }

    auto next = reader_->readLine();
    if (!next)
    {
        reader_->lastError_ = next.error();
        reader_ = nullptr;
        return;
    }
    if (!next.value())
    {
        reader_->closeWith("exhausted");
        reader_ = nullptr;
        return;
    }
    current_ = std::move(*next.value());
}

} // namespace jstrip::io
