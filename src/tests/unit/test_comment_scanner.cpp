//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_comment_scanner.cpp
// Purpose: Verify span classification and comment removal of the scanner.
// Key invariants: Spans partition the input; quoted markers are never comments.
// Ownership/Lifetime: Inputs are string literals; spans view them by offset.
// Links: src/scan/CommentScanner.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "scan/CommentScanner.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace jstrip::scan;

namespace
{
std::string rebuild(std::string_view text, const std::vector<Span> &spans)
{
    std::string out;
    for (const Span &span : spans)
        out.append(span.text(text));
    return out;
}

std::vector<SpanKind> kinds(const std::vector<Span> &spans)
{
    std::vector<SpanKind> out;
    for (const Span &span : spans)
        out.push_back(span.kind);
    return out;
}
} // namespace

TEST(CommentScanner, SpansPartitionInput)
{
    const std::string_view inputs[] = {
        "",
        "{\"a\": 1, // note\n\"b\": 2}",
        "# only\n",
        "'single' \"double\" # c\r\nx",
        "\"open without close # c\n{}",
        "a / b // c",
    };
    for (std::string_view in : inputs)
    {
        const auto spans = scanSpans(in);
        EXPECT_EQ(rebuild(in, spans), in) << in;
        std::size_t expectedOffset = 0;
        for (const Span &span : spans)
        {
            EXPECT_EQ(span.offset, expectedOffset);
            EXPECT_GT(span.length, 0u);
            expectedOffset = span.end();
        }
    }
}

TEST(CommentScanner, ClassifiesTrailingComment)
{
    const std::string_view in = "{\"a\": 1, // note\n\"b\": 2}";
    const auto spans = scanSpans(in);
    ASSERT_EQ(spans.size(), 7u);
    EXPECT_EQ(kinds(spans),
              (std::vector<SpanKind>{SpanKind::Plain,
                                     SpanKind::Literal,
                                     SpanKind::Plain,
                                     SpanKind::Comment,
                                     SpanKind::Plain,
                                     SpanKind::Literal,
                                     SpanKind::Plain}));
    EXPECT_EQ(spans[3].text(in), "// note");
    EXPECT_EQ(spans[3].start.line, 1u);
    EXPECT_EQ(spans[3].start.column, 9u);
    EXPECT_EQ(spans[5].text(in), "\"b\"");
    EXPECT_EQ(spans[5].start.line, 2u);
    EXPECT_EQ(spans[5].start.column, 0u);
}

TEST(CommentScanner, StripsTrailingCommentAndItsSpacing)
{
    EXPECT_EQ(stripLineComments("{\"a\": 1, // note\n\"b\": 2}"), "{\"a\": 1,\n\"b\": 2}");
    EXPECT_EQ(stripLineComments("[1, 2]   # trailing"), "[1, 2]");
}

TEST(CommentScanner, MarkersInsideLiteralsSurvive)
{
    const std::string_view in = "{\"text\": \"// not a comment //\"}";
    EXPECT_EQ(stripLineComments(in), in);
    EXPECT_EQ(stripLineComments("{\"tag\": \"#hash\"} # real"), "{\"tag\": \"#hash\"}");
    EXPECT_EQ(stripLineComments("{'url': 'http://x'}"), "{'url': 'http://x'}");
}

TEST(CommentScanner, OtherQuoteIsOpaqueInsideLiteral)
{
    const std::string_view in = "\"it's # fine\"";
    const auto spans = scanSpans(in);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].kind, SpanKind::Literal);
}

TEST(CommentScanner, CommentBetweenTwoLiteralsIsRecognized)
{
    const std::string_view in = "\"a\": \"x\", # c \"b#\"";
    const auto spans = scanSpans(in);
    ASSERT_EQ(spans.size(), 5u);
    EXPECT_EQ(spans[4].kind, SpanKind::Comment);
    EXPECT_EQ(spans[4].text(in), "# c \"b#\"");
    EXPECT_EQ(stripLineComments(in), "\"a\": \"x\",");

    EXPECT_EQ(stripLineComments("[\"a#\", \"b//\"] // end"), "[\"a#\", \"b//\"]");
}

TEST(CommentScanner, UnpairedQuoteIsPlain)
{
    const std::string_view in = "\"abc # tail\n\"def\"";
    const auto spans = scanSpans(in);
    ASSERT_EQ(spans.size(), 4u);
    EXPECT_EQ(spans[0].kind, SpanKind::Plain);
    EXPECT_EQ(spans[0].text(in), "\"abc ");
    EXPECT_EQ(spans[1].kind, SpanKind::Comment);
    EXPECT_EQ(spans[3].kind, SpanKind::Literal);
    EXPECT_EQ(stripLineComments(in), "\"abc\n\"def\"");
}

TEST(CommentScanner, LiteralDoesNotCrossLines)
{
    const std::string_view in = "\"a\n# c\n\"";
    const auto spans = scanSpans(in);
    EXPECT_EQ(kinds(spans),
              (std::vector<SpanKind>{SpanKind::Plain, SpanKind::Comment, SpanKind::Plain}));
}

TEST(CommentScanner, CommentStopsBeforeCarriageReturn)
{
    EXPECT_EQ(stripLineComments("1 # c\r\n2"), "1\r\n2");
}

TEST(CommentScanner, SingleSlashIsPlain)
{
    const std::string_view in = "a / b";
    const auto spans = scanSpans(in);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].kind, SpanKind::Plain);
}

TEST(CommentScanner, TabsAroundCommentAreKept)
{
    EXPECT_EQ(stripLineComments("1,\t# c"), "1,\t");
    EXPECT_EQ(stripLineComments("\t\"a\": 1"), "\t\"a\": 1");
}

TEST(CommentScanner, CleanInputIsUntouched)
{
    const std::string_view in = "  {\n    \"a\": [1, 2, 3],\n    \"b\": null\n  }\n";
    EXPECT_EQ(stripLineComments(in), in);
    EXPECT_EQ(stripLineComments("plain text with / slash"), "plain text with / slash");
}

TEST(CommentScanner, WholeLineCommentDetection)
{
    EXPECT_TRUE(isWholeLineComment("# top"));
    EXPECT_TRUE(isWholeLineComment("   // indented\n"));
    EXPECT_TRUE(isWholeLineComment("\t#tab\n"));
    EXPECT_FALSE(isWholeLineComment("{\"a\": 1} # trailing"));
    EXPECT_FALSE(isWholeLineComment("\"# quoted\""));
    EXPECT_FALSE(isWholeLineComment("/ single"));
    EXPECT_FALSE(isWholeLineComment("\n"));
    EXPECT_FALSE(isWholeLineComment(""));
}

TEST(CommentScanner, SpanKindNames)
{
    EXPECT_EQ(toString(SpanKind::Plain), "plain");
    EXPECT_EQ(toString(SpanKind::Literal), "literal");
    EXPECT_EQ(toString(SpanKind::Comment), "comment");
}
