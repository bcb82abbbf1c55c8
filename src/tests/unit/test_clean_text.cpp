//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_clean_text.cpp
// Purpose: Verify the buffer cleaner and the string-like CleanText value.
// Key invariants: Cleaning is idempotent and leaves comment-free text unchanged.
// Ownership/Lifetime: CleanText values own their storage.
// Links: src/clean/CleanText.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "clean/CleanText.hpp"

#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>

using jstrip::clean::CleanText;
using jstrip::clean::stripComments;

TEST(CleanText, RemovesTrailingComment)
{
    const CleanText text("{\"a\": 1, // note\n\"b\": 2}");
    EXPECT_EQ(text, "{\"a\": 1,\n\"b\": 2}");
    EXPECT_EQ(text.str(), stripComments("{\"a\": 1, // note\n\"b\": 2}"));
}

TEST(CleanText, WholeLineCommentLeavesItsNewline)
{
    EXPECT_EQ(stripComments("# header\n{\"a\": 1}"), "\n{\"a\": 1}");
}

TEST(CleanText, MarkersInStringsAreKept)
{
    const std::string raw = "{\"text\": \"// not a comment\", \"tag\": \"#1\"}";
    EXPECT_EQ(stripComments(raw), raw);
}

TEST(CleanText, CommentFreeInputIsIdentity)
{
    const std::string raw = "{\n  \"a\": [1, 2, 3],\n  \"b\": {\"c\": null}\n}\n";
    EXPECT_EQ(CleanText(raw).str(), raw);
    EXPECT_EQ(stripComments(""), "");
}

TEST(CleanText, CleaningIsIdempotent)
{
    const std::string inputs[] = {
        "{\"a\": 1, // note\n\"b\": 2}",
        "# top\n  // indented\n[1, 2] # tail\n",
        "\"open # c\n'x' // y\r\n{}",
        "\t\"k\":\t\"v\"  #  c  \n",
    };
    for (const std::string &raw : inputs)
    {
        const std::string once = stripComments(raw);
        EXPECT_EQ(stripComments(once), once) << raw;
    }
}

TEST(CleanText, BehavesLikeAString)
{
    const CleanText text("[1, 2] # c");
    EXPECT_EQ(text.size(), 6u);
    EXPECT_EQ(text.length(), text.size());
    EXPECT_FALSE(text.empty());
    EXPECT_EQ(text[0], '[');
    EXPECT_EQ(text.at(5), ']');
    EXPECT_THROW((void)text.at(6), std::out_of_range);
    EXPECT_EQ(text.substr(1, 4), "1, 2");
    EXPECT_EQ(text.find(','), 2u);
    EXPECT_EQ(text.find("2]"), 4u);
    EXPECT_TRUE(text.contains("1, 2"));
    EXPECT_FALSE(text.contains("#"));
    EXPECT_EQ(std::string(text.begin(), text.end()), "[1, 2]");
    EXPECT_STREQ(text.c_str(), "[1, 2]");

    const std::string_view view = text;
    EXPECT_EQ(view, "[1, 2]");
    EXPECT_EQ(text + ",", "[1, 2],");
    EXPECT_EQ("x=" + text, "x=[1, 2]");
    EXPECT_EQ(text + text, "[1, 2][1, 2]");

    std::ostringstream os;
    os << text;
    EXPECT_EQ(os.str(), "[1, 2]");
}

TEST(CleanText, ValueSemantics)
{
    const CleanText a("1 # x");
    const CleanText b("1 // y");
    const CleanText c("2");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
    EXPECT_EQ(std::hash<CleanText>{}(a), std::hash<CleanText>{}(b));

    std::unordered_set<CleanText> set{a, b, c};
    EXPECT_EQ(set.size(), 2u);

    CleanText copy = a;
    EXPECT_EQ(copy, a);
    EXPECT_TRUE(CleanText().empty());
}

TEST(CleanText, FromCleanedDoesNotRescan)
{
    const CleanText adopted = CleanText::fromCleaned("\"#kept\"");
    EXPECT_EQ(adopted, "\"#kept\"");
}
