//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_cursor.cpp
// Purpose: Verify the scanner cursor's lookahead, consumption and positions.
// Key invariants: Offsets and line/column stay in sync; seeking never rewinds.
// Ownership/Lifetime: Cursors view string literals with static storage.
// Links: include/jstrip/scan/Cursor.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "jstrip/scan/Cursor.hpp"

#include <string_view>

using jstrip::scan::Cursor;

TEST(Cursor, PeekReturnsSentinelAtEnd)
{
    Cursor cur("ab");
    EXPECT_EQ(cur.peek(), 'a');
    EXPECT_EQ(cur.peek(1), 'b');
    EXPECT_EQ(cur.peek(2), '\0');
    cur.seek(2);
    EXPECT_TRUE(cur.atEnd());
    EXPECT_EQ(cur.peek(), '\0');
    cur.advance();
    EXPECT_EQ(cur.offset(), 2u);
}

TEST(Cursor, TracksLinesAndColumns)
{
    Cursor cur("ab\ncd");
    cur.advance();
    cur.advance();
    EXPECT_EQ(cur.pos().line, 1u);
    EXPECT_EQ(cur.pos().column, 2u);
    cur.advance();
    EXPECT_EQ(cur.pos().line, 2u);
    EXPECT_EQ(cur.pos().column, 0u);
    EXPECT_EQ(cur.peek(), 'c');
}

TEST(Cursor, ConsumeWhileReturnsConsumedView)
{
    Cursor cur("   # note");
    const std::string_view spaces = cur.consumeWhile([](char c) { return c == ' '; });
    EXPECT_EQ(spaces, "   ");
    EXPECT_EQ(cur.peek(), '#');
    EXPECT_TRUE(cur.consumeWhile([](char c) { return c == ' '; }).empty());
}

TEST(Cursor, SeekOnlyMovesForward)
{
    Cursor cur("a\nb\nc");
    cur.seek(4);
    EXPECT_EQ(cur.pos().line, 3u);
    EXPECT_EQ(cur.pos().column, 0u);
    cur.seek(2);
    EXPECT_EQ(cur.offset(), 4u);
    cur.seek(100);
    EXPECT_TRUE(cur.atEnd());
    EXPECT_EQ(cur.pos().column, 1u);
}
