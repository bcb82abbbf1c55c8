//===----------------------------------------------------------------------===//
//
// Part of the JStrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_reader_options.cpp
// Purpose: Verify mode and encoding validation and trace configuration.
// Key invariants: Rejections carry the catalogue code for the failure.
// Ownership/Lifetime: Pure value tests.
// Links: src/io/ReaderOptions.hpp, src/io/ReaderTrace.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "io/ReaderOptions.hpp"
#include "io/ReaderTrace.hpp"

#include <sstream>

using namespace jstrip::io;

TEST(ReaderOptions, AcceptsTextReadModes)
{
    for (const char *mode : {"r", "rt", "tr", "r+", "+r", "rt+"})
    {
        auto parsed = parseOpenMode(mode);
        ASSERT_TRUE(parsed) << mode;
        EXPECT_EQ(parsed.value().text, mode);
    }
    EXPECT_FALSE(parseOpenMode("r").value().update);
    EXPECT_TRUE(parseOpenMode("r+").value().update);
}

TEST(ReaderOptions, BinaryModeIsReportedFirst)
{
    for (const char *mode : {"rb", "br", "wb", "rb+"})
    {
        auto parsed = parseOpenMode(mode);
        ASSERT_FALSE(parsed) << mode;
        EXPECT_EQ(parsed.error().code, "S1001") << mode;
    }
}

TEST(ReaderOptions, RejectsNonReadModes)
{
    for (const char *mode : {"", "w", "a", "x", "rr", "rtt", "r++", "rw", "t"})
    {
        auto parsed = parseOpenMode(mode);
        ASSERT_FALSE(parsed) << mode;
        EXPECT_EQ(parsed.error().code, "S1002") << mode;
    }
    EXPECT_EQ(parseOpenMode("w").error().message, "mode 'w' is not a text read mode");
}

TEST(ReaderOptions, NormalizesEncodingNames)
{
    EXPECT_EQ(normalizeEncoding("utf-8").value(), Encoding::Utf8);
    EXPECT_EQ(normalizeEncoding("UTF8").value(), Encoding::Utf8);
    EXPECT_EQ(normalizeEncoding("utf_8").value(), Encoding::Utf8);
    EXPECT_EQ(normalizeEncoding("UTF-8-SIG").value(), Encoding::Utf8Sig);
    EXPECT_EQ(normalizeEncoding("us-ascii").value(), Encoding::Ascii);
    EXPECT_EQ(encodingName(Encoding::Utf8Sig), "utf-8-sig");
}

TEST(ReaderOptions, RejectsUnknownEncoding)
{
    auto enc = normalizeEncoding("latin-1");
    ASSERT_FALSE(enc);
    EXPECT_EQ(enc.error().code, "S1003");
    EXPECT_EQ(enc.error().message, "unsupported encoding 'latin-1'");
}

TEST(ReaderTrace, ParsesModes)
{
    EXPECT_EQ(TraceConfig::parseMode("lines"), TraceConfig::Lines);
    EXPECT_EQ(TraceConfig::parseMode("lifecycle"), TraceConfig::Lifecycle);
    EXPECT_EQ(TraceConfig::parseMode("1"), TraceConfig::Lifecycle);
    EXPECT_EQ(TraceConfig::parseMode("0"), TraceConfig::Off);
    EXPECT_EQ(TraceConfig::parseMode(""), TraceConfig::Off);
}

TEST(ReaderTrace, LifecycleModeSkipsLineRecords)
{
    std::ostringstream os;
    TraceConfig cfg;
    cfg.mode = TraceConfig::Lifecycle;
    cfg.os = &os;
    TraceSink sink(cfg);
    sink.onOpen("a.json", false);
    sink.onDropLine(1);
    sink.onStripTrailing(2, 3, 5);
    sink.onClose("a.json", "explicit");
    EXPECT_EQ(os.str(), "[jstrip] open a.json\n[jstrip] close a.json (explicit)\n");
}

TEST(ReaderTrace, OffModeIsSilent)
{
    std::ostringstream os;
    TraceConfig cfg;
    cfg.os = &os;
    TraceSink sink(cfg);
    sink.onOpen("a.json", true);
    sink.onDropLine(1);
    EXPECT_TRUE(os.str().empty());
}

TEST(ReaderOptions, FindsUndecodableBytes)
{
    EXPECT_FALSE(findUndecodable("{\"a\": 1}", Encoding::Ascii).has_value());
    EXPECT_EQ(findUndecodable("ab\x80", Encoding::Ascii), 2u);
    EXPECT_EQ(findUndecodable("caf\xC3\xA9", Encoding::Ascii), 3u);

    EXPECT_FALSE(findUndecodable("caf\xC3\xA9", Encoding::Utf8).has_value());
    EXPECT_FALSE(findUndecodable("\xE2\x82\xAC \xF0\x9F\x98\x80", Encoding::Utf8Sig).has_value());
    EXPECT_EQ(findUndecodable("x\xFF", Encoding::Utf8), 1u);
    EXPECT_EQ(findUndecodable("\x80", Encoding::Utf8), 0u);
    EXPECT_EQ(findUndecodable("ok\xC3", Encoding::Utf8), 2u);
    EXPECT_EQ(findUndecodable("\xC3(", Encoding::Utf8), 0u);
    EXPECT_EQ(findUndecodable("\xC0\xAF", Encoding::Utf8), 0u);
    EXPECT_EQ(findUndecodable("\xED\xA0\x80", Encoding::Utf8), 0u);
    EXPECT_EQ(findUndecodable("\xF4\x90\x80\x80", Encoding::Utf8), 0u);
}
