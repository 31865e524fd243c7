#include <gtest/gtest.h>
#include "utils/string_utils.h"
#include <algorithm>

using namespace cubeprog::utils;

// ============================================================================
// Wide String Conversion Tests
// ============================================================================

TEST(StringUtilsTest, AsciiRoundTrip) {
    EXPECT_EQ(wideToUtf8(L"/opt/st/app.hex"), "/opt/st/app.hex");
    EXPECT_EQ(utf8ToWide("/opt/st/app.hex"), L"/opt/st/app.hex");
    EXPECT_EQ(wideToUtf8(L""), "");
}

TEST(StringUtilsTest, NonAsciiText) {
    EXPECT_EQ(wideToUtf8(L"caf\u00E9"), "caf\xC3\xA9");
    EXPECT_EQ(wideToUtf8(L"\u20AC"), "\xE2\x82\xAC");
    EXPECT_EQ(utf8ToWide("\xE2\x82\xAC" "5"), L"\u20AC" L"5");
    EXPECT_EQ(utf8ToWide("/home/j\xC3\xBCrgen/fw.bin"), L"/home/j\u00FCrgen/fw.bin");
}

TEST(StringUtilsTest, MalformedUtf8IsReplaced) {
    EXPECT_EQ(utf8ToWide("a\xFF" "b"), L"a\uFFFD" L"b");
    EXPECT_EQ(utf8ToWide("a\xC3"), L"a\uFFFD");

    // Overlong '/' must not survive as a path separator
    EXPECT_EQ(utf8ToWide("a\xC0\xAF" "b"), L"a\uFFFD" L"b");
    EXPECT_EQ(utf8ToWide("\xE0\x80\xAF"), L"\uFFFD");
    EXPECT_EQ(utf8ToWide("\xF0\x80\x80\xAF"), L"\uFFFD");

    // Encoded surrogates
    EXPECT_EQ(utf8ToWide("\xED\xA0\x80"), L"\uFFFD");
    EXPECT_EQ(utf8ToWide("\xED\xBF\xBF" "x"), L"\uFFFD" L"x");

    // Past U+10FFFF
    EXPECT_EQ(utf8ToWide("\xF4\x90\x80\x80"), L"\uFFFD");
}

TEST(StringUtilsTest, Utf8BoundaryCodePoints) {
    EXPECT_EQ(utf8ToWide("\xC2\x80"), std::wstring(1, static_cast<wchar_t>(0x80)));
    EXPECT_EQ(utf8ToWide("\xED\x9F\xBF"), std::wstring(1, static_cast<wchar_t>(0xD7FF)));
    EXPECT_EQ(wideToUtf8(utf8ToWide("\xF4\x8F\xBF\xBF")), "\xF4\x8F\xBF\xBF");
    EXPECT_EQ(wideToUtf8(utf8ToWide("\xF0\x9F\x98\x80")), "\xF0\x9F\x98\x80");
}

TEST(StringUtilsTest, InvalidWideUnitsAreReplaced) {
    std::wstring loneHigh(1, static_cast<wchar_t>(0xD800));
    EXPECT_EQ(wideToUtf8(loneHigh), "\xEF\xBF\xBD");
    EXPECT_EQ(wideToUtf8(L"a" + loneHigh + L"b"), "a\xEF\xBF\xBD" "b");

    std::wstring loneLow(1, static_cast<wchar_t>(0xDC00));
    EXPECT_EQ(wideToUtf8(loneLow), "\xEF\xBF\xBD");

    if (sizeof(wchar_t) == 4) {
        std::wstring outOfRange(1, static_cast<wchar_t>(0x110000));
        EXPECT_EQ(wideToUtf8(outOfRange), "\xEF\xBF\xBD");
    }
}

// ============================================================================
// Field and Text Helpers
// ============================================================================

TEST(StringUtilsTest, FixedFieldToString) {
    const char terminated[8] = {'S', 'T', 'M', '\0', 'x', 'x', 'x', 'x'};
    const char full[4] = {'3', '.', '2', '6'};

    EXPECT_EQ(fixedFieldToString(terminated, sizeof(terminated)), "STM");
    EXPECT_EQ(fixedFieldToString(full, sizeof(full)), "3.26");
}

TEST(StringUtilsTest, TrimAndUpper) {
    EXPECT_EQ(trim("  reset \r\n"), "reset");
    EXPECT_EQ(trim("\t \n"), "");
    EXPECT_EQ(toUpper("under_reset"), "UNDER_RESET");
}

// ============================================================================
// Number Parsing Tests
// ============================================================================

TEST(StringUtilsTest, ParseUint32) {
    EXPECT_EQ(parseUint32("0"), 0u);
    EXPECT_EQ(parseUint32("4096"), 4096u);
    EXPECT_EQ(parseUint32("0x08000000"), 0x08000000u);
    EXPECT_EQ(parseUint32("0XFFFFFFFF"), 0xFFFFFFFFu);
    EXPECT_EQ(parseUint32(" 16 "), 16u);
}

TEST(StringUtilsTest, ParseUint32Rejects) {
    EXPECT_THROW(parseUint32(""), std::invalid_argument);
    EXPECT_THROW(parseUint32("-1"), std::invalid_argument);
    EXPECT_THROW(parseUint32("+1"), std::invalid_argument);
    EXPECT_THROW(parseUint32("12k"), std::invalid_argument);
    EXPECT_THROW(parseUint32("0x"), std::invalid_argument);
    EXPECT_THROW(parseUint32("0x100000000"), std::invalid_argument);
    EXPECT_THROW(parseUint32("flash"), std::invalid_argument);
}

TEST(StringUtilsTest, ParseHexBytes) {
    EXPECT_EQ(parseHexBytes("DEADBEEF"), (std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_EQ(parseHexBytes("de ad:be-ef"), (std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_EQ(parseHexBytes("0x0102"), (std::vector<uint8_t>{0x01, 0x02}));
    EXPECT_TRUE(parseHexBytes("").empty());
}

TEST(StringUtilsTest, ParseHexBytesRejects) {
    EXPECT_THROW(parseHexBytes("ABC"), std::invalid_argument);
    EXPECT_THROW(parseHexBytes("GG"), std::invalid_argument);
}

// ============================================================================
// Formatting Tests
// ============================================================================

TEST(StringUtilsTest, ToHex) {
    EXPECT_EQ(toHex(0x450), "450");
    EXPECT_EQ(toHex(0x08000000), "8000000");
    EXPECT_EQ(toHex(0xabcd), "ABCD");
    EXPECT_EQ(toHex(0), "0");
}

TEST(StringUtilsTest, HexDump) {
    std::vector<uint8_t> data = {'S', 'T', 'M', '3', '2', 0x00, 0xFF};
    std::string dump = hexDump(data, 0x20000000);

    EXPECT_EQ(dump.rfind("0x20000000: 53 54 4D 33 32 00 FF ", 0), 0u);
    EXPECT_NE(dump.find(" STM32..\n"), std::string::npos);
}

TEST(StringUtilsTest, HexDumpLines) {
    std::vector<uint8_t> data(20, 0x41);
    std::string dump = hexDump(data, 0x08000000);

    EXPECT_NE(dump.find("0x08000000: "), std::string::npos);
    EXPECT_NE(dump.find("0x08000010: "), std::string::npos);
    EXPECT_EQ(std::count(dump.begin(), dump.end(), '\n'), 2);
    EXPECT_TRUE(hexDump({}, 0).empty());
}

TEST(StringUtilsTest, HexDumpWrapsAt32Bits) {
    std::vector<uint8_t> data(32, 0x00);
    std::string dump = hexDump(data, 0xFFFFFFF0);

    EXPECT_EQ(dump.rfind("0xFFFFFFF0: ", 0), 0u);
    EXPECT_NE(dump.find("\n0x00000000: "), std::string::npos);
    EXPECT_EQ(dump.find("0x100000000"), std::string::npos);
}
