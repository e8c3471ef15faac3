#include <gtest/gtest.h>
#include "string_utils.hpp"

TEST(StringUtilsTest, TrimCopy) {
    EXPECT_EQ(trim_copy("  Overview \t\n"), "Overview");
    EXPECT_EQ(trim_copy("   "), "");
    EXPECT_EQ(trim_copy(""), "");
}

TEST(StringUtilsTest, CollapseWhitespace) {
    EXPECT_EQ(collapse_whitespace("  1.1   Background\t\tand\nscope "), "1.1 Background and scope");
    EXPECT_EQ(collapse_whitespace(" \t "), "");
}

TEST(StringUtilsTest, UnicodeToUTF8) {
    EXPECT_EQ(UnicodeToUTF8('A'), "A");
    EXPECT_EQ(UnicodeToUTF8(0xE9), "\xC3\xA9");
    EXPECT_EQ(UnicodeToUTF8(0x20AC), "\xE2\x82\xAC");
    EXPECT_EQ(UnicodeToUTF8(0x1F600), "\xF0\x9F\x98\x80");
    // lone surrogate
    EXPECT_EQ(UnicodeToUTF8(0xD800), "\xEF\xBF\xBD");
}

TEST(StringUtilsTest, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("r\xC3\xA9sum\xC3\xA9"), 6u);
    EXPECT_EQ(utf8_length(""), 0u);
}

TEST(StringUtilsTest, IsAllCaps) {
    EXPECT_TRUE(is_all_caps("INTRODUCTION"));
    EXPECT_TRUE(is_all_caps("2. RESULTS AND DISCUSSION"));
    EXPECT_FALSE(is_all_caps("Introduction"));
    EXPECT_FALSE(is_all_caps("A"));
    EXPECT_FALSE(is_all_caps("1.2"));
}

TEST(StringUtilsTest, FormatOutlineRecordUsesFixedSchema) {
    PDF_Outline_Record record;
    record.title = "Annual Report 2024";
    PDF_Outline_Entry entry;
    entry.level = Heading_Level::H2;
    entry.text = "1.1 Background";
    entry.page = 2;
    entry.font_size = 14;
    record.outline.push_back(entry);

    const std::string expected =
        "{\n"
        "  \"title\": \"Annual Report 2024\",\n"
        "  \"outline\": [\n"
        "    {\n"
        "      \"level\": \"H2\",\n"
        "      \"text\": \"1.1 Background\",\n"
        "      \"page\": 2\n"
        "    }\n"
        "  ]\n"
        "}\n";
    EXPECT_EQ(format_outline_record(record), expected);
}

TEST(StringUtilsTest, FormatEmptyRecord) {
    PDF_Outline_Record record;
    EXPECT_EQ(format_outline_record(record), "{\n  \"title\": \"\",\n  \"outline\": []\n}\n");
}

TEST(StringUtilsTest, FormatKeepsUtf8AndReplacesInvalidBytes) {
    PDF_Outline_Record record;
    record.title = "Caf\xC3\xA9 \xFF";
    std::string json = format_outline_record(record);
    EXPECT_NE(json.find("Caf\xC3\xA9"), std::string::npos);
    EXPECT_EQ(json.find('\xFF'), std::string::npos);
}
