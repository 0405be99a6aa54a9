#include <gtest/gtest.h>
#include <cstring>
#include <string>

extern "C" {
#include "../lib/utf.h"
}

static size_t count(const std::string& text) {
    return utf8_char_count(text.data(), text.size());
}

static size_t offset(const std::string& text, size_t index) {
    return utf8_char_to_byte_offset(text.data(), text.size(), index);
}

TEST(UtfTest, SequenceLength) {
    EXPECT_EQ(utf8_sequence_length('a'), 1);
    EXPECT_EQ(utf8_sequence_length(0xC3), 2);
    EXPECT_EQ(utf8_sequence_length(0xE2), 3);
    EXPECT_EQ(utf8_sequence_length(0xF0), 4);
    // continuation and invalid lead bytes advance by one
    EXPECT_EQ(utf8_sequence_length(0xA9), 1);
    EXPECT_EQ(utf8_sequence_length(0xFF), 1);
}

TEST(UtfTest, CharCount) {
    EXPECT_EQ(count(""), 0u);
    EXPECT_EQ(count("plain"), 5u);
    EXPECT_EQ(count("caf\xC3\xA9"), 4u);
    EXPECT_EQ(count("\xE2\x80\xA0\xE2\x80\xA1"), 2u);
    EXPECT_EQ(count("\xF0\x9F\x98\x80!"), 2u);
}

TEST(UtfTest, CountStopsAtLength) {
    const char* text = "caf\xC3\xA9 au lait";
    EXPECT_EQ(utf8_char_count(text, 5), 4u);
    EXPECT_EQ(utf8_char_count(text, strlen(text)), 12u);
}

TEST(UtfTest, ByteOffsets) {
    std::string text = "\xC3\xA9t\xC3\xA9";
    EXPECT_EQ(offset(text, 0), 0u);
    EXPECT_EQ(offset(text, 1), 2u);
    EXPECT_EQ(offset(text, 2), 3u);
    EXPECT_EQ(offset(text, 3), 5u);
    EXPECT_EQ(offset(text, 10), 5u);
}

TEST(UtfTest, TruncatedSequenceIsClamped) {
    std::string text = "a\xE2\x80";
    EXPECT_EQ(offset(text, 2), 3u);
    EXPECT_EQ(count(text), 2u);
}
