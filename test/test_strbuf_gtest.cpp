#include <gtest/gtest.h>
#include <cstring>
#include <string>

extern "C" {
#include "../lib/strbuf.h"
}

class StrBufTest : public ::testing::Test {
protected:
    void SetUp() override {
        sb = strbuf_new();
        ASSERT_NE(sb, nullptr);
    }

    void TearDown() override {
        strbuf_free(sb);
    }

    StrBuf* sb;
};

TEST_F(StrBufTest, TestNew) {
    ASSERT_NE(sb->str, nullptr) << "String buffer should be allocated";
    ASSERT_EQ(sb->length, 0u);
    ASSERT_GT(sb->capacity, 0u);
    ASSERT_EQ(sb->str[0], '\0') << "Buffer should be null-terminated";
}

TEST_F(StrBufTest, TestNewCap) {
    StrBuf* big = strbuf_new_cap(1000);
    ASSERT_NE(big, nullptr);
    ASSERT_GE(big->capacity, 1000u);
    strbuf_free(big);

    // a zero request still gets a usable buffer
    StrBuf* small = strbuf_new_cap(0);
    ASSERT_NE(small, nullptr);
    ASSERT_GT(small->capacity, 0u);
    strbuf_append_str(small, "x");
    ASSERT_STREQ(small->str, "x");
    strbuf_free(small);
}

TEST_F(StrBufTest, TestAppendStr) {
    strbuf_append_str(sb, "Hello");
    strbuf_append_str(sb, " World");
    ASSERT_STREQ(sb->str, "Hello World");
    ASSERT_EQ(sb->length, 11u);

    strbuf_append_str(sb, NULL);
    strbuf_append_str_n(sb, "!?", 1);
    ASSERT_STREQ(sb->str, "Hello World!");
}

TEST_F(StrBufTest, TestAppendChars) {
    strbuf_append_char(sb, 'a');
    strbuf_append_char_n(sb, '-', 3);
    strbuf_append_char_n(sb, 'z', 0);
    ASSERT_STREQ(sb->str, "a---");
    ASSERT_EQ(sb->length, 4u);
}

TEST_F(StrBufTest, TestAppendIntAndFormat) {
    strbuf_append_int(sb, -42);
    strbuf_append_format(sb, " %s=%zu", "len", (size_t)7);
    ASSERT_STREQ(sb->str, "-42 len=7");
}

TEST_F(StrBufTest, TestReallocationKeepsContent) {
    std::string expected;
    for (int i = 0; i < 500; i++) {
        strbuf_append_str(sb, "chunk-");
        strbuf_append_int(sb, i);
        expected += "chunk-" + std::to_string(i);
    }
    ASSERT_EQ(sb->length, expected.size());
    ASSERT_EQ(std::string(sb->str, sb->length), expected);
    ASSERT_GT(sb->capacity, sb->length);
}

TEST_F(StrBufTest, TestEnsureCap) {
    ASSERT_TRUE(strbuf_ensure_cap(sb, 10));
    size_t before = sb->capacity;
    ASSERT_TRUE(strbuf_ensure_cap(sb, before + 1));
    ASSERT_GE(sb->capacity, before + 1);
    ASSERT_FALSE(strbuf_ensure_cap(NULL, 10));
}

TEST_F(StrBufTest, TestResetAndTruncate) {
    strbuf_append_str(sb, "Hello World");
    strbuf_truncate(sb, 5);
    ASSERT_STREQ(sb->str, "Hello");
    strbuf_truncate(sb, 50);
    ASSERT_STREQ(sb->str, "Hello");

    size_t cap = sb->capacity;
    strbuf_reset(sb);
    ASSERT_EQ(sb->length, 0u);
    ASSERT_EQ(sb->str[0], '\0');
    ASSERT_EQ(sb->capacity, cap);
}
