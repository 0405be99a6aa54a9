#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <string>
#include <unistd.h>

extern "C" {
#include "../lib/log.h"
}

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_fini();
        ASSERT_EQ(log_init(NULL), LOG_OK);
    }

    void TearDown() override {
        log_fini();
    }

    static std::string readAll(FILE* f) {
        std::string content;
        rewind(f);
        char buf[256];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), f)) > 0) content.append(buf, n);
        return content;
    }
};

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_NOTICE), "NOTICE");
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_FATAL), "FATAL");
    EXPECT_STREQ(log_level_to_string(7), "UNKNOWN");

    EXPECT_EQ(log_level_from_string("info"), LOG_LEVEL_INFO);
    EXPECT_EQ(log_level_from_string("Warning"), LOG_LEVEL_WARN);
    EXPECT_EQ(log_level_from_string("WARN"), LOG_LEVEL_WARN);
    EXPECT_EQ(log_level_from_string("verbose"), -1);
    EXPECT_EQ(log_level_from_string(NULL), -1);
}

TEST_F(LogTest, DefaultCategory) {
    ASSERT_NE(log_default_category, nullptr);
    EXPECT_EQ(log_get_category("default"), log_default_category);
    EXPECT_EQ(log_default_category->level, LOG_LEVEL_WARN);
    EXPECT_EQ(log_get_category("missing"), nullptr);
    EXPECT_EQ(log_get_category(NULL), nullptr);
}

TEST_F(LogTest, LevelEnabled) {
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_ERROR));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_WARN));
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_INFO));

    log_set_level(log_default_category, LOG_LEVEL_DEBUG);
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_DEBUG));

    log_default_category->enabled = 0;
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_FATAL));
    EXPECT_FALSE(log_level_enabled(NULL, LOG_LEVEL_FATAL));
}

TEST_F(LogTest, MessagesGoToCategoryOutput) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    log_set_output(log_default_category, out);

    log_info("hidden %d", 1);
    log_error("shown %s", "here");
    log_warn("also %d", 2);

    EXPECT_EQ(readAll(out), "[ERROR] shown here\n[WARN] also 2\n");
    log_set_output(log_default_category, stderr);
    fclose(out);
}

// ---------------------------------------------------------------------------
// configuration
// ---------------------------------------------------------------------------

TEST_F(LogTest, ConfigRulesSetLevels) {
    const char* config =
        "[global]\n"
        "ignored.DEBUG >stdout\n"
        "[rules]\n"
        "# comment line\n"
        "default.DEBUG >stderr\n"
        "rewrite.INFO >stdout  # trailing comment\n";
    EXPECT_EQ(log_parse_config_string(config), LOG_OK);

    EXPECT_EQ(log_default_category->level, LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_default_category->output, stderr);
    log_category_t* rewrite = log_get_category("rewrite");
    ASSERT_NE(rewrite, nullptr);
    EXPECT_EQ(rewrite->level, LOG_LEVEL_INFO);
    EXPECT_EQ(rewrite->output, stdout);
    EXPECT_EQ(log_get_category("ignored"), nullptr);
}

TEST_F(LogTest, NamedCategoryFallsBackToDefault) {
    EXPECT_EQ(log_category_or_default("rst"), log_default_category);
    EXPECT_EQ(log_category_or_default(NULL), log_default_category);

    ASSERT_EQ(log_parse_config_string("[rules]\nrst.DEBUG >stdout\n"), LOG_OK);
    log_category_t* rst = log_category_or_default("rst");
    ASSERT_NE(rst, nullptr);
    EXPECT_NE(rst, log_default_category);
    EXPECT_STREQ(rst->name, "rst");
    EXPECT_EQ(rst->level, LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_category_or_default("markdown"), log_default_category);
}

TEST_F(LogTest, ConfigErrors) {
    EXPECT_EQ(log_parse_config_string("[rules]\ndefault.LOUD >stdout\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("[rules]\nnodot >stdout\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("[rules]\ndefault.INFO somewhere\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("[rules]\ndefault.INFO \"/nonexistent/dir/x.log\"\n"), LOG_WRITE_FAIL);
    EXPECT_EQ(log_parse_config_string(NULL), LOG_OK);
}

TEST_F(LogTest, ConfigFileOutput) {
    char path[] = "/tmp/sandoc_log_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    std::string config = std::string("[rules]\nfile.DEBUG \"") + path + "\"\n";
    ASSERT_EQ(log_init(config.c_str()), LOG_OK);
    log_category_t* cat = log_get_category("file");
    ASSERT_NE(cat, nullptr);
    clog_debug(cat, "value=%d", 42);
    clog_info(cat, "done");
    log_fini();

    FILE* f = fopen(path, "r");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(readAll(f), "[DEBUG] value=42\n[INFO] done\n");
    fclose(f);
    unlink(path);
}

TEST_F(LogTest, MissingConfigFile) {
    EXPECT_EQ(log_parse_config_file("/nonexistent/sandoc/log.conf"), LOG_INIT_FAIL);
}
