/* sandoc log library - zlog-compatible API with log_ prefix */
#ifndef LOG_H
#define LOG_H

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Return codes */
#define LOG_OK              0
#define LOG_WRONG_FORMAT   -3
#define LOG_WRITE_FAIL     -4
#define LOG_INIT_FAIL      -5
#define LOG_CATEGORY_NOT_FOUND -6

/* Log levels */
typedef enum {
    LOG_LEVEL_DEBUG = 20,
    LOG_LEVEL_INFO = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN = 80,
    LOG_LEVEL_ERROR = 100,
    LOG_LEVEL_FATAL = 120
} log_level;

/* log category structure */
typedef struct log_category_s {
    char name[64];      /* category name */
    int level;          /* current log level */
    FILE *output;       /* output stream (stdout, stderr, or file) */
    int owns_output;    /* output was opened from a config path */
    int enabled;        /* whether this category is enabled */
} log_category_t;

/*
 * Setup. The "default" category always exists after log_init and starts at
 * WARN on stderr. A config string holds zlog-style rules under [rules]:
 *
 *   [rules]
 *   default.INFO   >stderr
 *   rewrite.DEBUG  "/tmp/sandoc-rewrite.log"
 *
 * The parsers log under "rst" and "markdown", the reference resolver under
 * "rewrite"; a category without a rule writes through the default one.
 */
int log_init(const char *config);
void log_fini(void);
log_category_t* log_get_category(const char *cname);
/* the named category when a rule configured it, otherwise the default one */
log_category_t* log_category_or_default(const char *cname);
int log_parse_config_file(const char *filename);
int log_parse_config_string(const char *config);

/* logging into a named category */
int clog_error(log_category_t *category, const char *format, ...);
int clog_warn(log_category_t *category, const char *format, ...);
int clog_info(log_category_t *category, const char *format, ...);
int clog_debug(log_category_t *category, const char *format, ...);

/* logging into log_default_category */
extern log_category_t *log_default_category;
int log_fatal(const char *format, ...);
int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_notice(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);

/* category state; a NULL or disabled category logs nothing */
int log_level_enabled(log_category_t *category, const int level);
void log_set_level(log_category_t *category, int level);
/* replaces (and closes, when opened from a config path) the current output */
void log_set_output(log_category_t *category, FILE *output);
void log_enable_timestamps(int enable);

/* "DEBUG" .. "FATAL"; from_string is case-insensitive and returns -1 when unknown */
const char* log_level_to_string(int level);
int log_level_from_string(const char *name);

#ifdef __cplusplus
}
#endif

#endif /* LOG_H */
