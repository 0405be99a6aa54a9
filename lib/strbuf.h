#ifndef STRING_BUFFER_H
#define STRING_BUFFER_H

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <stdarg.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Growable byte buffer the renderers write into. str stays null-terminated,
 * length excludes the terminator. Appends that cannot grow the buffer leave
 * it unchanged.
 */
typedef struct {
    char* str;
    size_t length;
    size_t capacity;
} StrBuf;

StrBuf* strbuf_new();
// at least size bytes up front; small requests get the default capacity
StrBuf* strbuf_new_cap(size_t size);
void strbuf_free(StrBuf *sb);
// empties the buffer and keeps its memory
void strbuf_reset(StrBuf *sb);
// grows to the next power of two >= min_capacity; false on allocation failure
bool strbuf_ensure_cap(StrBuf *sb, size_t min_capacity);

void strbuf_append_str(StrBuf *sb, const char *str);
void strbuf_append_str_n(StrBuf *sb, const char *str, size_t n);
void strbuf_append_char(StrBuf *sb, char c);
void strbuf_append_char_n(StrBuf *sb, char c, size_t n);
void strbuf_append_int(StrBuf *buf, int value);
void strbuf_append_format(StrBuf *sb, const char *format, ...);
void strbuf_vappend_format(StrBuf *sb, const char *format, va_list args);
// shortens to new_length; no-op when already shorter
void strbuf_truncate(StrBuf *sb, size_t new_length);

#ifdef __cplusplus
}
#endif

#endif
