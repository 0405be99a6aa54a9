/* UTF-8 helpers over byte ranges that need not be NUL-terminated */
#pragma once
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* byte length of the sequence a lead byte starts; 1 for stray continuation or invalid bytes */
int utf8_sequence_length(unsigned char lead);

/* code points in the first len bytes */
size_t utf8_char_count(const char* utf8, size_t len);

/* byte offset of code point char_index, clamped to len */
size_t utf8_char_to_byte_offset(const char* utf8, size_t len, size_t char_index);

#ifdef __cplusplus
}
#endif
