#ifndef FILE_H
#define FILE_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// reads a whole text file into a malloc'ed, null-terminated buffer; NULL on failure
char* read_text_file(const char *filename);

// same, also reporting the byte length (files may contain NUL bytes)
char* read_text_file_len(const char *filename, size_t *out_len);

#ifdef __cplusplus
}
#endif

#endif // FILE_H
