#include "convert.hpp"
#include "../lib/log.h"

#include <unistd.h>  // for access
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

static void print_help(const char* program) {
    printf("sandoc - lightweight markup to DocBook converter\n\n");
    printf("Usage: %s [options] <input>...\n\n", program);
    printf("Options:\n");
    printf("  -f, --from <format>       input format: markdown (md), rst (restructuredtext), asciidoc (adoc)\n");
    printf("  -t, --to <format>         output format: docbook (xml), pretty (ast), html, pdf\n");
    printf("  -o, --output <file>       output file (default: stdout)\n");
    printf("  --title <title>           document title (default: first input file name)\n");
    printf("  --message-level <level>   show diagnostics of this level or above:\n");
    printf("                            debug, info, warning, error, fatal\n");
    printf("  -h, --help                show this help\n\n");
    printf("Multiple inputs are joined with a blank line between them. Without -f/-t the\n");
    printf("formats follow the file extensions (markdown and docbook by default).\n\n");
    printf("Examples:\n");
    printf("  %s README.rst -o readme.xml\n", program);
    printf("  %s -t pretty notes.md\n", program);
}

int main(int argc, char* argv[]) {
    // initialize logging with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    const char* from_format = NULL;
    const char* to_format = NULL;
    const char* output_file = NULL;
    const char* title = NULL;
    const char* message_level = NULL;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            log_fini();
            return 0;
        } else if (strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--from") == 0) {
            if (i + 1 < argc) {
                from_format = argv[++i];
            } else {
                fprintf(stderr, "Error: -f option requires a format argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--to") == 0) {
            if (i + 1 < argc) {
                to_format = argv[++i];
            } else {
                fprintf(stderr, "Error: -t option requires a format argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 < argc) {
                output_file = argv[++i];
            } else {
                fprintf(stderr, "Error: -o option requires an output file argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "--title") == 0) {
            if (i + 1 < argc) {
                title = argv[++i];
            } else {
                fprintf(stderr, "Error: --title option requires an argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "--message-level") == 0) {
            if (i + 1 < argc) {
                message_level = argv[++i];
            } else {
                fprintf(stderr, "Error: --message-level option requires a level argument\n");
                return 1;
            }
        } else if (argv[i][0] != '-' || argv[i][1] == '\0') {
            inputs.push_back(argv[i]);
        } else {
            fprintf(stderr, "Error: Unknown option '%s'\n", argv[i]);
            return 1;
        }
    }

    if (inputs.empty()) {
        fprintf(stderr, "Error: At least one input file is required\n");
        fprintf(stderr, "Use '%s --help' for more information\n", argv[0]);
        return 1;
    }

    sandoc::ConvertOptions options;
    if (from_format) {
        if (!sandoc::input_format_from_name(from_format, &options.from)) {
            fprintf(stderr, "Error: Unknown input format '%s'\n", from_format);
            return 1;
        }
    } else {
        options.from = sandoc::input_format_for_path(inputs[0]);
    }
    if (to_format) {
        if (!sandoc::output_format_from_name(to_format, &options.to)) {
            fprintf(stderr, "Error: Unknown output format '%s'\n", to_format);
            return 1;
        }
    } else if (output_file) {
        options.to = sandoc::output_format_for_path(output_file);
    }
    if (message_level) {
        sandoc::MessageLevel level;
        if (!sandoc::message_level_from_name(message_level, &level)) {
            fprintf(stderr, "Error: Unknown message level '%s'\n", message_level);
            return 1;
        }
        options.message_level = level;
    }
    options.title = title ? title : inputs[0];

    log_debug("converting %zu input(s) from %s to %s", inputs.size(),
              sandoc::input_format_name(options.from), sandoc::output_format_name(options.to));

    std::string text;
    sandoc::ConvertStatus status = sandoc::read_inputs(inputs, &text);
    if (status == sandoc::ConvertStatus::Ok) {
        FILE* out = stdout;
        if (output_file) {
            out = fopen(output_file, "wb");
            if (!out) {
                fprintf(stderr, "Error: Cannot open output file '%s'\n", output_file);
                log_fini();
                return 1;
            }
        }
        status = sandoc::convert(text, options, out);
        if (out != stdout && fclose(out) != 0 && status == sandoc::ConvertStatus::Ok) {
            status = sandoc::ConvertStatus::WriteFailed;
        }
    }

    if (status != sandoc::ConvertStatus::Ok) {
        fprintf(stderr, "Error: %s\n", sandoc::convert_status_message(status));
        log_fini();
        return 1;
    }
    log_fini();
    return 0;
}
