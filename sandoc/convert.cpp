#include "convert.hpp"
#include "input/input.hpp"
#include "format/format.hpp"
#include "rewrite.hpp"
#include "../lib/file.h"
#include "../lib/log.h"
#include "../lib/strbuf.h"

#include <stdlib.h>
#include <string.h>
#include <strings.h>

namespace sandoc {

const char* convert_status_message(ConvertStatus status) {
    switch (status) {
        case ConvertStatus::Ok:                return "ok";
        case ConvertStatus::UnsupportedInput:  return "input format is not supported by this converter";
        case ConvertStatus::UnsupportedOutput: return "output format is not supported by this converter";
        case ConvertStatus::WriteFailed:       return "failed to write output";
        case ConvertStatus::ReadFailed:        return "failed to read input";
    }
    return "unknown status";
}

struct FormatName {
    const char* name;
    int format;
};

static const FormatName input_names[] = {
    {"markdown", (int)InputFormat::Markdown},
    {"md", (int)InputFormat::Markdown},
    {"rst", (int)InputFormat::ReStructuredText},
    {"restructuredtext", (int)InputFormat::ReStructuredText},
    {"asciidoc", (int)InputFormat::AsciiDoc},
    {"adoc", (int)InputFormat::AsciiDoc},
};

static const FormatName output_names[] = {
    {"html", (int)OutputFormat::Html},
    {"htm", (int)OutputFormat::Html},
    {"docbook", (int)OutputFormat::DocBook},
    {"xml", (int)OutputFormat::DocBook},
    {"pdf", (int)OutputFormat::Pdf},
    {"pretty", (int)OutputFormat::Pretty},
    {"ast", (int)OutputFormat::Pretty},
};

static bool lookup_name(const FormatName* table, size_t count, std::string_view name, int* out) {
    for (size_t i = 0; i < count; i++) {
        if (name.size() == strlen(table[i].name) && strncasecmp(name.data(), table[i].name, name.size()) == 0) {
            *out = table[i].format;
            return true;
        }
    }
    return false;
}

bool input_format_from_name(std::string_view name, InputFormat* out) {
    int format;
    if (!lookup_name(input_names, sizeof(input_names) / sizeof(input_names[0]), name, &format)) return false;
    if (out) *out = static_cast<InputFormat>(format);
    return true;
}

bool output_format_from_name(std::string_view name, OutputFormat* out) {
    int format;
    if (!lookup_name(output_names, sizeof(output_names) / sizeof(output_names[0]), name, &format)) return false;
    if (out) *out = static_cast<OutputFormat>(format);
    return true;
}

const char* input_format_name(InputFormat format) {
    switch (format) {
        case InputFormat::Markdown:         return "markdown";
        case InputFormat::ReStructuredText: return "rst";
        case InputFormat::AsciiDoc:         return "asciidoc";
    }
    return "markdown";
}

const char* output_format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::Html:    return "html";
        case OutputFormat::DocBook: return "docbook";
        case OutputFormat::Pdf:     return "pdf";
        case OutputFormat::Pretty:  return "pretty";
    }
    return "docbook";
}

static std::string_view path_extension(std::string_view path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) return {};
    return path.substr(dot + 1);
}

static bool extension_is(std::string_view ext, const char* name) {
    return ext.size() == strlen(name) && strncasecmp(ext.data(), name, ext.size()) == 0;
}

InputFormat input_format_for_path(std::string_view path, InputFormat fallback) {
    std::string_view ext = path_extension(path);
    if (extension_is(ext, "md") || extension_is(ext, "markdown")) return InputFormat::Markdown;
    if (extension_is(ext, "rst") || extension_is(ext, "rest")) return InputFormat::ReStructuredText;
    if (extension_is(ext, "adoc") || extension_is(ext, "asciidoc")) return InputFormat::AsciiDoc;
    return fallback;
}

OutputFormat output_format_for_path(std::string_view path, OutputFormat fallback) {
    std::string_view ext = path_extension(path);
    if (extension_is(ext, "html") || extension_is(ext, "htm")) return OutputFormat::Html;
    if (extension_is(ext, "xml") || extension_is(ext, "dbk")) return OutputFormat::DocBook;
    if (extension_is(ext, "pdf")) return OutputFormat::Pdf;
    return fallback;
}

ElementPtr parse_document(std::string_view text, InputFormat format) {
    RawDocument raw;
    switch (format) {
    case InputFormat::Markdown:
        raw = parse_markdown(text);
        break;
    case InputFormat::ReStructuredText:
        raw = parse_rst(text);
        break;
    case InputFormat::AsciiDoc:
        log_info("convert: asciidoc input is handled by an external backend");
        return nullptr;
    }
    return rewrite_document(raw);
}

static ConvertStatus render_document(const ElementPtr& document, const ConvertOptions& options, StrBuf* sb) {
    switch (options.to) {
    case OutputFormat::DocBook: {
        DocBookOptions docbook;
        docbook.title = options.title;
        docbook.message_level = options.message_level;
        format_docbook(sb, document, docbook);
        return ConvertStatus::Ok;
    }
    case OutputFormat::Pretty:
        format_pretty(sb, document);
        return ConvertStatus::Ok;
    case OutputFormat::Html:
    case OutputFormat::Pdf:
        log_info("convert: %s output is handled by an external backend", output_format_name(options.to));
        return ConvertStatus::UnsupportedOutput;
    }
    return ConvertStatus::UnsupportedOutput;
}

static bool is_supported_output(OutputFormat format) {
    return format == OutputFormat::DocBook || format == OutputFormat::Pretty;
}

ConvertStatus convert_to_string(std::string_view text, const ConvertOptions& options, std::string* out) {
    log_debug("convert: %zu bytes from %s to %s", text.size(), input_format_name(options.from),
              output_format_name(options.to));
    if (options.from == InputFormat::AsciiDoc) return ConvertStatus::UnsupportedInput;
    if (!is_supported_output(options.to)) return ConvertStatus::UnsupportedOutput;

    ElementPtr document = parse_document(text, options.from);
    if (!document) return ConvertStatus::UnsupportedInput;

    StrBuf* sb = strbuf_new_cap(text.size() * 2);
    if (!sb) {
        log_error("convert: failed to allocate output buffer");
        return ConvertStatus::WriteFailed;
    }
    ConvertStatus status = render_document(document, options, sb);
    if (status == ConvertStatus::Ok) out->assign(sb->str, sb->length);
    strbuf_free(sb);
    return status;
}

ConvertStatus convert(std::string_view text, const ConvertOptions& options, FILE* out) {
    if (!out) return ConvertStatus::WriteFailed;
    std::string result;
    ConvertStatus status = convert_to_string(text, options, &result);
    if (status != ConvertStatus::Ok) return status;

    size_t written = fwrite(result.data(), 1, result.size(), out);
    if (written != result.size() || fflush(out) != 0 || ferror(out)) {
        log_error("convert: wrote %zu of %zu bytes", written, result.size());
        return ConvertStatus::WriteFailed;
    }
    return ConvertStatus::Ok;
}

ConvertStatus read_inputs(const std::vector<std::string>& paths, std::string* text) {
    text->clear();
    for (size_t i = 0; i < paths.size(); i++) {
        size_t length = 0;
        char* content = read_text_file_len(paths[i].c_str(), &length);
        if (!content) return ConvertStatus::ReadFailed;
        if (i > 0) text->append("\n\n");
        text->append(content, length);
        free(content);
    }
    return ConvertStatus::Ok;
}

} // namespace sandoc
