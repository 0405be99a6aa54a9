// convert.hpp - Conversion entry point: parse, rewrite and render one text blob

#ifndef SANDOC_CONVERT_HPP
#define SANDOC_CONVERT_HPP

#include "element.hpp"

#include <stdio.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandoc {

enum class InputFormat : uint8_t {
    Markdown,
    ReStructuredText,
    AsciiDoc,       // handled by an external backend
};

enum class OutputFormat : uint8_t {
    Html,           // external
    DocBook,
    Pdf,            // external, consumes the DocBook output
    Pretty,
};

enum class ConvertStatus : uint8_t {
    Ok,
    UnsupportedInput,
    UnsupportedOutput,
    WriteFailed,
    ReadFailed,
};

const char* convert_status_message(ConvertStatus status);

struct ConvertOptions {
    InputFormat from = InputFormat::Markdown;
    OutputFormat to = OutputFormat::DocBook;
    std::string title;
    // minimum severity of messages shown in the output; none hides all
    std::optional<MessageLevel> message_level;
};

// case-insensitive format names: markdown|md, rst|restructuredtext, asciidoc|adoc
bool input_format_from_name(std::string_view name, InputFormat* out);
// html|htm, docbook|xml, pdf, pretty|ast
bool output_format_from_name(std::string_view name, OutputFormat* out);
const char* input_format_name(InputFormat format);
const char* output_format_name(OutputFormat format);

// format implied by a file extension, with the given default when unknown
InputFormat input_format_for_path(std::string_view path, InputFormat fallback = InputFormat::Markdown);
OutputFormat output_format_for_path(std::string_view path, OutputFormat fallback = OutputFormat::DocBook);

// parse and rewrite only; nullptr for formats handled outside the core
ElementPtr parse_document(std::string_view text, InputFormat format);

// complete pipeline into a string
ConvertStatus convert_to_string(std::string_view text, const ConvertOptions& options, std::string* out);

/**
 * Complete pipeline written to out. The sink belongs to the caller: it is
 * written sequentially and flushed, never closed.
 */
ConvertStatus convert(std::string_view text, const ConvertOptions& options, FILE* out);

// reads and joins the files with a blank line between them
ConvertStatus read_inputs(const std::vector<std::string>& paths, std::string* text);

} // namespace sandoc

#endif // SANDOC_CONVERT_HPP
