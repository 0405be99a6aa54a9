// names.hpp - Identifier helpers shared by parsers and rewrite rules

#ifndef SANDOC_NAMES_HPP
#define SANDOC_NAMES_HPP

#include <string>
#include <string_view>

namespace sandoc {

// lower-cased flattened text with runs of non-alphanumerics collapsed to '-'
// and leading/trailing '-' trimmed: "The Title!" -> "the-title"
std::string slugify(std::string_view text);

// reference names compare case-insensitively with whitespace runs collapsed
std::string normalize_reference_name(std::string_view name);

} // namespace sandoc

#endif // SANDOC_NAMES_HPP
