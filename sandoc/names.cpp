#include "names.hpp"

#include <ctype.h>
#include <re2/re2.h>

namespace sandoc {

std::string slugify(std::string_view text) {
    static const re2::RE2 non_alnum("[^a-zA-Z0-9]+");
    static const re2::RE2 leading_dash("^-");
    static const re2::RE2 trailing_dash("-$");

    std::string slug(text);
    re2::RE2::GlobalReplace(&slug, non_alnum, "-");
    re2::RE2::Replace(&slug, leading_dash, "");
    re2::RE2::Replace(&slug, trailing_dash, "");
    for (char& c : slug) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return slug;
}

std::string normalize_reference_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    bool pending_space = false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (isspace(uc)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(tolower(uc)));
    }
    return out;
}

} // namespace sandoc
