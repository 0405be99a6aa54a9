#include "xml_encoder.hpp"

namespace sandoc {

// entity for c, or nullptr when c is written as is
static const char* xml_entity(char c, bool attribute) {
    switch (c) {
        case '&':  return "&amp;";
        case '<':  return "&lt;";
        case '>':  return "&gt;";
        case '"':  return "&quot;";
        case '\n': return attribute ? "&#10;" : nullptr;
        case '\r': return attribute ? "&#13;" : nullptr;
        case '\t': return attribute ? "&#9;" : nullptr;
        default:   return nullptr;
    }
}

static std::string encode(std::string_view text, bool attribute) {
    if (!XmlEncoder::needs_escaping(text, attribute)) return std::string(text);

    std::string result;
    result.reserve(text.size() + text.size() / 4);
    for (char c : text) {
        const char* entity = xml_entity(c, attribute);
        if (entity) result += entity;
        else result += c;
    }
    return result;
}

std::string XmlEncoder::escape(std::string_view text) {
    return encode(text, false);
}

std::string XmlEncoder::escape_attribute(std::string_view text) {
    return encode(text, true);
}

bool XmlEncoder::needs_escaping(std::string_view text, bool attribute) {
    for (char c : text) {
        if (xml_entity(c, attribute)) return true;
    }
    return false;
}

} // namespace sandoc
