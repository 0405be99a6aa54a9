// xml_encoder.hpp - Entity escaping for DocBook character data and attributes

#ifndef SANDOC_XML_ENCODER_HPP
#define SANDOC_XML_ENCODER_HPP

#include <string>
#include <string_view>

namespace sandoc {

class XmlEncoder {
public:
    // & < > and " in character data
    static std::string escape(std::string_view text);

    // as escape(), plus line breaks and tabs so a double-quoted value
    // survives attribute-value normalisation
    static std::string escape_attribute(std::string_view text);

    static bool needs_escaping(std::string_view text, bool attribute = false);
};

} // namespace sandoc

#endif // SANDOC_XML_ENCODER_HPP
