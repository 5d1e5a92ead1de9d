#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace xmlio {

struct XmlParseError : std::runtime_error {
    XmlParseError(const std::string& what, long line, long column)
        : std::runtime_error(what), line(line), column(column) {}

    long line;
    long column;
};

// Converts an XML document (UTF-8) into a nested object/array tree:
//   {"ROOT": {"$": {attr: value}, "CHILD": [ ... ], "_": "text"}}
// - the root element is the single top-level key
// - every child element name maps to an array, in document order
// - attributes go under "$", text under "_" when the element has
//   attributes or children; otherwise the element collapses to its text
// - whitespace-only text is dropped unless it is all the element holds
// Throws XmlParseError on malformed input or elements nested deeper than 256.
nlohmann::json parse_xml(const std::string& xml);

} // namespace xmlio
