#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace household::util {

/*
  One element of a parsed XML document.

  Names keep their namespace prefix as written. text is the concatenated
  character data directly inside the element, entities already decoded.
*/
struct XmlElement {
  std::string                        name;
  std::map<std::string, std::string> attributes;
  std::string                        text;
  std::vector<XmlElement>            children;
};

// Parses a whole document. The returned element is an unnamed document node
// whose only child is the root element. Throws DecodeError on malformed input.
XmlElement ParseXml(const std::string& text);

// "s:Envelope" -> "Envelope".
std::string_view LocalName(std::string_view name);

// First child whose local name matches, or nullptr.
const XmlElement* FindChild(const XmlElement& node, std::string_view local);

std::optional<std::string> FindAttribute(const XmlElement& node, std::string_view local);

} // namespace household::util
