#include "internal/util/xml.hpp"

#include <expat.h>

#include <memory>

#include "internal/util/errors.hpp"

namespace household::util {

namespace {

/*
  Builds an XmlElement tree from expat callbacks.

  open_ holds the chain of elements from the document node down to the one
  being filled. A parent's children vector only grows while the parent is on
  top of the chain, so pointers into it stay valid.
*/
class TreeBuilder {
 public:
  TreeBuilder() : parser_(XML_ParserCreate(nullptr), &XML_ParserFree) {
    if (!parser_) throw DecodeError("cannot allocate XML parser");
    open_.push_back(&document_);

    XML_SetUserData(parser_.get(), this);
    XML_SetElementHandler(parser_.get(), &TreeBuilder::OnStart, &TreeBuilder::OnEnd);
    XML_SetCharacterDataHandler(parser_.get(), &TreeBuilder::OnText);
  }

  XmlElement Parse(const std::string& text) {
    if (XML_Parse(parser_.get(), text.data(), static_cast<int>(text.size()), XML_TRUE) != XML_STATUS_OK) {
      throw DecodeError("malformed XML at line " + std::to_string(XML_GetCurrentLineNumber(parser_.get())) + ": " +
                        XML_ErrorString(XML_GetErrorCode(parser_.get())));
    }
    return std::move(document_);
  }

 private:
  static void OnStart(void* user_data, const XML_Char* name, const XML_Char** attributes) {
    auto* self   = static_cast<TreeBuilder*>(user_data);
    auto& parent = *self->open_.back();

    XmlElement element;
    element.name = name;
    for (int i = 0; attributes[i] != nullptr; i += 2) {
      element.attributes.emplace(attributes[i], attributes[i + 1]);
    }
    parent.children.push_back(std::move(element));
    self->open_.push_back(&parent.children.back());
  }

  static void OnEnd(void* user_data, const XML_Char*) {
    static_cast<TreeBuilder*>(user_data)->open_.pop_back();
  }

  static void OnText(void* user_data, const XML_Char* data, int length) {
    static_cast<TreeBuilder*>(user_data)->open_.back()->text.append(data, static_cast<std::size_t>(length));
  }

  std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)> parser_;
  XmlElement                                                   document_;
  std::vector<XmlElement*>                                     open_;
};

} // namespace

XmlElement ParseXml(const std::string& text) {
  TreeBuilder builder;
  return builder.Parse(text);
}

std::string_view LocalName(std::string_view name) {
  const auto colon = name.rfind(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

const XmlElement* FindChild(const XmlElement& node, std::string_view local) {
  for (const auto& child : node.children) {
    if (LocalName(child.name) == local) return &child;
  }
  return nullptr;
}

std::optional<std::string> FindAttribute(const XmlElement& node, std::string_view local) {
  for (const auto& [name, value] : node.attributes) {
    if (LocalName(name) == local) return value;
  }
  return std::nullopt;
}

} // namespace household::util
