#ifndef GPML_XML_UTILS_H_
#define GPML_XML_UTILS_H_

#include <cstring>
#include <string>
#include <vector>

#include <tinyxml2.h>

namespace gpml {
namespace xml {

/// Element name without its namespace prefix ("bp:TITLE" -> "TITLE").
inline const char* localName(const tinyxml2::XMLElement* elem)
{
  const char* name = elem->Name();
  for (const char* p = name; *p; ++p)
  {
    if (*p == ':')
      return p + 1;
  }
  return name;
}

inline bool hasLocalName(const tinyxml2::XMLElement* elem, const char* name)
{
  return std::string(localName(elem)) == name;
}

/// First child whose local name matches, regardless of prefix.
inline const tinyxml2::XMLElement* firstChildLocal(const tinyxml2::XMLElement* parent, const char* name)
{
  if (!parent)
    return nullptr;
  for (const auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement())
  {
    if (hasLocalName(child, name))
      return child;
  }
  return nullptr;
}

inline std::vector<const tinyxml2::XMLElement*> childrenLocal(const tinyxml2::XMLElement* parent, const char* name)
{
  std::vector<const tinyxml2::XMLElement*> out;
  if (!parent)
    return out;
  for (const auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement())
  {
    if (hasLocalName(child, name))
      out.push_back(child);
  }
  return out;
}

/// Text content, empty when the element is missing or has no text.
inline std::string textOf(const tinyxml2::XMLElement* elem)
{
  if (!elem || !elem->GetText())
    return {};
  return elem->GetText();
}

/// Text content of the first child with the given local name.
inline std::string childText(const tinyxml2::XMLElement* parent, const char* name)
{
  return textOf(firstChildLocal(parent, name));
}

/// Attribute lookup that also matches a prefixed name ("rdf:id" for "id").
inline const char* attributeLocal(const tinyxml2::XMLElement* elem, const char* name)
{
  if (const char* v = elem->Attribute(name))
    return v;
  for (const auto* a = elem->FirstAttribute(); a; a = a->Next())
  {
    const char* n = a->Name();
    const char* colon = std::strchr(n, ':');
    if (colon && std::string(colon + 1) == name)
      return a->Value();
  }
  return nullptr;
}

/// Serialize a document, with an XML declaration when it has one.
inline std::string printDocument(const tinyxml2::XMLDocument& doc, bool pretty = true)
{
  tinyxml2::XMLPrinter printer(nullptr, /*compact=*/!pretty);
  doc.Print(&printer);
  return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() > 0 ? printer.CStrSize() - 1 : 0));
}

/// Shortest text that reads back to the same double ("1", "12.5", "0.1").
std::string formatNumber(double value);

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_UTILS_H_
