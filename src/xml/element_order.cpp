#include <gpml/xml/element_order.h>

#include <algorithm>
#include <cstring>
#include <vector>

#include <gpml/xml/utils.h>

namespace gpml {
namespace xml {

namespace {

#define GPML_ORDER_ENTRY(tag) #tag,

const char* const kOrder2013a[] = { GPML_2013A_ELEMENT_ORDER(GPML_ORDER_ENTRY) };
const char* const kOrder2021[] = { GPML_2021_ELEMENT_ORDER(GPML_ORDER_ENTRY) };

#undef GPML_ORDER_ENTRY

template <size_t N>
int indexOf(const char* const (&table)[N], const char* tag)
{
  for (size_t i = 0; i < N; ++i)
  {
    if (std::strcmp(table[i], tag) == 0)
      return static_cast<int>(i);
  }
  return static_cast<int>(N);
}

}  // namespace

int tagPrecedence(SchemaVersion version, const char* tag)
{
  return version == SchemaVersion::Gpml2013a ? indexOf(kOrder2013a, tag) : indexOf(kOrder2021, tag);
}

void sortChildren(tinyxml2::XMLElement* parent, SchemaVersion version)
{
  if (!parent)
    return;

  std::vector<tinyxml2::XMLElement*> children;
  for (auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement())
    children.push_back(child);

  std::stable_sort(children.begin(), children.end(),
                   [version](const tinyxml2::XMLElement* a, const tinyxml2::XMLElement* b) {
                     return tagPrecedence(version, localName(a)) < tagPrecedence(version, localName(b));
                   });

  // Re-inserting a linked node unlinks it first, so this reorders in place.
  for (auto* child : children)
    parent->InsertEndChild(child);
}

void sortChildrenRecursive(tinyxml2::XMLElement* parent, SchemaVersion version)
{
  if (!parent)
    return;
  sortChildren(parent, version);
  for (auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement())
    sortChildrenRecursive(child, version);
}

}  // namespace xml
}  // namespace gpml
