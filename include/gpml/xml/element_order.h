#ifndef GPML_XML_ELEMENT_ORDER_H_
#define GPML_XML_ELEMENT_ORDER_H_

#include <tinyxml2.h>

#include <gpml/schema_version.h>

namespace gpml {
namespace xml {

/// Child order mandated by each schema, as a list of tag names. Tags not in
/// the list sort after all listed ones.
#define GPML_2013A_ELEMENT_ORDER(X)                                                                                    \
  X(Comment)                                                                                                           \
  X(BiopaxRef)                                                                                                         \
  X(Attribute)                                                                                                         \
  X(Graphics)                                                                                                          \
  X(Point)                                                                                                             \
  X(Anchor)                                                                                                            \
  X(Xref)                                                                                                              \
  X(DataNode)                                                                                                          \
  X(State)                                                                                                             \
  X(Interaction)                                                                                                       \
  X(GraphicalLine)                                                                                                     \
  X(Label)                                                                                                             \
  X(Shape)                                                                                                             \
  X(Group)                                                                                                             \
  X(InfoBox)                                                                                                           \
  X(Legend)                                                                                                            \
  X(Biopax)

#define GPML_2021_ELEMENT_ORDER(X)                                                                                     \
  X(Xref)                                                                                                              \
  X(Url)                                                                                                               \
  X(Description)                                                                                                       \
  X(Authors)                                                                                                           \
  X(Author)                                                                                                            \
  X(Waypoints)                                                                                                         \
  X(Point)                                                                                                             \
  X(Anchor)                                                                                                            \
  X(States)                                                                                                            \
  X(State)                                                                                                             \
  X(Graphics)                                                                                                          \
  X(Comment)                                                                                                           \
  X(Property)                                                                                                          \
  X(AnnotationRef)                                                                                                     \
  X(CitationRef)                                                                                                       \
  X(EvidenceRef)                                                                                                       \
  X(DataNodes)                                                                                                         \
  X(Interactions)                                                                                                      \
  X(GraphicalLines)                                                                                                    \
  X(Labels)                                                                                                            \
  X(Shapes)                                                                                                            \
  X(Groups)                                                                                                            \
  X(Annotations)                                                                                                       \
  X(Citations)                                                                                                         \
  X(Evidences)

/// Position of a tag in the version's order table; unknown tags rank last.
int tagPrecedence(SchemaVersion version, const char* tag);

/// Stable-sort the element children of parent by tag precedence. Relative
/// order within one tag is kept. Non-element children (comments, text) end
/// up ahead of the sorted elements.
void sortChildren(tinyxml2::XMLElement* parent, SchemaVersion version);

/// sortChildren applied to parent and every descendant.
void sortChildrenRecursive(tinyxml2::XMLElement* parent, SchemaVersion version);

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_ELEMENT_ORDER_H_
