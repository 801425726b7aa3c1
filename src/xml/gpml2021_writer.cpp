#include <gpml/xml/gpml2021_writer.h>

#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>

#include <gpml/errors.h>
#include <gpml/logging.h>
#include <gpml/model/coordinates.h>
#include <gpml/xml/attribute_schema.h>
#include <gpml/xml/codec_common.h>
#include <gpml/xml/element_order.h>
#include <gpml/xml/utils.h>

namespace gpml {
namespace xml {

namespace {

using tinyxml2::XMLElement;

struct WriteContext
{
  const AttributeSchema& schema;
  const PathwayModel& model;
};

XMLElement* appendChild(XMLElement* parent, const char* name)
{
  XMLElement* child = parent->GetDocument()->NewElement(name);
  parent->InsertEndChild(child);
  return child;
}

std::string color(const Color& value)
{
  return colorText(value, SchemaVersion::Gpml2021);
}

template <typename T>
std::vector<const T*> sortedById(const std::vector<std::unique_ptr<T>>& entries)
{
  std::vector<const T*> sorted;
  for (const auto& entry : entries)
    sorted.push_back(entry.get());
  std::sort(sorted.begin(), sorted.end(), [](const T* a, const T* b) { return a->element_id < b->element_id; });
  return sorted;
}

void writeXref(const WriteContext& ctx, const std::optional<Xref>& xref, XMLElement* elem)
{
  if (!xref)
    return;
  XMLElement* x = appendChild(elem, "Xref");
  ctx.schema.set("Xref", "identifier", x, xref->identifier);
  ctx.schema.set("Xref", "dataSource", x, xref->data_source);
}

void writeUrl(const WriteContext& ctx, const std::string& url, XMLElement* elem)
{
  if (url.empty())
    return;
  ctx.schema.set("Url", "link", appendChild(elem, "Url"), url);
}

/// ---------------------------------------------------------------------------
/// Refs and the comment group
/// ---------------------------------------------------------------------------

void writeCitationRef(const WriteContext& ctx, const CitationRef& ref, XMLElement* parent);

void writeAnnotationRef(const WriteContext& ctx, const AnnotationRef& ref, XMLElement* parent)
{
  XMLElement* elem = appendChild(parent, "AnnotationRef");
  ctx.schema.set("AnnotationRef", "elementRef", elem, ref.annotation_id);
  for (const auto& citation_ref : ref.citation_refs)
    writeCitationRef(ctx, citation_ref, elem);
  for (const auto& evidence_ref : ref.evidence_refs)
    ctx.schema.set("EvidenceRef", "elementRef", appendChild(elem, "EvidenceRef"), evidence_ref.evidence_id);
}

void writeCitationRef(const WriteContext& ctx, const CitationRef& ref, XMLElement* parent)
{
  XMLElement* elem = appendChild(parent, "CitationRef");
  ctx.schema.set("CitationRef", "elementRef", elem, ref.citation_id);
  for (const auto& annotation_ref : ref.annotation_refs)
    writeAnnotationRef(ctx, annotation_ref, elem);
}

void writeCommentGroup(const WriteContext& ctx, const PathwayElement& element, XMLElement* elem)
{
  for (const auto& comment : element.comments)
  {
    XMLElement* c = appendChild(elem, "Comment");
    ctx.schema.set("Comment", "source", c, comment.source);
    c->SetText(comment.text.c_str());
  }
  for (const auto& [key, value] : element.dynamic_properties)
  {
    XMLElement* property = appendChild(elem, "Property");
    ctx.schema.set("Property", "key", property, key);
    ctx.schema.set("Property", "value", property, value);
  }
  for (const auto& ref : element.annotation_refs)
    writeAnnotationRef(ctx, ref, elem);
  for (const auto& ref : element.citation_refs)
    writeCitationRef(ctx, ref, elem);
  for (const auto& ref : element.evidence_refs)
    ctx.schema.set("EvidenceRef", "elementRef", appendChild(elem, "EvidenceRef"), ref.evidence_id);
}

/// ---------------------------------------------------------------------------
/// Pathway and pools
/// ---------------------------------------------------------------------------

void writePathway(const WriteContext& ctx, XMLElement* root)
{
  const Pathway& pathway = ctx.model.pathway();
  ctx.schema.set("Pathway", "title", root, pathway.title);
  ctx.schema.set("Pathway", "organism", root, pathway.organism);
  ctx.schema.set("Pathway", "source", root, pathway.source);
  ctx.schema.set("Pathway", "version", root, pathway.version);
  ctx.schema.set("Pathway", "license", root, pathway.license);

  writeXref(ctx, pathway.xref, root);
  if (pathway.description)
    appendChild(root, "Description")->SetText(pathway.description->c_str());

  if (!pathway.authors.empty())
  {
    XMLElement* authors = appendChild(root, "Authors");
    for (const auto& author : pathway.authors)
    {
      XMLElement* elem = appendChild(authors, "Author");
      ctx.schema.set("Author", "name", elem, author.name);
      ctx.schema.set("Author", "username", elem, author.username);
      if (author.order != 0)
        ctx.schema.setInt("Author", "order", elem, author.order);
      writeXref(ctx, author.xref, elem);
    }
  }

  XMLElement* gfx = appendChild(root, "Graphics");
  ctx.schema.setDouble("Pathway.Graphics", "boardWidth", gfx, pathway.board_width);
  ctx.schema.setDouble("Pathway.Graphics", "boardHeight", gfx, pathway.board_height);
  ctx.schema.set("Pathway.Graphics", "backgroundColor", gfx, color(pathway.background_color));

  writeCommentGroup(ctx, pathway, root);
}

void writePools(const WriteContext& ctx, XMLElement* root)
{
  if (!ctx.model.annotations().empty())
  {
    XMLElement* wrapper = appendChild(root, "Annotations");
    for (const Annotation* annotation : sortedById(ctx.model.annotations()))
    {
      XMLElement* elem = appendChild(wrapper, "Annotation");
      ctx.schema.set("Annotation", "elementId", elem, annotation->element_id);
      ctx.schema.set("Annotation", "value", elem, annotation->value);
      ctx.schema.set("Annotation", "type", elem, annotation->type.name());
      writeXref(ctx, annotation->xref, elem);
      writeUrl(ctx, annotation->url, elem);
    }
  }
  if (!ctx.model.citations().empty())
  {
    XMLElement* wrapper = appendChild(root, "Citations");
    for (const Citation* citation : sortedById(ctx.model.citations()))
    {
      XMLElement* elem = appendChild(wrapper, "Citation");
      ctx.schema.set("Citation", "elementId", elem, citation->element_id);
      writeXref(ctx, citation->xref, elem);
      writeUrl(ctx, citation->url, elem);
    }
  }
  if (!ctx.model.evidences().empty())
  {
    XMLElement* wrapper = appendChild(root, "Evidences");
    for (const Evidence* evidence : sortedById(ctx.model.evidences()))
    {
      XMLElement* elem = appendChild(wrapper, "Evidence");
      ctx.schema.set("Evidence", "elementId", elem, evidence->element_id);
      ctx.schema.set("Evidence", "value", elem, evidence->value);
      writeXref(ctx, evidence->xref, elem);
      writeUrl(ctx, evidence->url, elem);
    }
  }
}

/// ---------------------------------------------------------------------------
/// Shaped elements
/// ---------------------------------------------------------------------------

const char* flag(bool on, const char* name)
{
  return on ? name : "Normal";
}

/// Graphics attributes shared by States and the absolutely placed shapes.
void writeFontAndStyle(const WriteContext& ctx, const ShapedElement& element, XMLElement* gfx, const std::string& gtag)
{
  ctx.schema.setDouble(gtag, "width", gfx, element.width);
  ctx.schema.setDouble(gtag, "height", gfx, element.height);

  const FontProperty& font = element.font;
  ctx.schema.set(gtag, "textColor", gfx, color(font.text_color));
  ctx.schema.set(gtag, "fontName", gfx, font.name);
  ctx.schema.set(gtag, "fontWeight", gfx, flag(font.bold, "Bold"));
  ctx.schema.set(gtag, "fontStyle", gfx, flag(font.italic, "Italic"));
  ctx.schema.set(gtag, "fontDecoration", gfx, flag(font.underline, "Underline"));
  ctx.schema.set(gtag, "fontStrikethru", gfx, flag(font.strikethru, "Strikethru"));
  ctx.schema.setInt(gtag, "fontSize", gfx, font.size);
  ctx.schema.set(gtag, "hAlign", gfx, toString(font.h_align));
  ctx.schema.set(gtag, "vAlign", gfx, toString(font.v_align));

  const ShapeStyleProperty& style = element.style;
  ctx.schema.set(gtag, "borderColor", gfx, color(style.border_color));
  ctx.schema.set(gtag, "borderStyle", gfx, style.border_style.name());
  ctx.schema.setDouble(gtag, "borderWidth", gfx, style.border_width);
  ctx.schema.set(gtag, "fillColor", gfx, color(style.fill_color));
  ctx.schema.set(gtag, "shapeType", gfx, style.shape_type.name());
  ctx.schema.setDouble(gtag, "rotation", gfx, element.rotation);
}

template <typename T>
XMLElement* writeShapedElement(const WriteContext& ctx, const T& element, XMLElement* parent, const char* tag)
{
  XMLElement* elem = appendChild(parent, tag);
  ctx.schema.set(tag, "elementId", elem, element.element_id);
  ctx.schema.set(tag, "groupRef", elem, element.group_ref);

  const std::string gtag = std::string(tag) + ".Graphics";
  XMLElement* gfx = appendChild(elem, "Graphics");
  ctx.schema.setDouble(gtag, "centerX", gfx, element.center.x());
  ctx.schema.setDouble(gtag, "centerY", gfx, element.center.y());
  if (element.style.z_order)
    ctx.schema.setInt(gtag, "zOrder", gfx, *element.style.z_order);
  writeFontAndStyle(ctx, element, gfx, gtag);

  writeCommentGroup(ctx, element, elem);
  return elem;
}

void writeStates(const WriteContext& ctx, const DataNode& node, XMLElement* node_elem)
{
  const std::vector<State*> states = ctx.model.statesOf(node.element_id);
  if (states.empty())
    return;

  XMLElement* wrapper = appendChild(node_elem, "States");
  for (const State* state : states)
  {
    XMLElement* elem = appendChild(wrapper, "State");
    ctx.schema.set("State", "elementId", elem, state->element_id);
    ctx.schema.set("State", "textLabel", elem, state->text_label);
    ctx.schema.set("State", "type", elem, state->type.name());
    writeXref(ctx, state->xref, elem);

    XMLElement* gfx = appendChild(elem, "Graphics");
    ctx.schema.setDouble("State.Graphics", "relX", gfx, state->relative.x());
    ctx.schema.setDouble("State.Graphics", "relY", gfx, state->relative.y());
    writeFontAndStyle(ctx, *state, gfx, "State.Graphics");
    writeCommentGroup(ctx, *state, elem);
  }
}

void writeDataNodes(const WriteContext& ctx, XMLElement* root)
{
  if (ctx.model.dataNodes().empty())
    return;

  XMLElement* wrapper = appendChild(root, "DataNodes");
  for (const auto& node : ctx.model.dataNodes())
  {
    XMLElement* elem = writeShapedElement(ctx, *node, wrapper, "DataNode");
    ctx.schema.set("DataNode", "textLabel", elem, node->text_label);
    ctx.schema.set("DataNode", "type", elem, node->type.name());
    ctx.schema.set("DataNode", "aliasRef", elem, node->alias_ref);
    writeXref(ctx, node->xref, elem);
    writeStates(ctx, *node, elem);
  }

  for (const auto& state : ctx.model.states())
  {
    if (!ctx.model.find<DataNode>(state->element_ref))
      logger()->warn("State {} has no DataNode '{}' to nest under, not written", state->element_id,
                     state->element_ref);
  }
}

void writeLabels(const WriteContext& ctx, XMLElement* root)
{
  if (ctx.model.labels().empty())
    return;
  XMLElement* wrapper = appendChild(root, "Labels");
  for (const auto& label : ctx.model.labels())
  {
    XMLElement* elem = writeShapedElement(ctx, *label, wrapper, "Label");
    ctx.schema.set("Label", "textLabel", elem, label->text_label);
    ctx.schema.set("Label", "href", elem, label->href);
  }
}

void writeShapes(const WriteContext& ctx, XMLElement* root)
{
  if (ctx.model.shapes().empty())
    return;
  XMLElement* wrapper = appendChild(root, "Shapes");
  for (const auto& shape : ctx.model.shapes())
  {
    XMLElement* elem = writeShapedElement(ctx, *shape, wrapper, "Shape");
    ctx.schema.set("Shape", "textLabel", elem, shape->text_label);
  }
}

void writeGroups(const WriteContext& ctx, XMLElement* root)
{
  if (ctx.model.groups().empty())
    return;
  XMLElement* wrapper = appendChild(root, "Groups");
  for (const auto& group : ctx.model.groups())
  {
    XMLElement* elem = writeShapedElement(ctx, *group, wrapper, "Group");
    ctx.schema.set("Group", "textLabel", elem, group->text_label);
    ctx.schema.set("Group", "type", elem, group->type.name());
    writeXref(ctx, group->xref, elem);
  }
}

/// ---------------------------------------------------------------------------
/// Lines
/// ---------------------------------------------------------------------------

void writeWaypoints(const WriteContext& ctx, const LineElement& line, XMLElement* elem, const std::string& tag)
{
  XMLElement* waypoints = appendChild(elem, "Waypoints");

  const std::string ptag = tag + ".Waypoints.Point";
  for (std::size_t i = 0; i < line.points.size(); ++i)
  {
    const LinePoint& point = *line.points[i];
    XMLElement* pt = appendChild(waypoints, "Point");
    ctx.schema.set(ptag, "elementId", pt, point.element_id);
    if (i == 0)
      ctx.schema.set(ptag, "arrowHead", pt, line.start_arrow_head.name());
    else if (i == line.points.size() - 1)
      ctx.schema.set(ptag, "arrowHead", pt, line.end_arrow_head.name());

    const Eigen::Vector2d position = absolutePosition(ctx.model, point);
    ctx.schema.setDouble(ptag, "x", pt, position.x());
    ctx.schema.setDouble(ptag, "y", pt, position.y());
    if (!point.element_ref.empty())
    {
      ctx.schema.set(ptag, "elementRef", pt, point.element_ref);
      if (point.relative)
      {
        ctx.schema.setDouble(ptag, "relX", pt, point.relative->x());
        ctx.schema.setDouble(ptag, "relY", pt, point.relative->y());
      }
    }
  }

  const std::string atag = tag + ".Waypoints.Anchor";
  for (const auto& anchor : line.anchors)
  {
    XMLElement* a = appendChild(waypoints, "Anchor");
    ctx.schema.set(atag, "elementId", a, anchor->element_id);
    ctx.schema.setDouble(atag, "position", a, anchor->position);
    ctx.schema.set(atag, "shapeType", a, anchor->shape_type.name());
  }
}

template <typename T>
void writeLines(const WriteContext& ctx, const std::vector<std::unique_ptr<T>>& lines, XMLElement* root,
                const char* wrapper_tag, const char* tag)
{
  if (lines.empty())
    return;

  const std::string gtag = std::string(tag) + ".Graphics";
  XMLElement* wrapper = appendChild(root, wrapper_tag);
  for (const auto& line : lines)
  {
    XMLElement* elem = appendChild(wrapper, tag);
    ctx.schema.set(tag, "elementId", elem, line->element_id);
    ctx.schema.set(tag, "groupRef", elem, line->group_ref);
    if constexpr (std::is_same_v<T, Interaction>)
      writeXref(ctx, line->xref, elem);
    writeWaypoints(ctx, *line, elem, tag);

    XMLElement* gfx = appendChild(elem, "Graphics");
    ctx.schema.set(gtag, "lineColor", gfx, color(line->line_color));
    ctx.schema.set(gtag, "lineStyle", gfx, line->line_style.name());
    ctx.schema.setDouble(gtag, "lineWidth", gfx, line->line_width);
    ctx.schema.set(gtag, "connectorType", gfx, line->connector_type.name());
    if (line->z_order)
      ctx.schema.setInt(gtag, "zOrder", gfx, *line->z_order);

    writeCommentGroup(ctx, *line, elem);
  }
}

}  // namespace

std::unique_ptr<tinyxml2::XMLDocument> Gpml2021Writer::write(const PathwayModel& model) const
{
  if (model.version() != SchemaVersion::Gpml2021)
    throw ConversionError(std::string("Cannot write a ") + toString(model.version()) +
                          " model as GPML2021 without converting it");

  WriteContext ctx{ AttributeSchema::forVersion(SchemaVersion::Gpml2021), model };

  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  doc->InsertEndChild(doc->NewDeclaration());
  XMLElement* root = doc->NewElement("Pathway");
  doc->InsertEndChild(root);
  root->SetAttribute("xmlns", namespaceUri(SchemaVersion::Gpml2021));

  writePathway(ctx, root);
  writePools(ctx, root);
  writeGroups(ctx, root);
  writeShapes(ctx, root);
  writeLabels(ctx, root);
  writeLines(ctx, model.graphicalLines(), root, "GraphicalLines", "GraphicalLine");
  writeLines(ctx, model.interactions(), root, "Interactions", "Interaction");
  writeDataNodes(ctx, root);

  sortChildrenRecursive(root, SchemaVersion::Gpml2021);
  return doc;
}

}  // namespace xml
}  // namespace gpml
