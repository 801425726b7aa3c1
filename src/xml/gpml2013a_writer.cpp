#include <gpml/xml/gpml2013a_writer.h>

#include <algorithm>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <gpml/errors.h>
#include <gpml/logging.h>
#include <gpml/model/coordinates.h>
#include <gpml/xml/attribute_schema.h>
#include <gpml/xml/codec_common.h>
#include <gpml/xml/element_order.h>
#include <gpml/xml/gpml2013a_format.h>
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
  return colorText(value, SchemaVersion::Gpml2013a);
}

/// ---------------------------------------------------------------------------
/// Comment group
/// ---------------------------------------------------------------------------

void writeComment(const WriteContext& ctx, XMLElement* parent, const std::string& text, const std::string& source)
{
  XMLElement* comment = appendChild(parent, "Comment");
  ctx.schema.set("Comment", "Source", comment, source);
  comment->SetText(text.c_str());
}

void writeAttribute(const WriteContext& ctx, XMLElement* parent, const std::string& key, const std::string& value)
{
  XMLElement* attr = appendChild(parent, "Attribute");
  ctx.schema.set("Attribute", "Key", attr, key);
  ctx.schema.set("Attribute", "Value", attr, value);
}

/// State annotations written by the reader from a phosphosite comment go
/// back into one "key=value; ..." comment, ptm and direction terms reduced
/// to their short codes.
void writeStateAnnotations(const WriteContext& ctx, const State& state, XMLElement* elem)
{
  std::vector<std::pair<std::string, std::string>> entries;
  auto put = [&entries](const std::string& key, const std::string& value) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e) { return e.first == key; });
    if (it != entries.end())
      it->second = value;
    else
      entries.emplace_back(key, value);
  };

  for (const auto& ref : state.annotation_refs)
  {
    const Annotation* annotation = ctx.model.find<Annotation>(ref.annotation_id);
    if (!annotation)
      continue;
    if (auto code = gpml2013a::ptmCode(annotation->value))
      put(gpml2013a::kPtm, *code);
    else if (auto code = gpml2013a::directionCode(annotation->value))
      put(gpml2013a::kDirection, *code);
    else
      put(annotation->type.name(), annotation->value);
  }
  if (state.xref && state.xref->data_source == gpml2013a::kSiteGroupIdDatabase)
    put(gpml2013a::kSiteGroupId, state.xref->identifier);

  if (entries.empty())
    return;

  std::string text;
  for (const auto& [key, value] : entries)
  {
    if (!text.empty())
      text += "; ";
    text += key + "=" + value;
  }
  writeComment(ctx, elem, text, "");
}

void writeCommentGroup(const WriteContext& ctx, const PathwayElement& element, XMLElement* elem)
{
  for (const auto& comment : element.comments)
    writeComment(ctx, elem, comment.text, comment.source);
  if (element.objectType() == ObjectType::State)
    writeStateAnnotations(ctx, static_cast<const State&>(element), elem);

  for (const auto& ref : element.citation_refs)
    appendChild(elem, "BiopaxRef")->SetText(ref.citation_id.c_str());

  for (const auto& [key, value] : element.dynamic_properties)
  {
    if (element.objectType() == ObjectType::Pathway && gpml2013a::isPathwayOnlyKey(key))
      continue;
    writeAttribute(ctx, elem, key, value);
  }
  if (element.objectType() == ObjectType::State)
  {
    const auto& state = static_cast<const State&>(element);
    if (state.rotation != 0.0)
      writeAttribute(ctx, elem, gpml2013a::kStateRotationKey, formatNumber(state.rotation));
  }
}

/// GPML2013a writes the Xref of DataNode, State and Interaction even when
/// empty.
void writeXref(const WriteContext& ctx, const std::optional<Xref>& xref, XMLElement* elem, const std::string& tag)
{
  XMLElement* x = appendChild(elem, "Xref");
  const std::string xtag = tag + ".Xref";
  ctx.schema.set(xtag, "Database", x, xref ? xref->data_source : std::string());
  ctx.schema.set(xtag, "ID", x, xref ? xref->identifier : std::string());
}

/// ---------------------------------------------------------------------------
/// Pathway
/// ---------------------------------------------------------------------------

void writePathwayProperty(const WriteContext& ctx, XMLElement* root, const char* name, const char* key)
{
  if (auto value = ctx.model.pathway().dynamicProperty(key))
    ctx.schema.set("Pathway", name, root, *value);
}

void writePathway(const WriteContext& ctx, XMLElement* root)
{
  const Pathway& pathway = ctx.model.pathway();
  ctx.schema.set("Pathway", "Name", root, pathway.title);
  ctx.schema.set("Pathway", "Organism", root, pathway.organism);
  ctx.schema.set("Pathway", "Data-Source", root, pathway.source);
  ctx.schema.set("Pathway", "Version", root, pathway.version);
  ctx.schema.set("Pathway", "License", root, pathway.license);
  writePathwayProperty(ctx, root, "Author", gpml2013a::kPathwayAuthor);
  writePathwayProperty(ctx, root, "Maintainer", gpml2013a::kPathwayMaintainer);
  writePathwayProperty(ctx, root, "Email", gpml2013a::kPathwayEmail);
  writePathwayProperty(ctx, root, "Last-Modified", gpml2013a::kPathwayLastModified);

  if (pathway.description && !pathway.description->empty())
    writeComment(ctx, root, *pathway.description, gpml2013a::kDescriptionSource);
  writeCommentGroup(ctx, pathway, root);

  XMLElement* gfx = appendChild(root, "Graphics");
  ctx.schema.setDouble("Pathway.Graphics", "BoardWidth", gfx, pathway.board_width);
  ctx.schema.setDouble("Pathway.Graphics", "BoardHeight", gfx, pathway.board_height);
}

void writeInfoBoxAndLegend(const WriteContext& ctx, XMLElement* root)
{
  const Pathway& pathway = ctx.model.pathway();

  XMLElement* info_box = appendChild(root, "InfoBox");
  ctx.schema.set("InfoBox", "CenterX", info_box, pathway.dynamicProperty(gpml2013a::kInfoBoxCenterX).value_or("0"));
  ctx.schema.set("InfoBox", "CenterY", info_box, pathway.dynamicProperty(gpml2013a::kInfoBoxCenterY).value_or("0"));

  auto legend_x = pathway.dynamicProperty(gpml2013a::kLegendCenterX);
  auto legend_y = pathway.dynamicProperty(gpml2013a::kLegendCenterY);
  if (legend_x && legend_y)
  {
    XMLElement* legend = appendChild(root, "Legend");
    ctx.schema.set("Legend", "CenterX", legend, *legend_x);
    ctx.schema.set("Legend", "CenterY", legend, *legend_y);
  }
}

/// ---------------------------------------------------------------------------
/// Biopax
/// ---------------------------------------------------------------------------

XMLElement* appendBiopax(XMLElement* parent, const char* name, const std::string& text)
{
  XMLElement* child = appendChild(parent, (std::string("bp:") + name).c_str());
  child->SetAttribute("rdf:datatype", gpml2013a::kRdfString);
  child->SetText(text.c_str());
  return child;
}

void declareBiopaxNamespaces(XMLElement* elem)
{
  elem->SetAttribute("xmlns:bp", gpml2013a::kBiopaxNamespace);
  elem->SetAttribute("xmlns:rdf", gpml2013a::kRdfNamespace);
}

void writeOntologyTerms(const WriteContext& ctx, XMLElement* biopax)
{
  std::set<std::string> written;
  for (const auto& ref : ctx.model.pathway().annotation_refs)
  {
    const Annotation* annotation = ctx.model.find<Annotation>(ref.annotation_id);
    if (!annotation || !written.insert(annotation->element_id).second)
      continue;

    const std::string prefix = annotation->xref ? annotation->xref->data_source : std::string();
    const std::string identifier = annotation->xref ? annotation->xref->identifier : std::string();

    XMLElement* vocabulary = appendChild(biopax, "bp:openControlledVocabulary");
    declareBiopaxNamespaces(vocabulary);
    appendBiopax(vocabulary, "TERM", annotation->value);
    appendBiopax(vocabulary, "ID", prefix.empty() ? identifier : prefix + ":" + identifier);
    appendBiopax(vocabulary, "Ontology", gpml2013a::ontologyForPrefix(prefix).value_or(annotation->type.name()));
    if (!annotation->url.empty())
      logger()->debug("Annotation {}: url has no GPML2013a form, not written", annotation->element_id);
  }
}

void writePublicationXrefs(const WriteContext& ctx, XMLElement* biopax)
{
  std::vector<const Citation*> citations;
  for (const auto& citation : ctx.model.citations())
    citations.push_back(citation.get());
  std::sort(citations.begin(), citations.end(),
            [](const Citation* a, const Citation* b) { return a->element_id < b->element_id; });

  for (const Citation* citation : citations)
  {
    XMLElement* publication = appendChild(biopax, "bp:PublicationXref");
    declareBiopaxNamespaces(publication);
    publication->SetAttribute("rdf:id", citation->element_id.c_str());
    appendBiopax(publication, "ID", citation->xref ? citation->xref->identifier : std::string());
    appendBiopax(publication, "DB", citation->xref ? citation->xref->data_source : std::string());
    if (!citation->title.empty())
      appendBiopax(publication, "TITLE", citation->title);
    if (!citation->source.empty())
      appendBiopax(publication, "SOURCE", citation->source);
    else if (!citation->url.empty())
      appendBiopax(publication, "SOURCE", citation->url);
    if (!citation->year.empty())
      appendBiopax(publication, "YEAR", citation->year);
    for (const auto& author : citation->authors)
      appendBiopax(publication, "AUTHORS", author);
  }
}

void writeBiopax(const WriteContext& ctx, XMLElement* root)
{
  XMLElement* biopax = root->GetDocument()->NewElement("Biopax");
  writeOntologyTerms(ctx, biopax);
  writePublicationXrefs(ctx, biopax);
  if (biopax->NoChildren())
    root->GetDocument()->DeleteNode(biopax);
  else
    root->InsertEndChild(biopax);
}

/// ---------------------------------------------------------------------------
/// Shaped elements
/// ---------------------------------------------------------------------------

const char* flag(bool on, const char* name)
{
  return on ? name : "Normal";
}

void writeShapeStyle(const WriteContext& ctx, const ShapedElement& element, XMLElement* gfx, const std::string& gtag)
{
  const ShapeStyleProperty& style = element.style;
  ctx.schema.set(gtag, "LineStyle", gfx, style.border_style.name());
  ctx.schema.setDouble(gtag, "LineThickness", gfx, style.border_width);
  ctx.schema.set(gtag, "FillColor", gfx, color(style.fill_color));
  ctx.schema.set(gtag, "ShapeType", gfx, style.shape_type.name());
  if (style.z_order)
    ctx.schema.setInt(gtag, "ZOrder", gfx, *style.z_order);
}

void writeShapedGraphics(const WriteContext& ctx, const ShapedElement& element, XMLElement* elem,
                         const std::string& tag)
{
  XMLElement* gfx = appendChild(elem, "Graphics");
  const std::string gtag = tag + ".Graphics";
  ctx.schema.setDouble(gtag, "CenterX", gfx, element.center.x());
  ctx.schema.setDouble(gtag, "CenterY", gfx, element.center.y());
  ctx.schema.setDouble(gtag, "Width", gfx, element.width);
  ctx.schema.setDouble(gtag, "Height", gfx, element.height);

  const FontProperty& font = element.font;
  ctx.schema.set(gtag, "FontName", gfx, font.name);
  ctx.schema.set(gtag, "FontStyle", gfx, flag(font.italic, "Italic"));
  ctx.schema.set(gtag, "FontDecoration", gfx, flag(font.underline, "Underline"));
  ctx.schema.set(gtag, "FontStrikethru", gfx, flag(font.strikethru, "Strikethru"));
  ctx.schema.set(gtag, "FontWeight", gfx, flag(font.bold, "Bold"));
  ctx.schema.setInt(gtag, "FontSize", gfx, font.size);
  ctx.schema.set(gtag, "Align", gfx, toString(font.h_align));
  ctx.schema.set(gtag, "Valign", gfx, toString(font.v_align));
  ctx.schema.set(gtag, "Color", gfx, color(font.text_color));

  writeShapeStyle(ctx, element, gfx, gtag);
  if (ctx.schema.contains(gtag, "Rotation"))
    ctx.schema.setDouble(gtag, "Rotation", gfx, element.rotation);
}

void writeGroupRef(const WriteContext& ctx, const Groupable& groupable, XMLElement* elem, const std::string& tag)
{
  ctx.schema.set(tag, "GroupRef", elem, groupable.group_ref);
}

void writeDataNodes(const WriteContext& ctx, XMLElement* root)
{
  for (const auto& node : ctx.model.dataNodes())
  {
    XMLElement* elem = appendChild(root, "DataNode");
    ctx.schema.set("DataNode", "GraphId", elem, node->element_id);
    ctx.schema.set("DataNode", "TextLabel", elem, node->text_label);
    ctx.schema.set("DataNode", "Type", elem, node->type.name());
    writeGroupRef(ctx, *node, elem, "DataNode");
    writeCommentGroup(ctx, *node, elem);
    writeShapedGraphics(ctx, *node, elem, "DataNode");
    writeXref(ctx, node->xref, elem, "DataNode");
  }
}

void writeState(const WriteContext& ctx, const State& state, XMLElement* root)
{
  XMLElement* elem = appendChild(root, "State");
  ctx.schema.set("State", "GraphId", elem, state.element_id);
  ctx.schema.set("State", "GraphRef", elem, state.element_ref);
  ctx.schema.set("State", "TextLabel", elem, state.text_label);
  ctx.schema.set("State", "StateType", elem, state.type.name());
  writeCommentGroup(ctx, state, elem);

  XMLElement* gfx = appendChild(elem, "Graphics");
  ctx.schema.setDouble("State.Graphics", "RelX", gfx, state.relative.x());
  ctx.schema.setDouble("State.Graphics", "RelY", gfx, state.relative.y());
  ctx.schema.setDouble("State.Graphics", "Width", gfx, state.width);
  ctx.schema.setDouble("State.Graphics", "Height", gfx, state.height);
  ctx.schema.set("State.Graphics", "Color", gfx, color(state.style.border_color));
  writeShapeStyle(ctx, state, gfx, "State.Graphics");

  writeXref(ctx, state.xref, elem, "State");
}

void writeStates(const WriteContext& ctx, XMLElement* root)
{
  std::size_t written = 0;
  for (const auto& node : ctx.model.dataNodes())
  {
    for (const State* state : ctx.model.statesOf(node->element_id))
    {
      writeState(ctx, *state, root);
      ++written;
    }
  }
  if (written < ctx.model.states().size())
    logger()->warn("{} State(s) without a DataNode not written", ctx.model.states().size() - written);
}

void writeLabels(const WriteContext& ctx, XMLElement* root)
{
  for (const auto& label : ctx.model.labels())
  {
    XMLElement* elem = appendChild(root, "Label");
    ctx.schema.set("Label", "GraphId", elem, label->element_id);
    ctx.schema.set("Label", "TextLabel", elem, label->text_label);
    ctx.schema.set("Label", "Href", elem, label->href);
    writeGroupRef(ctx, *label, elem, "Label");
    writeCommentGroup(ctx, *label, elem);
    writeShapedGraphics(ctx, *label, elem, "Label");
  }
}

void writeShapes(const WriteContext& ctx, XMLElement* root)
{
  for (const auto& shape : ctx.model.shapes())
  {
    XMLElement* elem = appendChild(root, "Shape");
    ctx.schema.set("Shape", "GraphId", elem, shape->element_id);
    ctx.schema.set("Shape", "TextLabel", elem, shape->text_label);
    writeGroupRef(ctx, *shape, elem, "Shape");
    writeCommentGroup(ctx, *shape, elem);
    writeShapedGraphics(ctx, *shape, elem, "Shape");
  }
}

/// GPML2013a groups have no graphics; their look follows from Style.
void writeGroups(const WriteContext& ctx, XMLElement* root)
{
  for (const auto& group : ctx.model.groups())
  {
    XMLElement* elem = appendChild(root, "Group");
    ctx.schema.set("Group", "GroupId", elem, group->element_id);
    ctx.schema.set("Group", "GraphId", elem, group->element_id);
    ctx.schema.set("Group", "Style", elem, group->type.name());
    ctx.schema.set("Group", "TextLabel", elem, group->text_label);
    writeGroupRef(ctx, *group, elem, "Group");
    writeCommentGroup(ctx, *group, elem);
    if (group->xref)
      logger()->debug("Group {}: Xref has no GPML2013a form, not written", group->element_id);
  }
}

/// ---------------------------------------------------------------------------
/// Lines
/// ---------------------------------------------------------------------------

void writePoints(const WriteContext& ctx, const LineElement& line, XMLElement* gfx, const std::string& tag)
{
  const std::string ptag = tag + ".Graphics.Point";
  for (std::size_t i = 0; i < line.points.size(); ++i)
  {
    const LinePoint& point = *line.points[i];
    XMLElement* pt = appendChild(gfx, "Point");

    const Eigen::Vector2d position = absolutePosition(ctx.model, point);
    ctx.schema.setDouble(ptag, "X", pt, position.x());
    ctx.schema.setDouble(ptag, "Y", pt, position.y());
    if (!point.element_ref.empty())
    {
      ctx.schema.set(ptag, "GraphRef", pt, point.element_ref);
      if (point.relative)
      {
        ctx.schema.setDouble(ptag, "RelX", pt, point.relative->x());
        ctx.schema.setDouble(ptag, "RelY", pt, point.relative->y());
      }
    }
    if (i == 0)
      ctx.schema.set(ptag, "ArrowHead", pt, line.start_arrow_head.name());
    else if (i == line.points.size() - 1)
      ctx.schema.set(ptag, "ArrowHead", pt, line.end_arrow_head.name());
    ctx.schema.set(ptag, "GraphId", pt, point.element_id);
  }
}

void writeAnchors(const WriteContext& ctx, const LineElement& line, XMLElement* gfx, const std::string& tag)
{
  const std::string atag = tag + ".Graphics.Anchor";
  for (const auto& anchor : line.anchors)
  {
    XMLElement* elem = appendChild(gfx, "Anchor");
    ctx.schema.setDouble(atag, "Position", elem, anchor->position);
    ctx.schema.set(atag, "Shape", elem, anchor->shape_type.name());
    ctx.schema.set(atag, "GraphId", elem, anchor->element_id);
  }
}

template <typename T>
void writeLines(const WriteContext& ctx, const std::vector<std::unique_ptr<T>>& lines, XMLElement* root,
                const char* tag)
{
  const std::string gtag = std::string(tag) + ".Graphics";
  for (const auto& line : lines)
  {
    XMLElement* elem = appendChild(root, tag);
    ctx.schema.set(tag, "GraphId", elem, line->element_id);
    writeGroupRef(ctx, *line, elem, tag);
    writeCommentGroup(ctx, *line, elem);

    XMLElement* gfx = appendChild(elem, "Graphics");
    if (line->z_order)
      ctx.schema.setInt(gtag, "ZOrder", gfx, *line->z_order);
    ctx.schema.setDouble(gtag, "LineThickness", gfx, line->line_width);
    ctx.schema.set(gtag, "Color", gfx, color(line->line_color));
    ctx.schema.set(gtag, "LineStyle", gfx, line->line_style.name());
    ctx.schema.set(gtag, "ConnectorType", gfx, line->connector_type.name());
    writePoints(ctx, *line, gfx, tag);
    writeAnchors(ctx, *line, gfx, tag);

    if constexpr (std::is_same_v<T, Interaction>)
      writeXref(ctx, line->xref, elem, tag);
  }
}

}  // namespace

std::unique_ptr<tinyxml2::XMLDocument> Gpml2013aWriter::write(const PathwayModel& model) const
{
  if (model.version() != SchemaVersion::Gpml2013a)
    throw ConversionError(std::string("Cannot write a ") + toString(model.version()) +
                          " model as GPML2013a without converting it");

  WriteContext ctx{ AttributeSchema::forVersion(SchemaVersion::Gpml2013a), model };

  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  doc->InsertEndChild(doc->NewDeclaration());
  XMLElement* root = doc->NewElement("Pathway");
  doc->InsertEndChild(root);
  root->SetAttribute("xmlns", namespaceUri(SchemaVersion::Gpml2013a));

  writePathway(ctx, root);
  writeDataNodes(ctx, root);
  writeStates(ctx, root);
  writeLines(ctx, model.interactions(), root, "Interaction");
  writeLines(ctx, model.graphicalLines(), root, "GraphicalLine");
  writeLabels(ctx, root);
  writeShapes(ctx, root);
  writeGroups(ctx, root);
  writeInfoBoxAndLegend(ctx, root);
  writeBiopax(ctx, root);

  if (!model.evidences().empty())
    logger()->debug("{} Evidence(s) have no GPML2013a form, not written", model.evidences().size());

  sortChildrenRecursive(root, SchemaVersion::Gpml2013a);
  return doc;
}

}  // namespace xml
}  // namespace gpml
