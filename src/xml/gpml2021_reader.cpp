#include <gpml/xml/gpml2021_reader.h>

#include <map>
#include <type_traits>
#include <utility>
#include <vector>

#include <gpml/errors.h>
#include <gpml/logging.h>
#include <gpml/xml/attribute_schema.h>
#include <gpml/xml/codec_common.h>
#include <gpml/xml/utils.h>

namespace gpml {
namespace xml {

namespace {

using tinyxml2::XMLElement;

struct ReadContext
{
  const AttributeSchema& schema;
  const DataSourceResolver* resolver;
  PathwayModel& model;

  std::map<std::string, std::string> pool_ids;  // elementId in the document -> pooled entry id
  std::vector<std::unique_ptr<Interaction>> unidentified_interactions;
  std::vector<std::unique_ptr<GraphicalLine>> unidentified_lines;
};

template <typename Fn>
void forEachChild(const XMLElement* parent, const char* name, Fn&& fn)
{
  if (!parent)
    return;
  for (const XMLElement* child = parent->FirstChildElement(name); child; child = child->NextSiblingElement(name))
    fn(child);
}

/// Children of a category wrapper (<DataNodes><DataNode/>...</DataNodes>).
template <typename Fn>
void forEachWrapped(const XMLElement* root, const char* wrapper, const char* name, Fn&& fn)
{
  forEachChild(root->FirstChildElement(wrapper), name, fn);
}

const XMLElement* requireGraphics(const XMLElement* elem, const std::string& tag)
{
  const XMLElement* gfx = elem->FirstChildElement("Graphics");
  if (!gfx)
    throw ConversionError("Missing Graphics element", tag, "", elem->GetLineNum());
  return gfx;
}

template <typename T>
T& admit(ReadContext& ctx, std::unique_ptr<T> element, const XMLElement* elem, const std::string& tag)
{
  try
  {
    return ctx.model.add(std::move(element));
  }
  catch (const DuplicateIdError& e)
  {
    throw ConversionError("Duplicate element id '" + e.id() + "'", tag, "elementId", elem->GetLineNum());
  }
}

/// Reserve every elementId written in the document before anything is
/// admitted, so generated ids never take one that appears further down.
/// tag is the schema key of elem; Waypoints children are keyed below their
/// line ("Interaction.Waypoints.Point"), every other element by its name.
void reserveElementIds(const ReadContext& ctx, const XMLElement* elem, const std::string& tag)
{
  const bool in_waypoints = std::string(elem->Name()) == "Waypoints";
  for (const XMLElement* child = elem->FirstChildElement(); child; child = child->NextSiblingElement())
  {
    const std::string name = child->Name();
    const std::string child_tag = in_waypoints || name == "Waypoints" ? tag + "." + name : name;
    if (ctx.schema.contains(child_tag, "elementId"))
    {
      const std::string id = ctx.schema.getString(child_tag, "elementId", child);
      if (!id.empty())
        ctx.model.ids().reserve(id);
    }
    reserveElementIds(ctx, child, child_tag);
  }
}

std::optional<Xref> readXref(const ReadContext& ctx, const XMLElement* elem)
{
  const XMLElement* xref = elem->FirstChildElement("Xref");
  if (!xref)
    return std::nullopt;
  return makeXref(ctx.schema.getRequired("Xref", "identifier", xref),
                  ctx.schema.getRequired("Xref", "dataSource", xref), ctx.resolver);
}

std::string readUrl(const ReadContext& ctx, const XMLElement* elem)
{
  const XMLElement* url = elem->FirstChildElement("Url");
  return url ? ctx.schema.getRequired("Url", "link", url) : std::string();
}

/// ---------------------------------------------------------------------------
/// Refs and the comment group
/// ---------------------------------------------------------------------------

std::string poolId(const ReadContext& ctx, const std::string& id)
{
  auto it = ctx.pool_ids.find(id);
  return it == ctx.pool_ids.end() ? id : it->second;
}

EvidenceRef readEvidenceRef(const ReadContext& ctx, const XMLElement* elem)
{
  return EvidenceRef{ poolId(ctx, ctx.schema.getRequired("EvidenceRef", "elementRef", elem)) };
}

CitationRef readCitationRef(const ReadContext& ctx, const XMLElement* elem);

AnnotationRef readAnnotationRef(const ReadContext& ctx, const XMLElement* elem)
{
  AnnotationRef ref;
  ref.annotation_id = poolId(ctx, ctx.schema.getRequired("AnnotationRef", "elementRef", elem));
  forEachChild(elem, "CitationRef",
               [&](const XMLElement* child) { ref.citation_refs.push_back(readCitationRef(ctx, child)); });
  forEachChild(elem, "EvidenceRef",
               [&](const XMLElement* child) { ref.evidence_refs.push_back(readEvidenceRef(ctx, child)); });
  return ref;
}

CitationRef readCitationRef(const ReadContext& ctx, const XMLElement* elem)
{
  CitationRef ref;
  ref.citation_id = poolId(ctx, ctx.schema.getRequired("CitationRef", "elementRef", elem));
  forEachChild(elem, "AnnotationRef",
               [&](const XMLElement* child) { ref.annotation_refs.push_back(readAnnotationRef(ctx, child)); });
  return ref;
}

void readCommentGroup(const ReadContext& ctx, PathwayElement& element, const XMLElement* elem)
{
  forEachChild(elem, "Comment", [&](const XMLElement* comment) {
    std::string text = textOf(comment);
    if (!text.empty())
      element.comments.push_back(Comment{ text, ctx.schema.getString("Comment", "source", comment) });
  });
  forEachChild(elem, "Property", [&](const XMLElement* property) {
    element.setDynamicProperty(ctx.schema.getRequired("Property", "key", property),
                               ctx.schema.getRequired("Property", "value", property));
  });
  forEachChild(elem, "AnnotationRef",
               [&](const XMLElement* ref) { element.annotation_refs.push_back(readAnnotationRef(ctx, ref)); });
  forEachChild(elem, "CitationRef",
               [&](const XMLElement* ref) { element.citation_refs.push_back(readCitationRef(ctx, ref)); });
  forEachChild(elem, "EvidenceRef",
               [&](const XMLElement* ref) { element.evidence_refs.push_back(readEvidenceRef(ctx, ref)); });
}

/// ---------------------------------------------------------------------------
/// Pathway and pools
/// ---------------------------------------------------------------------------

void readPathway(const ReadContext& ctx, const XMLElement* root)
{
  Pathway& pathway = ctx.model.pathway();
  pathway.title = ctx.schema.getRequired("Pathway", "title", root);
  pathway.organism = ctx.schema.getString("Pathway", "organism", root);
  pathway.source = ctx.schema.getString("Pathway", "source", root);
  pathway.version = ctx.schema.getString("Pathway", "version", root);
  pathway.license = ctx.schema.getString("Pathway", "license", root);
  pathway.xref = readXref(ctx, root);

  if (const XMLElement* description = root->FirstChildElement("Description"))
    pathway.description = textOf(description);

  forEachWrapped(root, "Authors", "Author", [&](const XMLElement* elem) {
    Author author;
    author.name = ctx.schema.getRequired("Author", "name", elem);
    author.username = ctx.schema.getString("Author", "username", elem);
    author.order = ctx.schema.getOptionalInt("Author", "order", elem).value_or(0);
    author.xref = readXref(ctx, elem);
    pathway.authors.push_back(std::move(author));
  });

  const XMLElement* gfx = requireGraphics(root, "Pathway");
  pathway.board_width = ctx.schema.getDouble("Pathway.Graphics", "boardWidth", gfx);
  pathway.board_height = ctx.schema.getDouble("Pathway.Graphics", "boardHeight", gfx);
  pathway.background_color = readColor(ctx.schema, "Pathway.Graphics", "backgroundColor", gfx);
}

template <typename T>
void admitPooled(ReadContext& ctx, std::unique_ptr<T> entry, const XMLElement* elem, const char* tag)
{
  const std::string written_id = entry->element_id;
  T& added = admit(ctx, std::move(entry), elem, tag);
  if (written_id.empty())
    return;
  if (added.element_id != written_id)
    logger()->trace("{} {} has the content of {}, merged", tag, written_id, added.element_id);
  ctx.pool_ids[written_id] = added.element_id;
}

void readPools(ReadContext& ctx, const XMLElement* root)
{
  forEachWrapped(root, "Annotations", "Annotation", [&](const XMLElement* elem) {
    auto annotation = std::make_unique<Annotation>();
    annotation->element_id = ctx.schema.getString("Annotation", "elementId", elem);
    annotation->value = ctx.schema.getRequired("Annotation", "value", elem);
    annotation->type = AnnotationType::fromName(ctx.schema.getString("Annotation", "type", elem));
    annotation->xref = readXref(ctx, elem);
    annotation->url = readUrl(ctx, elem);
    admitPooled(ctx, std::move(annotation), elem, "Annotation");
  });
  forEachWrapped(root, "Citations", "Citation", [&](const XMLElement* elem) {
    auto citation = std::make_unique<Citation>();
    citation->element_id = ctx.schema.getString("Citation", "elementId", elem);
    citation->xref = readXref(ctx, elem);
    citation->url = readUrl(ctx, elem);
    admitPooled(ctx, std::move(citation), elem, "Citation");
  });
  forEachWrapped(root, "Evidences", "Evidence", [&](const XMLElement* elem) {
    auto evidence = std::make_unique<Evidence>();
    evidence->element_id = ctx.schema.getString("Evidence", "elementId", elem);
    evidence->value = ctx.schema.getString("Evidence", "value", elem);
    evidence->xref = readXref(ctx, elem);
    evidence->url = readUrl(ctx, elem);
    admitPooled(ctx, std::move(evidence), elem, "Evidence");
  });
}

/// ---------------------------------------------------------------------------
/// Shaped elements
/// ---------------------------------------------------------------------------

void readFontAndStyle(const ReadContext& ctx, ShapedElement& element, const XMLElement* gfx, const std::string& gtag)
{
  element.width = ctx.schema.getDouble(gtag, "width", gfx);
  element.height = ctx.schema.getDouble(gtag, "height", gfx);
  element.rotation = ctx.schema.getDouble(gtag, "rotation", gfx);

  FontProperty& font = element.font;
  font.text_color = readColor(ctx.schema, gtag, "textColor", gfx);
  font.name = ctx.schema.getString(gtag, "fontName", gfx);
  font.bold = ctx.schema.getString(gtag, "fontWeight", gfx) == "Bold";
  font.italic = ctx.schema.getString(gtag, "fontStyle", gfx) == "Italic";
  font.underline = ctx.schema.getString(gtag, "fontDecoration", gfx) == "Underline";
  font.strikethru = ctx.schema.getString(gtag, "fontStrikethru", gfx) == "Strikethru";
  font.size = ctx.schema.getInt(gtag, "fontSize", gfx);

  const std::string h_align = ctx.schema.getString(gtag, "hAlign", gfx);
  if (auto align = hAlignFromString(h_align))
    font.h_align = *align;
  else
    throw ConversionError("Unknown alignment '" + h_align + "'", gtag, "hAlign", gfx->GetLineNum());

  const std::string v_align = ctx.schema.getString(gtag, "vAlign", gfx);
  if (auto align = vAlignFromString(v_align))
    font.v_align = *align;
  else
    throw ConversionError("Unknown alignment '" + v_align + "'", gtag, "vAlign", gfx->GetLineNum());

  ShapeStyleProperty& style = element.style;
  style.border_color = readColor(ctx.schema, gtag, "borderColor", gfx);
  style.border_style = LineStyleType::fromName(ctx.schema.getString(gtag, "borderStyle", gfx));
  style.border_width = ctx.schema.getDouble(gtag, "borderWidth", gfx);
  style.fill_color = readColor(ctx.schema, gtag, "fillColor", gfx);
  style.shape_type = ShapeType::fromName(ctx.schema.getString(gtag, "shapeType", gfx));
}

/// Everything a shaped element other than State shares: id, groupRef,
/// absolute geometry and the comment group.
template <typename T>
void readShapedElement(const ReadContext& ctx, T& element, const XMLElement* elem, const std::string& tag)
{
  element.element_id = ctx.schema.getString(tag, "elementId", elem);
  element.group_ref = ctx.schema.getString(tag, "groupRef", elem);

  const XMLElement* gfx = requireGraphics(elem, tag);
  const std::string gtag = tag + ".Graphics";
  element.center =
      Eigen::Vector2d(ctx.schema.getDouble(gtag, "centerX", gfx), ctx.schema.getDouble(gtag, "centerY", gfx));
  element.style.z_order = ctx.schema.getOptionalInt(gtag, "zOrder", gfx);
  readFontAndStyle(ctx, element, gfx, gtag);
  readCommentGroup(ctx, element, elem);
}

void readGroups(ReadContext& ctx, const XMLElement* root)
{
  forEachWrapped(root, "Groups", "Group", [&](const XMLElement* elem) {
    auto group = std::make_unique<Group>();
    readShapedElement(ctx, *group, elem, "Group");
    group->text_label = ctx.schema.getString("Group", "textLabel", elem);
    group->type = GroupType::fromName(ctx.schema.getString("Group", "type", elem));
    group->xref = readXref(ctx, elem);
    admit(ctx, std::move(group), elem, "Group");
  });
}

void readLabels(ReadContext& ctx, const XMLElement* root)
{
  forEachWrapped(root, "Labels", "Label", [&](const XMLElement* elem) {
    auto label = std::make_unique<Label>();
    readShapedElement(ctx, *label, elem, "Label");
    label->text_label = ctx.schema.getRequired("Label", "textLabel", elem);
    label->href = ctx.schema.getString("Label", "href", elem);
    admit(ctx, std::move(label), elem, "Label");
  });
}

void readShapes(ReadContext& ctx, const XMLElement* root)
{
  forEachWrapped(root, "Shapes", "Shape", [&](const XMLElement* elem) {
    auto shape = std::make_unique<Shape>();
    readShapedElement(ctx, *shape, elem, "Shape");
    shape->text_label = ctx.schema.getString("Shape", "textLabel", elem);
    admit(ctx, std::move(shape), elem, "Shape");
  });
}

void readStates(ReadContext& ctx, const DataNode& parent, const XMLElement* node_elem)
{
  forEachWrapped(node_elem, "States", "State", [&](const XMLElement* elem) {
    auto state = std::make_unique<State>();
    state->element_id = ctx.schema.getString("State", "elementId", elem);
    state->element_ref = parent.element_id;
    state->text_label = ctx.schema.getRequired("State", "textLabel", elem);
    state->type = StateType::fromName(ctx.schema.getString("State", "type", elem));
    state->xref = readXref(ctx, elem);

    const XMLElement* gfx = requireGraphics(elem, "State");
    state->relative = Eigen::Vector2d(ctx.schema.getDouble("State.Graphics", "relX", gfx),
                                      ctx.schema.getDouble("State.Graphics", "relY", gfx));
    readFontAndStyle(ctx, *state, gfx, "State.Graphics");
    readCommentGroup(ctx, *state, elem);
    admit(ctx, std::move(state), elem, "State");
  });
}

void readDataNodes(ReadContext& ctx, const XMLElement* root)
{
  forEachWrapped(root, "DataNodes", "DataNode", [&](const XMLElement* elem) {
    auto node = std::make_unique<DataNode>();
    readShapedElement(ctx, *node, elem, "DataNode");
    node->text_label = ctx.schema.getRequired("DataNode", "textLabel", elem);
    node->type = DataNodeType::fromName(ctx.schema.getString("DataNode", "type", elem));
    node->alias_ref = ctx.schema.getString("DataNode", "aliasRef", elem);
    node->xref = readXref(ctx, elem);
    DataNode& added = admit(ctx, std::move(node), elem, "DataNode");
    readStates(ctx, added, elem);
  });
}

/// ---------------------------------------------------------------------------
/// Lines
/// ---------------------------------------------------------------------------

void readWaypoints(const ReadContext& ctx, LineElement& line, const XMLElement* elem, const std::string& tag)
{
  const XMLElement* waypoints = elem->FirstChildElement("Waypoints");
  if (!waypoints)
    throw ConversionError("Missing Waypoints element", tag, "", elem->GetLineNum());

  const std::string ptag = tag + ".Waypoints.Point";
  std::vector<const XMLElement*> points;
  forEachChild(waypoints, "Point", [&](const XMLElement* pt) { points.push_back(pt); });
  if (points.size() < 2)
    throw ConversionError("A line needs at least two points", tag, "", waypoints->GetLineNum());

  for (std::size_t i = 0; i < points.size(); ++i)
  {
    const XMLElement* pt = points[i];
    LinePoint& point = line.addPoint(ctx.schema.getDouble(ptag, "x", pt), ctx.schema.getDouble(ptag, "y", pt));
    point.element_id = ctx.schema.getString(ptag, "elementId", pt);
    point.element_ref = ctx.schema.getString(ptag, "elementRef", pt);

    const auto arrow_head = ArrowHeadType::fromName(ctx.schema.getString(ptag, "arrowHead", pt));
    if (i == 0)
      line.start_arrow_head = arrow_head;
    else if (i == points.size() - 1)
      line.end_arrow_head = arrow_head;

    auto rel_x = ctx.schema.getOptionalDouble(ptag, "relX", pt);
    auto rel_y = ctx.schema.getOptionalDouble(ptag, "relY", pt);
    if (!point.element_ref.empty() && rel_x && rel_y)
      point.relative = Eigen::Vector2d(*rel_x, *rel_y);
  }

  const std::string atag = tag + ".Waypoints.Anchor";
  forEachChild(waypoints, "Anchor", [&](const XMLElement* anchor_elem) {
    Anchor& anchor = line.addAnchor(ctx.schema.getDouble(atag, "position", anchor_elem),
                                    AnchorShapeType::fromName(ctx.schema.getString(atag, "shapeType", anchor_elem)));
    anchor.element_id = ctx.schema.getString(atag, "elementId", anchor_elem);
  });
}

template <typename T>
void readLines(ReadContext& ctx, const XMLElement* root, const char* wrapper, const char* tag,
               std::vector<std::unique_ptr<T>>& unidentified)
{
  forEachWrapped(root, wrapper, tag, [&](const XMLElement* elem) {
    auto line = std::make_unique<T>();
    line->element_id = ctx.schema.getString(tag, "elementId", elem);
    line->group_ref = ctx.schema.getString(tag, "groupRef", elem);
    readWaypoints(ctx, *line, elem, tag);

    const std::string gtag = std::string(tag) + ".Graphics";
    const XMLElement* gfx = requireGraphics(elem, tag);
    line->line_color = readColor(ctx.schema, gtag, "lineColor", gfx);
    line->line_style = LineStyleType::fromName(ctx.schema.getString(gtag, "lineStyle", gfx));
    line->line_width = ctx.schema.getDouble(gtag, "lineWidth", gfx);
    line->connector_type = ConnectorType::fromName(ctx.schema.getString(gtag, "connectorType", gfx));
    line->z_order = ctx.schema.getOptionalInt(gtag, "zOrder", gfx);

    readCommentGroup(ctx, *line, elem);
    if constexpr (std::is_same_v<T, Interaction>)
      line->xref = readXref(ctx, elem);

    if (line->element_id.empty())
      unidentified.push_back(std::move(line));
    else
      admit(ctx, std::move(line), elem, tag);
  });
}

template <typename T>
void admitUnidentified(ReadContext& ctx, std::vector<std::unique_ptr<T>>& lines)
{
  for (auto& line : lines)
  {
    line->element_id = ctx.model.lineIdFor(*line);
    ctx.model.add(std::move(line));
  }
  lines.clear();
}

}  // namespace

Gpml2021Reader::Gpml2021Reader(const DataSourceResolver* resolver) : resolver_(resolver)
{
}

PathwayModel Gpml2021Reader::read(const tinyxml2::XMLElement* root, std::uint32_t id_seed) const
{
  if (!root || std::string(root->Name()) != "Pathway")
    throw ConversionError("Root element is not <Pathway>");

  PathwayModel model(SchemaVersion::Gpml2021, id_seed);
  ReadContext ctx{ AttributeSchema::forVersion(SchemaVersion::Gpml2021), resolver_, model, {}, {}, {} };

  reserveElementIds(ctx, root, "Pathway");

  readPathway(ctx, root);
  readPools(ctx, root);
  readCommentGroup(ctx, model.pathway(), root);

  readGroups(ctx, root);
  readLabels(ctx, root);
  readShapes(ctx, root);
  readDataNodes(ctx, root);
  readLines(ctx, root, "Interactions", "Interaction", ctx.unidentified_interactions);
  readLines(ctx, root, "GraphicalLines", "GraphicalLine", ctx.unidentified_lines);

  admitUnidentified(ctx, ctx.unidentified_interactions);
  admitUnidentified(ctx, ctx.unidentified_lines);

  logger()->debug("Read GPML2021 pathway '{}': {} data node(s), {} interaction(s)", model.pathway().title,
                  model.dataNodes().size(), model.interactions().size());
  return model;
}

}  // namespace xml
}  // namespace gpml
