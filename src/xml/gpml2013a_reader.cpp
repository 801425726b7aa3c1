#include <gpml/xml/gpml2013a_reader.h>

#include <algorithm>
#include <map>
#include <set>
#include <type_traits>
#include <utility>
#include <vector>

#include <gpml/errors.h>
#include <gpml/logging.h>
#include <gpml/model/coordinates.h>
#include <gpml/xml/attribute_schema.h>
#include <gpml/xml/codec_common.h>
#include <gpml/xml/gpml2013a_format.h>
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

  std::multiset<std::string> graph_ids;                             // every GraphId in the document
  std::map<std::string, const XMLElement*> publication_xrefs;       // rdf:id -> bp:PublicationXref
  std::map<std::string, std::string> group_ids;                     // GroupId -> group element id
  std::map<std::string, std::string> group_graph_ids;               // group GraphId -> group element id
  std::vector<std::unique_ptr<Interaction>> unidentified_interactions;
  std::vector<std::unique_ptr<GraphicalLine>> unidentified_lines;
};

template <typename Fn>
void forEachChild(const XMLElement* parent, const char* name, Fn&& fn)
{
  for (const XMLElement* child = parent->FirstChildElement(name); child; child = child->NextSiblingElement(name))
    fn(child);
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
    throw ConversionError("Duplicate element id '" + e.id() + "'", tag, "GraphId", elem->GetLineNum());
  }
}

/// ---------------------------------------------------------------------------
/// Document wide tables
/// ---------------------------------------------------------------------------

void collectGraphIds(ReadContext& ctx, const XMLElement* root)
{
  auto collect = [&](const std::string& tag, const XMLElement* elem) {
    if (!ctx.schema.contains(tag, "GraphId"))
      return;
    std::string id = ctx.schema.getString(tag, "GraphId", elem);
    if (!id.empty())
      ctx.graph_ids.insert(std::move(id));
  };

  for (const XMLElement* elem = root->FirstChildElement(); elem; elem = elem->NextSiblingElement())
  {
    const std::string name = elem->Name();
    collect(name, elem);
    if (name != "Interaction" && name != "GraphicalLine")
      continue;
    if (const XMLElement* gfx = elem->FirstChildElement("Graphics"))
    {
      for (const XMLElement* part = gfx->FirstChildElement(); part; part = part->NextSiblingElement())
        collect(name + ".Graphics." + part->Name(), part);
    }
  }

  for (const auto& id : ctx.graph_ids)
    ctx.model.ids().reserve(id);
}

void collectPublicationXrefs(ReadContext& ctx, const XMLElement* root)
{
  const XMLElement* biopax = root->FirstChildElement("Biopax");
  for (const XMLElement* xref : childrenLocal(biopax, "PublicationXref"))
  {
    const char* id = attributeLocal(xref, "id");
    if (!id || !*id)
    {
      logger()->warn("PublicationXref without rdf:id at line {} ignored", xref->GetLineNum());
      continue;
    }
    ctx.publication_xrefs[id] = xref;
    ctx.model.ids().reserve(id);
  }
}

/// ---------------------------------------------------------------------------
/// Comment group: Comment, BiopaxRef, Attribute
/// ---------------------------------------------------------------------------

std::string firstNonEmptyChild(const XMLElement* parent, const char* name)
{
  for (const XMLElement* child : childrenLocal(parent, name))
  {
    std::string text = textOf(child);
    if (!text.empty())
      return text;
  }
  return {};
}

std::unique_ptr<Citation> readPublicationXref(const ReadContext& ctx, const std::string& id,
                                              const XMLElement* publication)
{
  auto citation = std::make_unique<Citation>();
  citation->element_id = id;
  citation->xref = makeXref(firstNonEmptyChild(publication, "ID"), firstNonEmptyChild(publication, "DB"),
                            ctx.resolver);
  citation->title = firstNonEmptyChild(publication, "TITLE");
  citation->source = firstNonEmptyChild(publication, "SOURCE");
  citation->year = firstNonEmptyChild(publication, "YEAR");
  for (const XMLElement* author : childrenLocal(publication, "AUTHORS"))
  {
    std::string text = textOf(author);
    if (!text.empty())
      citation->authors.push_back(text);
  }

  // Publications without PubMed id sometimes carry the web address as source.
  if (citation->source.rfind("http", 0) == 0 || citation->source.rfind("www", 0) == 0)
    citation->url = citation->source;
  return citation;
}

void readComments(const ReadContext& ctx, PathwayElement& element, const XMLElement* elem)
{
  forEachChild(elem, "Comment", [&](const XMLElement* comment) {
    std::string text = textOf(comment);
    if (text.empty())
      return;
    std::string source = ctx.schema.getString("Comment", "Source", comment);
    if (element.objectType() == ObjectType::Pathway && source == gpml2013a::kDescriptionSource)
    {
      static_cast<Pathway&>(element).description = text;
      return;
    }
    element.comments.push_back(Comment{ text, source });
  });
}

void readBiopaxRefs(ReadContext& ctx, PathwayElement& element, const XMLElement* elem)
{
  forEachChild(elem, "BiopaxRef", [&](const XMLElement* ref) {
    const std::string id = textOf(ref);
    auto it = ctx.publication_xrefs.find(id);
    if (it == ctx.publication_xrefs.end())
    {
      logger()->warn("BiopaxRef '{}' at line {} names no PublicationXref, dropped", id, ref->GetLineNum());
      return;
    }
    Citation& citation = ctx.model.add(readPublicationXref(ctx, id, it->second));
    for (const auto& existing : element.citation_refs)
    {
      if (existing.citation_id == citation.element_id)
        return;
    }
    element.citation_refs.push_back(CitationRef{ citation.element_id, {} });
  });
}

void readDynamicProperties(const ReadContext& ctx, PathwayElement& element, const XMLElement* elem)
{
  forEachChild(elem, "Attribute", [&](const XMLElement* attr) {
    const std::string key = ctx.schema.getRequired("Attribute", "Key", attr);
    const std::string value = ctx.schema.getRequired("Attribute", "Value", attr);
    if (element.objectType() == ObjectType::State && key == gpml2013a::kStateRotationKey)
    {
      auto rotation = parseDouble(value);
      if (!rotation)
        throw ConversionError("Malformed number '" + value + "'", "Attribute", "Value", attr->GetLineNum());
      static_cast<State&>(element).rotation = *rotation;
      return;
    }
    element.setDynamicProperty(key, value);
  });
}

void readCommentGroup(ReadContext& ctx, PathwayElement& element, const XMLElement* elem)
{
  readComments(ctx, element, elem);
  readBiopaxRefs(ctx, element, elem);
  readDynamicProperties(ctx, element, elem);
}

/// ---------------------------------------------------------------------------
/// Pathway
/// ---------------------------------------------------------------------------

void readOptionalProperty(const ReadContext& ctx, Pathway& pathway, const char* name, const char* key,
                          const XMLElement* root)
{
  std::string value = ctx.schema.getString("Pathway", name, root);
  if (!value.empty())
    pathway.setDynamicProperty(key, value);
}

void readPathway(ReadContext& ctx, const XMLElement* root)
{
  Pathway& pathway = ctx.model.pathway();
  pathway.title = ctx.schema.getRequired("Pathway", "Name", root);
  pathway.organism = ctx.schema.getString("Pathway", "Organism", root);
  pathway.source = ctx.schema.getString("Pathway", "Data-Source", root);
  pathway.version = ctx.schema.getString("Pathway", "Version", root);
  pathway.license = ctx.schema.getString("Pathway", "License", root);

  readOptionalProperty(ctx, pathway, "Author", gpml2013a::kPathwayAuthor, root);
  readOptionalProperty(ctx, pathway, "Maintainer", gpml2013a::kPathwayMaintainer, root);
  readOptionalProperty(ctx, pathway, "Email", gpml2013a::kPathwayEmail, root);
  readOptionalProperty(ctx, pathway, "Last-Modified", gpml2013a::kPathwayLastModified, root);

  const XMLElement* gfx = requireGraphics(root, "Pathway");
  pathway.board_width = ctx.schema.getDouble("Pathway.Graphics", "BoardWidth", gfx);
  pathway.board_height = ctx.schema.getDouble("Pathway.Graphics", "BoardHeight", gfx);

  if (const XMLElement* info_box = root->FirstChildElement("InfoBox"))
  {
    pathway.setDynamicProperty(gpml2013a::kInfoBoxCenterX, ctx.schema.getRequired("InfoBox", "CenterX", info_box));
    pathway.setDynamicProperty(gpml2013a::kInfoBoxCenterY, ctx.schema.getRequired("InfoBox", "CenterY", info_box));
  }
  if (const XMLElement* legend = root->FirstChildElement("Legend"))
  {
    pathway.setDynamicProperty(gpml2013a::kLegendCenterX, ctx.schema.getRequired("Legend", "CenterX", legend));
    pathway.setDynamicProperty(gpml2013a::kLegendCenterY, ctx.schema.getRequired("Legend", "CenterY", legend));
  }

  readCommentGroup(ctx, pathway, root);
}

/// openControlledVocabulary entries of the Biopax block are pathway level
/// ontology tags ("Pathway Ontology", "Disease", "Cell Type").
void readOntologyTerms(ReadContext& ctx, const XMLElement* root)
{
  const XMLElement* biopax = root->FirstChildElement("Biopax");
  for (const XMLElement* vocabulary : childrenLocal(biopax, "openControlledVocabulary"))
  {
    const std::string term = childText(vocabulary, "TERM");
    const std::string ontology_id = childText(vocabulary, "ID");
    const std::string ontology = childText(vocabulary, "Ontology");

    std::string identifier = ontology_id;
    std::string database;
    auto colon = ontology_id.find(':');
    if (colon != std::string::npos)
    {
      database = ontology_id.substr(0, colon);
      identifier = ontology_id.substr(colon + 1);
    }

    auto annotation = std::make_unique<Annotation>();
    annotation->value = term;
    annotation->type =
        gpml2013a::isOntologyVocabulary(ontology) ? AnnotationType(AnnotationKind::Ontology) :
                                                    AnnotationType::fromName(ontology);
    annotation->xref = makeXref(identifier, database, ctx.resolver);

    Annotation& added = ctx.model.add(std::move(annotation));
    ctx.model.pathway().annotation_refs.push_back(AnnotationRef{ added.element_id, {}, {} });
  }
}

/// ---------------------------------------------------------------------------
/// Shaped elements
/// ---------------------------------------------------------------------------

void readXref(const ReadContext& ctx, std::optional<Xref>& xref, const XMLElement* elem, const std::string& tag)
{
  const XMLElement* xref_elem = elem->FirstChildElement("Xref");
  if (!xref_elem)
    return;
  const std::string xtag = tag + ".Xref";
  xref = makeXref(ctx.schema.getRequired(xtag, "ID", xref_elem), ctx.schema.getRequired(xtag, "Database", xref_elem),
                  ctx.resolver);
}

std::string resolveGroupRef(const ReadContext& ctx, const std::string& group_id)
{
  auto it = ctx.group_ids.find(group_id);
  return it == ctx.group_ids.end() ? group_id : it->second;
}

void readGroupRef(const ReadContext& ctx, Groupable& groupable, const XMLElement* elem, const std::string& tag)
{
  std::string group_ref = ctx.schema.getString(tag, "GroupRef", elem);
  if (!group_ref.empty())
    groupable.group_ref = resolveGroupRef(ctx, group_ref);
}

void readFont(const ReadContext& ctx, FontProperty& font, const XMLElement* gfx, const std::string& gtag)
{
  font.text_color = readColor(ctx.schema, gtag, "Color", gfx);
  font.name = ctx.schema.getString(gtag, "FontName", gfx);
  font.bold = ctx.schema.getString(gtag, "FontWeight", gfx) == "Bold";
  font.italic = ctx.schema.getString(gtag, "FontStyle", gfx) == "Italic";
  font.underline = ctx.schema.getString(gtag, "FontDecoration", gfx) == "Underline";
  font.strikethru = ctx.schema.getString(gtag, "FontStrikethru", gfx) == "Strikethru";
  font.size = ctx.schema.getInt(gtag, "FontSize", gfx);

  const std::string align = ctx.schema.getString(gtag, "Align", gfx);
  auto h_align = hAlignFromString(align);
  if (!h_align)
    throw ConversionError("Unknown alignment '" + align + "'", gtag, "Align", gfx->GetLineNum());
  font.h_align = *h_align;

  const std::string valign = ctx.schema.getString(gtag, "Valign", gfx);
  auto v_align = vAlignFromString(valign);
  if (!v_align)
    throw ConversionError("Unknown alignment '" + valign + "'", gtag, "Valign", gfx->GetLineNum());
  font.v_align = *v_align;
}

void readShapeStyle(const ReadContext& ctx, ShapedElement& element, const XMLElement* gfx, const std::string& gtag)
{
  ShapeStyleProperty& style = element.style;
  style.border_color = readColor(ctx.schema, gtag, "Color", gfx);
  style.border_style = LineStyleType::fromName(ctx.schema.getString(gtag, "LineStyle", gfx));
  style.border_width = ctx.schema.getDouble(gtag, "LineThickness", gfx);
  style.fill_color = readColor(ctx.schema, gtag, "FillColor", gfx);
  style.shape_type = ShapeType::fromName(ctx.schema.getString(gtag, "ShapeType", gfx));
  style.z_order = ctx.schema.getOptionalInt(gtag, "ZOrder", gfx);
}

/// Geometry, font and style of DataNode, Label and Shape.
void readShapedGraphics(const ReadContext& ctx, ShapedElement& element, const XMLElement* elem, const std::string& tag)
{
  const XMLElement* gfx = requireGraphics(elem, tag);
  const std::string gtag = tag + ".Graphics";
  element.center = Eigen::Vector2d(ctx.schema.getDouble(gtag, "CenterX", gfx),
                                   ctx.schema.getDouble(gtag, "CenterY", gfx));
  element.width = ctx.schema.getDouble(gtag, "Width", gfx);
  element.height = ctx.schema.getDouble(gtag, "Height", gfx);
  readFont(ctx, element.font, gfx, gtag);
  readShapeStyle(ctx, element, gfx, gtag);
  if (ctx.schema.contains(gtag, "Rotation"))
    element.rotation = ctx.schema.getDouble(gtag, "Rotation", gfx);
}

void readGroups(ReadContext& ctx, const XMLElement* root)
{
  std::vector<std::pair<Group*, std::string>> parent_refs;

  forEachChild(root, "Group", [&](const XMLElement* elem) {
    auto group = std::make_unique<Group>();
    const std::string group_id = ctx.schema.getRequired("Group", "GroupId", elem);
    const std::string graph_id = ctx.schema.getString("Group", "GraphId", elem);

    // GroupId and GraphId fold into one element id, the GroupId unless the
    // GraphId of another element already uses it. Points naming the group's
    // GraphId are redirected through group_graph_ids.
    const std::size_t own = graph_id == group_id ? 1 : 0;
    if (ctx.graph_ids.count(group_id) == own && !ctx.model.ids().contains(group_id))
      group->element_id = group_id;

    group->type = GroupType::fromName(ctx.schema.getString("Group", "Style", elem));
    group->text_label = ctx.schema.getString("Group", "TextLabel", elem);
    gpml2013a::applyGroupGraphics(*group);
    readCommentGroup(ctx, *group, elem);

    const std::string group_ref = ctx.schema.getString("Group", "GroupRef", elem);
    Group& added = admit(ctx, std::move(group), elem, "Group");
    ctx.group_ids[group_id] = added.element_id;
    if (!graph_id.empty())
      ctx.group_graph_ids[graph_id] = added.element_id;
    if (!group_ref.empty())
      parent_refs.emplace_back(&added, group_ref);
  });

  for (auto& [group, group_ref] : parent_refs)
    group->group_ref = resolveGroupRef(ctx, group_ref);
}

void readLabels(ReadContext& ctx, const XMLElement* root)
{
  forEachChild(root, "Label", [&](const XMLElement* elem) {
    auto label = std::make_unique<Label>();
    label->element_id = ctx.schema.getString("Label", "GraphId", elem);
    label->text_label = ctx.schema.getRequired("Label", "TextLabel", elem);
    label->href = ctx.schema.getString("Label", "Href", elem);
    readShapedGraphics(ctx, *label, elem, "Label");
    readGroupRef(ctx, *label, elem, "Label");
    readCommentGroup(ctx, *label, elem);
    admit(ctx, std::move(label), elem, "Label");
  });
}

void readShapes(ReadContext& ctx, const XMLElement* root)
{
  forEachChild(root, "Shape", [&](const XMLElement* elem) {
    auto shape = std::make_unique<Shape>();
    shape->element_id = ctx.schema.getString("Shape", "GraphId", elem);
    shape->text_label = ctx.schema.getString("Shape", "TextLabel", elem);
    readShapedGraphics(ctx, *shape, elem, "Shape");
    readGroupRef(ctx, *shape, elem, "Shape");
    readCommentGroup(ctx, *shape, elem);
    admit(ctx, std::move(shape), elem, "Shape");
  });
}

void readDataNodes(ReadContext& ctx, const XMLElement* root)
{
  forEachChild(root, "DataNode", [&](const XMLElement* elem) {
    auto node = std::make_unique<DataNode>();
    node->element_id = ctx.schema.getString("DataNode", "GraphId", elem);
    node->text_label = ctx.schema.getRequired("DataNode", "TextLabel", elem);
    node->type = DataNodeType::fromName(ctx.schema.getString("DataNode", "Type", elem));
    readShapedGraphics(ctx, *node, elem, "DataNode");
    readGroupRef(ctx, *node, elem, "DataNode");
    readCommentGroup(ctx, *node, elem);
    readXref(ctx, node->xref, elem, "DataNode");
    admit(ctx, std::move(node), elem, "DataNode");
  });
}

/// ---------------------------------------------------------------------------
/// States
/// ---------------------------------------------------------------------------

std::vector<std::string> split(const std::string& text, char separator)
{
  std::vector<std::string> parts;
  std::string::size_type begin = 0;
  while (true)
  {
    auto end = text.find(separator, begin);
    parts.push_back(text.substr(begin, end - begin));
    if (end == std::string::npos)
      break;
    begin = end + 1;
  }
  return parts;
}

std::string trim(const std::string& text)
{
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return {};
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

/// Phosphosite states written by older tools encode their annotations as a
/// comment like "parentid=P12345; ptm=p; direction=u". Such comments are
/// replaced by Annotations on the state; sitegrpid becomes the state Xref.
void convertStateComments(ReadContext& ctx, State& state)
{
  std::vector<Comment> kept;
  for (auto& comment : state.comments)
  {
    if (comment.text.find('=') == std::string::npos && comment.text.find(';') == std::string::npos)
    {
      kept.push_back(std::move(comment));
      continue;
    }

    bool is_annotation = false;
    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& part : split(comment.text, ';'))
    {
      auto key_value = split(trim(part), '=');
      std::string key = key_value[0] == "parent" ? std::string(gpml2013a::kParentId) : key_value[0];
      if (gpml2013a::isStateCommentKey(key))
        is_annotation = true;
      if (key_value.size() < 2)
        continue;

      auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e) { return e.first == key; });
      if (it != entries.end())
        it->second = key_value[1];
      else
        entries.emplace_back(key, key_value[1]);
    }

    if (!is_annotation)
    {
      kept.push_back(std::move(comment));
      continue;
    }

    for (const auto& [key, value] : entries)
    {
      auto annotation = std::make_unique<Annotation>();
      annotation->value = value;
      annotation->type = AnnotationType::fromName(key);

      if (key == gpml2013a::kParentId)
      {
        annotation->xref = makeXref(value, gpml2013a::kParentIdDatabase, ctx.resolver);
      }
      else if (key == gpml2013a::kParentSymbol)
      {
        annotation->xref = makeXref(value, gpml2013a::kParentSymbolDatabase, ctx.resolver);
      }
      else if (key == gpml2013a::kSiteGroupId)
      {
        state.xref = makeXref(value, gpml2013a::kSiteGroupIdDatabase, ctx.resolver);
        continue;
      }
      else if (key == gpml2013a::kPtm || key == gpml2013a::kDirection)
      {
        auto term = key == gpml2013a::kPtm ? gpml2013a::ptmTerm(value) : gpml2013a::directionTerm(value);
        annotation->type = AnnotationKind::Ontology;
        if (term)
        {
          annotation->value = term->term;
          annotation->xref = makeXref(term->identifier, term->database, ctx.resolver);
        }
      }

      Annotation& added = ctx.model.add(std::move(annotation));
      state.annotation_refs.push_back(AnnotationRef{ added.element_id, {}, {} });
    }
    logger()->trace("State {}: comment '{}' converted to annotations", state.element_id, comment.text);
  }
  state.comments = std::move(kept);
}

void readStates(ReadContext& ctx, const XMLElement* root)
{
  forEachChild(root, "State", [&](const XMLElement* elem) {
    auto state = std::make_unique<State>();
    state->element_id = ctx.schema.getString("State", "GraphId", elem);
    state->text_label = ctx.schema.getRequired("State", "TextLabel", elem);
    state->type = StateType::fromName(ctx.schema.getString("State", "StateType", elem));
    state->element_ref = ctx.schema.getString("State", "GraphRef", elem);

    const XMLElement* gfx = requireGraphics(elem, "State");
    state->relative = Eigen::Vector2d(ctx.schema.getDouble("State.Graphics", "RelX", gfx),
                                      ctx.schema.getDouble("State.Graphics", "RelY", gfx));
    state->width = ctx.schema.getDouble("State.Graphics", "Width", gfx);
    state->height = ctx.schema.getDouble("State.Graphics", "Height", gfx);
    readShapeStyle(ctx, *state, gfx, "State.Graphics");
    if (!state->style.z_order)
    {
      if (auto* parent = ctx.model.find<DataNode>(state->element_ref))
      {
        if (parent->style.z_order)
          state->style.z_order = *parent->style.z_order + 1;
      }
    }

    readCommentGroup(ctx, *state, elem);
    convertStateComments(ctx, *state);

    std::optional<Xref> xref;
    readXref(ctx, xref, elem, "State");
    if (xref)
      state->xref = xref;

    admit(ctx, std::move(state), elem, "State");
  });
}

/// ---------------------------------------------------------------------------
/// Lines
/// ---------------------------------------------------------------------------

void readLineStyle(const ReadContext& ctx, LineElement& line, const XMLElement* gfx, const std::string& gtag)
{
  line.line_color = readColor(ctx.schema, gtag, "Color", gfx);
  line.line_style = LineStyleType::fromName(ctx.schema.getString(gtag, "LineStyle", gfx));
  line.line_width = ctx.schema.getDouble(gtag, "LineThickness", gfx);
  line.connector_type = ConnectorType::fromName(ctx.schema.getString(gtag, "ConnectorType", gfx));
  line.z_order = ctx.schema.getOptionalInt(gtag, "ZOrder", gfx);
}

void readPoints(const ReadContext& ctx, LineElement& line, const XMLElement* gfx, const std::string& tag)
{
  const std::string ptag = tag + ".Graphics.Point";
  std::vector<const XMLElement*> points;
  forEachChild(gfx, "Point", [&](const XMLElement* pt) { points.push_back(pt); });
  if (points.size() < 2)
    throw ConversionError("A line needs at least two points", tag, "", gfx->GetLineNum());

  for (std::size_t i = 0; i < points.size(); ++i)
  {
    const XMLElement* pt = points[i];
    LinePoint& point = line.addPoint(ctx.schema.getDouble(ptag, "X", pt), ctx.schema.getDouble(ptag, "Y", pt));
    point.element_id = ctx.schema.getString(ptag, "GraphId", pt);

    const auto arrow_head = ArrowHeadType::fromName(ctx.schema.getString(ptag, "ArrowHead", pt));
    if (i == 0)
      line.start_arrow_head = arrow_head;
    else if (i == points.size() - 1)
      line.end_arrow_head = arrow_head;

    const std::string graph_ref = ctx.schema.getString(ptag, "GraphRef", pt);
    if (graph_ref.empty())
      continue;

    // Points may name a group by its GraphId, which may differ from the
    // group's element id.
    auto it = ctx.group_graph_ids.find(graph_ref);
    point.element_ref = it == ctx.group_graph_ids.end() ? graph_ref : it->second;

    auto rel_x = ctx.schema.getOptionalDouble(ptag, "RelX", pt);
    auto rel_y = ctx.schema.getOptionalDouble(ptag, "RelY", pt);
    if (rel_x && rel_y)
      point.relative = Eigen::Vector2d(*rel_x, *rel_y);
  }
}

void readAnchors(const ReadContext& ctx, LineElement& line, const XMLElement* gfx, const std::string& tag)
{
  const std::string atag = tag + ".Graphics.Anchor";
  forEachChild(gfx, "Anchor", [&](const XMLElement* elem) {
    Anchor& anchor = line.addAnchor(ctx.schema.getDouble(atag, "Position", elem),
                                    AnchorShapeType::fromName(ctx.schema.getString(atag, "Shape", elem)));
    anchor.element_id = ctx.schema.getString(atag, "GraphId", elem);
  });
}

template <typename T>
void readLines(ReadContext& ctx, const XMLElement* root, const char* tag,
               std::vector<std::unique_ptr<T>>& unidentified)
{
  forEachChild(root, tag, [&](const XMLElement* elem) {
    auto line = std::make_unique<T>();
    line->element_id = ctx.schema.getString(tag, "GraphId", elem);
    line->start_arrow_head = ArrowHeadKind::Line;
    line->end_arrow_head = ArrowHeadKind::Line;

    const XMLElement* gfx = requireGraphics(elem, tag);
    readPoints(ctx, *line, gfx, tag);
    readAnchors(ctx, *line, gfx, tag);
    readLineStyle(ctx, *line, gfx, std::string(tag) + ".Graphics");
    readGroupRef(ctx, *line, elem, tag);
    readCommentGroup(ctx, *line, elem);
    if constexpr (std::is_same_v<T, Interaction>)
      readXref(ctx, line->xref, elem, tag);

    if (line->element_id.empty())
      unidentified.push_back(std::move(line));
    else
      admit(ctx, std::move(line), elem, tag);
  });
}

/// Lines without GraphId are admitted last, once every written id is known,
/// so their derived ids cannot shadow one from the document.
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

Gpml2013aReader::Gpml2013aReader(const DataSourceResolver* resolver) : resolver_(resolver)
{
}

PathwayModel Gpml2013aReader::read(const tinyxml2::XMLElement* root, std::uint32_t id_seed) const
{
  if (!root || std::string(root->Name()) != "Pathway")
    throw ConversionError("Root element is not <Pathway>");

  PathwayModel model(SchemaVersion::Gpml2013a, id_seed);
  ReadContext ctx{ AttributeSchema::forVersion(SchemaVersion::Gpml2013a), resolver_, model, {}, {}, {}, {}, {}, {} };

  collectGraphIds(ctx, root);
  collectPublicationXrefs(ctx, root);

  readPathway(ctx, root);
  readOntologyTerms(ctx, root);

  readGroups(ctx, root);
  readLabels(ctx, root);
  readShapes(ctx, root);
  readDataNodes(ctx, root);
  readStates(ctx, root);
  readLines(ctx, root, "Interaction", ctx.unidentified_interactions);
  readLines(ctx, root, "GraphicalLine", ctx.unidentified_lines);

  admitUnidentified(ctx, ctx.unidentified_interactions);
  admitUnidentified(ctx, ctx.unidentified_lines);

  std::size_t removed = model.removeEmptyGroups();
  if (removed > 0)
    logger()->debug("Removed {} empty group(s)", removed);
  updateGroupBounds(model);

  logger()->debug("Read GPML2013a pathway '{}': {} data node(s), {} interaction(s)", model.pathway().title,
                  model.dataNodes().size(), model.interactions().size());
  return model;
}

}  // namespace xml
}  // namespace gpml
