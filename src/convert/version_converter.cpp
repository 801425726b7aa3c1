#include <gpml/convert/version_converter.h>

#include <gpml/logging.h>
#include <gpml/xml/gpml2013a_format.h>

namespace gpml {
namespace convert {

namespace fmt2013 = xml::gpml2013a;

namespace {

/// ---------------------------------------------------------------------------
/// GPML2013a -> GPML2021
/// ---------------------------------------------------------------------------

LineStyleType upgradeLineStyle(const LineStyleType& style)
{
  return style == LineStyleKind::Broken ? LineStyleType(LineStyleKind::Dashed) : style;
}

/// DoubleLineProperty="Double" turns the style into Double and is consumed.
void upgradeDoubleLine(PathwayElement& element, LineStyleType& style)
{
  auto it = element.dynamic_properties.find(fmt2013::kDoubleLineKey);
  if (it == element.dynamic_properties.end())
    return;
  if (it->second == "Double")
    style = LineStyleKind::Double;
  logger()->debug("{}: {} consumed", element.element_id, it->first);
  element.dynamic_properties.erase(it);
}

void upgradeShapeType(ShapedElement& element)
{
  ShapeStyleProperty& style = element.style;
  if (style.shape_type.isCustom())
    style.shape_type = ShapeType::fromName(fmt2013::shapeNameToCamelCase(style.shape_type.name()));

  if (auto replacement = fmt2013::deprecatedShapeReplacement(style.shape_type.kind()))
  {
    style.shape_type = *replacement;
    style.border_style = LineStyleKind::Double;
    style.border_width = 3.0;
    style.fill_color = Color::transparent();
  }

  auto it = element.dynamic_properties.find(fmt2013::kCellularComponentKey);
  if (it == element.dynamic_properties.end())
    return;
  if (!it->second.empty() && it->second != "None")
    style.shape_type = ShapeType::fromName(fmt2013::shapeNameToCamelCase(it->second));
  logger()->debug("{}: {} consumed", element.element_id, it->first);
  element.dynamic_properties.erase(it);
}

ArrowHeadType upgradeArrowHead(const ArrowHeadType& arrow_head)
{
  auto kind = fmt2013::panelArrowHead(arrow_head.name());
  return kind ? ArrowHeadType(*kind) : arrow_head;
}

GroupType upgradeGroupType(const GroupType& type)
{
  if (type == GroupKind::Group)
    return GroupKind::Transparent;
  if (type == GroupKind::None)
    return GroupKind::Group;
  return type;
}

void upgradeShaped(ShapedElement& element)
{
  element.style.border_style = upgradeLineStyle(element.style.border_style);
  upgradeDoubleLine(element, element.style.border_style);
  upgradeShapeType(element);
}

void upgradeLine(LineElement& line)
{
  line.line_style = upgradeLineStyle(line.line_style);
  upgradeDoubleLine(line, line.line_style);
  line.start_arrow_head = upgradeArrowHead(line.start_arrow_head);
  line.end_arrow_head = upgradeArrowHead(line.end_arrow_head);
  for (auto& anchor : line.anchors)
  {
    if (anchor->shape_type == AnchorShapeKind::ReceptorRound)
      anchor->shape_type = AnchorShapeKind::Square;
  }
}

/// ---------------------------------------------------------------------------
/// GPML2021 -> GPML2013a
/// ---------------------------------------------------------------------------

void downgradeLineStyle(PathwayElement& element, LineStyleType& style, ConversionReport& report)
{
  if (style == LineStyleKind::Dashed)
  {
    style = LineStyleKind::Broken;
  }
  else if (style == LineStyleKind::Double)
  {
    style = LineStyleKind::Solid;
    element.setDynamicProperty(fmt2013::kDoubleLineKey, "Double");
  }
  else if (style.isCustom())
  {
    report.lost(element.element_id + ": line style '" + style.name() + "' written as Solid");
    style = LineStyleKind::Solid;
  }
}

void downgradeShapeType(ShapedElement& element)
{
  ShapeStyleProperty& style = element.style;
  if (auto base = fmt2013::cellularComponentBaseShape(style.shape_type.kind()))
  {
    element.setDynamicProperty(fmt2013::kCellularComponentKey,
                               fmt2013::shapeNameFromCamelCase(style.shape_type.name()));
    style.shape_type = *base;
  }

  const std::string name = style.shape_type.name();
  const std::string spaced = fmt2013::shapeNameFromCamelCase(name);
  if (spaced != name)
    style.shape_type = ShapeType::custom(spaced);
}

ArrowHeadType downgradeArrowHead(const ArrowHeadType& arrow_head)
{
  const auto& names = fmt2013::arrowHeadNames(arrow_head.kind());
  return names.empty() ? arrow_head : ArrowHeadType::fromName(names.front());
}

GroupType downgradeGroupType(const Group& group, ConversionReport& report)
{
  switch (group.type.kind())
  {
    case GroupKind::Group:
      return GroupKind::None;
    case GroupKind::Transparent:
      return GroupKind::Group;
    case GroupKind::Complex:
    case GroupKind::Pathway:
    case GroupKind::None:
      return group.type;
    default:
      report.lost("Group " + group.element_id + ": type '" + group.type.name() + "' written as None");
      return GroupKind::None;
  }
}

void downgradeShaped(ShapedElement& element, ConversionReport& report)
{
  downgradeLineStyle(element, element.style.border_style, report);
  downgradeShapeType(element);
}

void downgradeLine(LineElement& line, ConversionReport& report)
{
  downgradeLineStyle(line, line.line_style, report);
  line.start_arrow_head = downgradeArrowHead(line.start_arrow_head);
  line.end_arrow_head = downgradeArrowHead(line.end_arrow_head);
  for (auto& anchor : line.anchors)
  {
    if (anchor->shape_type == AnchorShapeKind::Square)
      anchor->shape_type = AnchorShapeKind::ReceptorRound;
  }
}

/// Data the GPML2013a writer has no place for.
void reportUnwritable(const PathwayModel& model, ConversionReport& report)
{
  const Pathway& pathway = model.pathway();
  if (pathway.xref)
    report.lost("Pathway Xref has no GPML2013a form");
  if (pathway.background_color != Color::white())
    report.lost("Pathway background color has no GPML2013a form");
  if (!model.evidences().empty())
    report.lost(std::to_string(model.evidences().size()) + " Evidence(s) have no GPML2013a form");

  for (const auto& group : model.groups())
  {
    if (group->xref)
      report.lost("Group " + group->element_id + ": Xref has no GPML2013a form");
  }
  for (PathwayElement* element : model.elements())
  {
    if (element->objectType() != ObjectType::State && !element->annotation_refs.empty())
      report.lost(std::string(toString(element->objectType())) + " " + element->element_id +
                  ": annotation refs have no GPML2013a form");
  }
  for (const auto& annotation : model.annotations())
  {
    if (!annotation->url.empty())
      report.lost("Annotation " + annotation->element_id + ": url has no GPML2013a form");
  }
}

}  // namespace

ConversionReport VersionConverter::convert(PathwayModel& model, SchemaVersion target) const
{
  if (model.version() == target)
    return {};
  return target == SchemaVersion::Gpml2021 ? upgrade(model) : downgrade(model);
}

ConversionReport VersionConverter::upgrade(PathwayModel& model) const
{
  ConversionReport report;
  if (model.version() == SchemaVersion::Gpml2021)
    return report;

  for (const auto& node : model.dataNodes())
  {
    if (node->type == DataNodeKind::Unknown)
      node->type = DataNodeKind::Undefined;
  }
  for (const auto& state : model.states())
  {
    if (state->type == StateKind::Unknown)
      state->type = StateKind::Undefined;
  }
  for (const auto& group : model.groups())
    group->type = upgradeGroupType(group->type);

  for (PathwayElement* element : model.elements())
  {
    if (auto* shaped = dynamic_cast<ShapedElement*>(element))
      upgradeShaped(*shaped);
    else if (auto* line = dynamic_cast<LineElement*>(element))
      upgradeLine(*line);
  }

  model.setVersion(SchemaVersion::Gpml2021);
  logger()->debug("Converted pathway '{}' to GPML2021", model.pathway().title);
  return report;
}

ConversionReport VersionConverter::downgrade(PathwayModel& model) const
{
  ConversionReport report;
  if (model.version() == SchemaVersion::Gpml2013a)
    return report;

  reportUnwritable(model, report);

  Pathway& pathway = model.pathway();
  if (!pathway.authors.empty() && !pathway.dynamicProperty(fmt2013::kPathwayAuthor))
  {
    std::string names;
    for (const auto& author : pathway.authors)
      names += (names.empty() ? "" : ", ") + author.name;
    pathway.setDynamicProperty(fmt2013::kPathwayAuthor, names);
  }

  for (const auto& node : model.dataNodes())
  {
    if (node->type == DataNodeKind::Undefined)
      node->type = DataNodeKind::Unknown;
    if (!node->alias_ref.empty())
      report.lost("DataNode " + node->element_id + ": aliasRef has no GPML2013a form");
  }
  for (const auto& state : model.states())
  {
    if (state->type == StateKind::Undefined)
      state->type = StateKind::Unknown;
  }
  for (const auto& group : model.groups())
    group->type = downgradeGroupType(*group, report);

  for (PathwayElement* element : model.elements())
  {
    if (auto* shaped = dynamic_cast<ShapedElement*>(element))
      downgradeShaped(*shaped, report);
    else if (auto* line = dynamic_cast<LineElement*>(element))
      downgradeLine(*line, report);
  }

  model.setVersion(SchemaVersion::Gpml2013a);
  for (const auto& message : report.messages)
    logger()->warn("GPML2013a conversion: {}", message);
  return report;
}

}  // namespace convert
}  // namespace gpml
