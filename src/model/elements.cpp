#include <gpml/model/elements.h>

namespace gpml {

const char* toString(ObjectType type)
{
  switch (type)
  {
    case ObjectType::Pathway:
      return "Pathway";
    case ObjectType::DataNode:
      return "DataNode";
    case ObjectType::State:
      return "State";
    case ObjectType::Interaction:
      return "Interaction";
    case ObjectType::GraphicalLine:
      return "GraphicalLine";
    case ObjectType::Label:
      return "Label";
    case ObjectType::Shape:
      return "Shape";
    case ObjectType::Group:
      return "Group";
    case ObjectType::LinePoint:
      return "Point";
    case ObjectType::Anchor:
      return "Anchor";
    case ObjectType::Annotation:
      return "Annotation";
    case ObjectType::Citation:
      return "Citation";
    case ObjectType::Evidence:
      return "Evidence";
  }
  return "Unknown";
}

std::optional<std::string> PathwayElement::dynamicProperty(const std::string& key) const
{
  auto it = dynamic_properties.find(key);
  if (it == dynamic_properties.end())
    return std::nullopt;
  return it->second;
}

void PathwayElement::setDynamicProperty(const std::string& key, const std::string& value)
{
  dynamic_properties[key] = value;
}

LinePoint& LineElement::addPoint(double x, double y)
{
  points.push_back(std::make_unique<LinePoint>());
  points.back()->position = Eigen::Vector2d(x, y);
  return *points.back();
}

Anchor& LineElement::addAnchor(double position, AnchorShapeType shape_type)
{
  anchors.push_back(std::make_unique<Anchor>());
  anchors.back()->position = position;
  anchors.back()->shape_type = shape_type;
  return *anchors.back();
}

LinePoint* LineElement::startPoint() const
{
  return points.empty() ? nullptr : points.front().get();
}

LinePoint* LineElement::endPoint() const
{
  return points.empty() ? nullptr : points.back().get();
}

bool Annotation::sameContent(const Annotation& other) const
{
  return value == other.value && type == other.type && xref == other.xref && url == other.url;
}

bool Citation::sameContent(const Citation& other) const
{
  return xref == other.xref && url == other.url && title == other.title && source == other.source &&
         year == other.year && authors == other.authors;
}

bool Evidence::sameContent(const Evidence& other) const
{
  return value == other.value && xref == other.xref && url == other.url;
}

bool isLinkable(const PathwayObject& object)
{
  switch (object.objectType())
  {
    case ObjectType::DataNode:
    case ObjectType::State:
    case ObjectType::Label:
    case ObjectType::Shape:
    case ObjectType::Group:
    case ObjectType::Anchor:
      return true;
    default:
      return false;
  }
}

}  // namespace gpml
