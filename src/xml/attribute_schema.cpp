#include <gpml/xml/attribute_schema.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

#include <gpml/errors.h>
#include <gpml/model/color.h>
#include <gpml/xml/utils.h>

namespace gpml {
namespace xml {

namespace {

constexpr bool Required = true;
constexpr bool Optional = false;
constexpr const char* NoDefault = nullptr;
constexpr double kPi = 3.14159265358979323846;

/// Font and style attributes shared by the shaped GPML2013a elements.
#define GPML_2013A_SHAPED_GRAPHICS(X, TAG, FILL, SHAPE)                                                                \
  X(TAG ".Graphics@CenterX", Float, NoDefault, Required)                                                               \
  X(TAG ".Graphics@CenterY", Float, NoDefault, Required)                                                               \
  X(TAG ".Graphics@Width", Dimension, NoDefault, Required)                                                             \
  X(TAG ".Graphics@Height", Dimension, NoDefault, Required)                                                            \
  X(TAG ".Graphics@FontName", String, "Arial", Optional)                                                               \
  X(TAG ".Graphics@FontStyle", String, "Normal", Optional)                                                             \
  X(TAG ".Graphics@FontDecoration", String, "Normal", Optional)                                                        \
  X(TAG ".Graphics@FontStrikethru", String, "Normal", Optional)                                                        \
  X(TAG ".Graphics@FontWeight", String, "Normal", Optional)                                                            \
  X(TAG ".Graphics@FontSize", Integer, "12", Optional)                                                                 \
  X(TAG ".Graphics@Align", String, "Center", Optional)                                                                 \
  X(TAG ".Graphics@Valign", String, "Top", Optional)                                                                   \
  X(TAG ".Graphics@Color", Color, "Black", Optional)                                                                   \
  X(TAG ".Graphics@LineStyle", Style, "Solid", Optional)                                                               \
  X(TAG ".Graphics@LineThickness", Float, "1.0", Optional)                                                             \
  X(TAG ".Graphics@FillColor", Color, FILL, Optional)                                                                  \
  X(TAG ".Graphics@ShapeType", String, SHAPE, Optional)                                                                \
  X(TAG ".Graphics@ZOrder", Integer, NoDefault, Optional)

#define GPML_2013A_LINE(X, TAG)                                                                                        \
  X(TAG ".Graphics.Point@X", Float, NoDefault, Required)                                                               \
  X(TAG ".Graphics.Point@Y", Float, NoDefault, Required)                                                               \
  X(TAG ".Graphics.Point@RelX", Float, NoDefault, Optional)                                                            \
  X(TAG ".Graphics.Point@RelY", Float, NoDefault, Optional)                                                            \
  X(TAG ".Graphics.Point@GraphRef", IdRef, NoDefault, Optional)                                                        \
  X(TAG ".Graphics.Point@GraphId", Id, NoDefault, Optional)                                                            \
  X(TAG ".Graphics.Point@ArrowHead", String, "Line", Optional)                                                         \
  X(TAG ".Graphics.Anchor@Position", Float, NoDefault, Required)                                                       \
  X(TAG ".Graphics.Anchor@GraphId", Id, NoDefault, Optional)                                                           \
  X(TAG ".Graphics.Anchor@Shape", String, "ReceptorRound", Optional)                                                   \
  X(TAG ".Graphics@Color", Color, "Black", Optional)                                                                   \
  X(TAG ".Graphics@LineThickness", Float, "1.0", Optional)                                                             \
  X(TAG ".Graphics@LineStyle", Style, "Solid", Optional)                                                               \
  X(TAG ".Graphics@ConnectorType", String, "Straight", Optional)                                                       \
  X(TAG ".Graphics@ZOrder", Integer, NoDefault, Optional)                                                              \
  X(TAG "@GroupRef", String, NoDefault, Optional)                                                                      \
  X(TAG "@GraphId", Id, NoDefault, Optional)

#define GPML_2013A_ATTRIBUTES(X)                                                                                       \
  X("Comment@Source", String, NoDefault, Optional)                                                                     \
  X("PublicationXref@ID", String, NoDefault, Required)                                                                 \
  X("PublicationXref@Database", String, NoDefault, Required)                                                           \
  X("Attribute@Key", String, NoDefault, Required)                                                                      \
  X("Attribute@Value", String, NoDefault, Required)                                                                    \
  X("Pathway.Graphics@BoardWidth", Dimension, NoDefault, Required)                                                     \
  X("Pathway.Graphics@BoardHeight", Dimension, NoDefault, Required)                                                    \
  X("Pathway@Name", String, NoDefault, Required)                                                                       \
  X("Pathway@Organism", String, NoDefault, Optional)                                                                   \
  X("Pathway@Data-Source", String, NoDefault, Optional)                                                                \
  X("Pathway@Version", String, NoDefault, Optional)                                                                    \
  X("Pathway@Author", String, NoDefault, Optional)                                                                     \
  X("Pathway@Maintainer", String, NoDefault, Optional)                                                                 \
  X("Pathway@Email", String, NoDefault, Optional)                                                                      \
  X("Pathway@License", String, NoDefault, Optional)                                                                    \
  X("Pathway@Last-Modified", String, NoDefault, Optional)                                                              \
  GPML_2013A_SHAPED_GRAPHICS(X, "DataNode", "White", "Rectangle")                                                      \
  X("DataNode.Xref@Database", String, NoDefault, Required)                                                             \
  X("DataNode.Xref@ID", String, NoDefault, Required)                                                                   \
  X("DataNode@GraphId", Id, NoDefault, Optional)                                                                       \
  X("DataNode@GroupRef", String, NoDefault, Optional)                                                                  \
  X("DataNode@TextLabel", String, NoDefault, Required)                                                                 \
  X("DataNode@Type", String, "Unknown", Optional)                                                                      \
  X("State.Graphics@RelX", Float, NoDefault, Required)                                                                 \
  X("State.Graphics@RelY", Float, NoDefault, Required)                                                                 \
  X("State.Graphics@Width", Dimension, NoDefault, Required)                                                            \
  X("State.Graphics@Height", Dimension, NoDefault, Required)                                                           \
  X("State.Graphics@Color", Color, "Black", Optional)                                                                  \
  X("State.Graphics@LineStyle", Style, "Solid", Optional)                                                              \
  X("State.Graphics@LineThickness", Float, "1.0", Optional)                                                            \
  X("State.Graphics@FillColor", Color, "White", Optional)                                                              \
  X("State.Graphics@ShapeType", String, "Rectangle", Optional)                                                         \
  X("State.Graphics@ZOrder", Integer, NoDefault, Optional)                                                             \
  X("State.Xref@Database", String, NoDefault, Required)                                                                \
  X("State.Xref@ID", String, NoDefault, Required)                                                                      \
  X("State@GraphId", Id, NoDefault, Optional)                                                                          \
  X("State@GraphRef", IdRef, NoDefault, Optional)                                                                      \
  X("State@TextLabel", String, NoDefault, Required)                                                                    \
  X("State@StateType", String, "Unknown", Optional)                                                                    \
  GPML_2013A_LINE(X, "GraphicalLine")                                                                                  \
  GPML_2013A_LINE(X, "Interaction")                                                                                    \
  X("Interaction.Xref@Database", String, NoDefault, Required)                                                          \
  X("Interaction.Xref@ID", String, NoDefault, Required)                                                                \
  GPML_2013A_SHAPED_GRAPHICS(X, "Label", "Transparent", "None")                                                        \
  X("Label@Href", String, NoDefault, Optional)                                                                         \
  X("Label@GraphId", Id, NoDefault, Optional)                                                                          \
  X("Label@GroupRef", String, NoDefault, Optional)                                                                     \
  X("Label@TextLabel", String, NoDefault, Required)                                                                    \
  GPML_2013A_SHAPED_GRAPHICS(X, "Shape", "Transparent", "Rectangle")                                                   \
  X("Shape.Graphics@Rotation", Rotation, "Top", Optional)                                                              \
  X("Shape@GraphId", Id, NoDefault, Optional)                                                                          \
  X("Shape@GroupRef", String, NoDefault, Optional)                                                                     \
  X("Shape@TextLabel", String, NoDefault, Optional)                                                                    \
  X("Group@GroupId", String, NoDefault, Required)                                                                      \
  X("Group@GroupRef", String, NoDefault, Optional)                                                                     \
  X("Group@Style", String, "None", Optional)                                                                           \
  X("Group@TextLabel", String, NoDefault, Optional)                                                                    \
  X("Group@GraphId", Id, NoDefault, Optional)                                                                          \
  X("InfoBox@CenterX", Float, NoDefault, Required)                                                                     \
  X("InfoBox@CenterY", Float, NoDefault, Required)                                                                     \
  X("Legend@CenterX", Float, NoDefault, Required)                                                                      \
  X("Legend@CenterY", Float, NoDefault, Required)

/// Shared Graphics block of GPML2021 shaped elements. State positions are
/// relative and carry no zOrder, so its block is listed separately.
#define GPML_2021_FONT_AND_STYLE(X, TAG, FILL, SHAPE)                                                                  \
  X(TAG ".Graphics@width", Dimension, NoDefault, Required)                                                             \
  X(TAG ".Graphics@height", Dimension, NoDefault, Required)                                                            \
  X(TAG ".Graphics@textColor", Color, "000000", Optional)                                                              \
  X(TAG ".Graphics@fontName", String, "Arial", Optional)                                                               \
  X(TAG ".Graphics@fontWeight", String, "Normal", Optional)                                                            \
  X(TAG ".Graphics@fontStyle", String, "Normal", Optional)                                                             \
  X(TAG ".Graphics@fontDecoration", String, "Normal", Optional)                                                        \
  X(TAG ".Graphics@fontStrikethru", String, "Normal", Optional)                                                        \
  X(TAG ".Graphics@fontSize", Integer, "12", Optional)                                                                 \
  X(TAG ".Graphics@hAlign", String, "Center", Optional)                                                                \
  X(TAG ".Graphics@vAlign", String, "Middle", Optional)                                                                \
  X(TAG ".Graphics@borderColor", Color, "000000", Optional)                                                            \
  X(TAG ".Graphics@borderStyle", Style, "Solid", Optional)                                                             \
  X(TAG ".Graphics@borderWidth", Float, "1.0", Optional)                                                               \
  X(TAG ".Graphics@fillColor", Color, FILL, Optional)                                                                  \
  X(TAG ".Graphics@shapeType", String, SHAPE, Optional)                                                                \
  X(TAG ".Graphics@rotation", Float, "0.0", Optional)

#define GPML_2021_SHAPED(X, TAG, FILL, SHAPE)                                                                          \
  X(TAG ".Graphics@centerX", Float, NoDefault, Required)                                                               \
  X(TAG ".Graphics@centerY", Float, NoDefault, Required)                                                               \
  X(TAG ".Graphics@zOrder", Integer, NoDefault, Optional)                                                              \
  GPML_2021_FONT_AND_STYLE(X, TAG, FILL, SHAPE)                                                                        \
  X(TAG "@elementId", Id, NoDefault, Required)                                                                         \
  X(TAG "@groupRef", IdRef, NoDefault, Optional)

#define GPML_2021_LINE(X, TAG)                                                                                         \
  X(TAG "@elementId", Id, NoDefault, Required)                                                                         \
  X(TAG "@groupRef", IdRef, NoDefault, Optional)                                                                       \
  X(TAG ".Waypoints.Point@elementId", Id, NoDefault, Optional)                                                         \
  X(TAG ".Waypoints.Point@arrowHead", String, "Undirected", Optional)                                                  \
  X(TAG ".Waypoints.Point@x", Float, NoDefault, Required)                                                              \
  X(TAG ".Waypoints.Point@y", Float, NoDefault, Required)                                                              \
  X(TAG ".Waypoints.Point@elementRef", IdRef, NoDefault, Optional)                                                     \
  X(TAG ".Waypoints.Point@relX", Float, NoDefault, Optional)                                                           \
  X(TAG ".Waypoints.Point@relY", Float, NoDefault, Optional)                                                           \
  X(TAG ".Waypoints.Anchor@elementId", Id, NoDefault, Required)                                                        \
  X(TAG ".Waypoints.Anchor@position", Float, NoDefault, Required)                                                      \
  X(TAG ".Waypoints.Anchor@shapeType", String, "Square", Optional)                                                     \
  X(TAG ".Graphics@lineColor", Color, "000000", Optional)                                                              \
  X(TAG ".Graphics@lineStyle", Style, "Solid", Optional)                                                               \
  X(TAG ".Graphics@lineWidth", Float, "1.0", Optional)                                                                 \
  X(TAG ".Graphics@connectorType", String, "Straight", Optional)                                                       \
  X(TAG ".Graphics@zOrder", Integer, NoDefault, Optional)

#define GPML_2021_ATTRIBUTES(X)                                                                                        \
  X("Pathway@title", String, NoDefault, Required)                                                                      \
  X("Pathway@organism", String, NoDefault, Optional)                                                                   \
  X("Pathway@source", String, NoDefault, Optional)                                                                     \
  X("Pathway@version", String, NoDefault, Optional)                                                                    \
  X("Pathway@license", String, NoDefault, Optional)                                                                    \
  X("Pathway.Graphics@boardWidth", Dimension, NoDefault, Required)                                                     \
  X("Pathway.Graphics@boardHeight", Dimension, NoDefault, Required)                                                    \
  X("Pathway.Graphics@backgroundColor", Color, "ffffff", Optional)                                                     \
  X("Author@name", String, NoDefault, Required)                                                                        \
  X("Author@username", String, NoDefault, Optional)                                                                    \
  X("Author@order", Integer, NoDefault, Optional)                                                                      \
  X("Xref@identifier", String, NoDefault, Required)                                                                    \
  X("Xref@dataSource", String, NoDefault, Required)                                                                    \
  X("Url@link", String, NoDefault, Required)                                                                           \
  X("Comment@source", String, NoDefault, Optional)                                                                     \
  X("Property@key", String, NoDefault, Required)                                                                       \
  X("Property@value", String, NoDefault, Required)                                                                     \
  X("AnnotationRef@elementRef", IdRef, NoDefault, Required)                                                            \
  X("CitationRef@elementRef", IdRef, NoDefault, Required)                                                              \
  X("EvidenceRef@elementRef", IdRef, NoDefault, Required)                                                              \
  GPML_2021_SHAPED(X, "DataNode", "ffffff", "Rectangle")                                                               \
  X("DataNode@textLabel", String, NoDefault, Required)                                                                 \
  X("DataNode@type", String, "Undefined", Optional)                                                                    \
  X("DataNode@aliasRef", IdRef, NoDefault, Optional)                                                                   \
  X("State.Graphics@relX", Float, NoDefault, Required)                                                                 \
  X("State.Graphics@relY", Float, NoDefault, Required)                                                                 \
  GPML_2021_FONT_AND_STYLE(X, "State", "ffffff", "Rectangle")                                                          \
  X("State@elementId", Id, NoDefault, Required)                                                                        \
  X("State@textLabel", String, NoDefault, Required)                                                                    \
  X("State@type", String, "Undefined", Optional)                                                                       \
  GPML_2021_LINE(X, "Interaction")                                                                                     \
  GPML_2021_LINE(X, "GraphicalLine")                                                                                   \
  GPML_2021_SHAPED(X, "Label", "Transparent", "None")                                                                  \
  X("Label@textLabel", String, NoDefault, Required)                                                                    \
  X("Label@href", String, NoDefault, Optional)                                                                         \
  GPML_2021_SHAPED(X, "Shape", "Transparent", "Rectangle")                                                             \
  X("Shape@textLabel", String, NoDefault, Optional)                                                                    \
  GPML_2021_SHAPED(X, "Group", "Transparent", "Rectangle")                                                             \
  X("Group@textLabel", String, NoDefault, Optional)                                                                    \
  X("Group@type", String, "Group", Optional)                                                                           \
  X("Annotation@elementId", Id, NoDefault, Required)                                                                   \
  X("Annotation@value", String, NoDefault, Required)                                                                   \
  X("Annotation@type", String, "Undefined", Optional)                                                                  \
  X("Citation@elementId", Id, NoDefault, Required)                                                                     \
  X("Evidence@elementId", Id, NoDefault, Required)                                                                     \
  X("Evidence@value", String, NoDefault, Optional)

#define GPML_ATTRIBUTE_ENTRY(key, kind, def, required) { key, AttributeInfo{ ValueKind::kind, def, required } },

std::unordered_map<std::string, AttributeInfo> table2013a()
{
  return { GPML_2013A_ATTRIBUTES(GPML_ATTRIBUTE_ENTRY) };
}

std::unordered_map<std::string, AttributeInfo> table2021()
{
  return { GPML_2021_ATTRIBUTES(GPML_ATTRIBUTE_ENTRY) };
}

#undef GPML_ATTRIBUTE_ENTRY

std::string makeKey(const std::string& tag, const char* name)
{
  return tag + "@" + name;
}

bool numbersEqual(const std::optional<double>& a, const std::optional<double>& b)
{
  return a && b && std::abs(*a - *b) < 1e-6;
}

}  // namespace

std::optional<double> parseDouble(const std::string& text)
{
  if (text.empty())
    return std::nullopt;
  const char* begin = text.c_str();
  char* end = nullptr;
  errno = 0;
  double value = std::strtod(begin, &end);
  if (end == begin || errno == ERANGE)
    return std::nullopt;
  while (*end == ' ' || *end == '\t')
    ++end;
  if (*end != '\0' || !std::isfinite(value))
    return std::nullopt;
  return value;
}

std::optional<int> parseInt(const std::string& text)
{
  auto value = parseDouble(text);
  if (!value || *value != std::floor(*value) || std::abs(*value) > 2147483647.0)
    return std::nullopt;
  return static_cast<int>(*value);
}

std::optional<double> parseRotation(const std::string& text)
{
  if (text == "Top")
    return 0.0;
  if (text == "Right")
    return kPi / 2.0;
  if (text == "Bottom")
    return kPi;
  if (text == "Left")
    return 3.0 * kPi / 2.0;
  return parseDouble(text);
}

AttributeSchema::AttributeSchema(SchemaVersion version, std::unordered_map<std::string, AttributeInfo> table)
  : version_(version), table_(std::move(table))
{
}

const AttributeSchema& AttributeSchema::forVersion(SchemaVersion version)
{
  static const AttributeSchema schema2013a(SchemaVersion::Gpml2013a, table2013a());
  static const AttributeSchema schema2021(SchemaVersion::Gpml2021, table2021());
  return version == SchemaVersion::Gpml2013a ? schema2013a : schema2021;
}

bool AttributeSchema::contains(const std::string& tag, const char* name) const
{
  return table_.count(makeKey(tag, name)) > 0;
}

const AttributeInfo& AttributeSchema::info(const std::string& tag, const char* name) const
{
  const std::string key = makeKey(tag, name);
  auto it = table_.find(key);
  if (it == table_.end())
    throw UnknownAttributeError(key);
  return it->second;
}

bool AttributeSchema::isDefault(const std::string& tag, const char* name, const std::string& value) const
{
  const AttributeInfo& attr = info(tag, name);
  if (attr.required)
    return false;
  if (!attr.default_value)
    return value.empty();

  switch (attr.kind)
  {
    case ValueKind::Float:
    case ValueKind::Dimension:
    case ValueKind::Integer:
      return numbersEqual(parseDouble(attr.default_value), parseDouble(value));
    case ValueKind::Rotation:
      return numbersEqual(parseRotation(attr.default_value), parseRotation(value));
    case ValueKind::Color:
      return colorEquivalent(attr.default_value, value);
    default:
      return value == attr.default_value;
  }
}

std::optional<std::string> AttributeSchema::get(const std::string& tag, const char* name,
                                                const tinyxml2::XMLElement* elem) const
{
  const AttributeInfo& attr = info(tag, name);
  if (elem)
  {
    if (const char* value = elem->Attribute(name))
      return std::string(value);
  }
  if (attr.default_value)
    return std::string(attr.default_value);
  return std::nullopt;
}

std::string AttributeSchema::getString(const std::string& tag, const char* name,
                                       const tinyxml2::XMLElement* elem) const
{
  return get(tag, name, elem).value_or(std::string());
}

std::string AttributeSchema::getRequired(const std::string& tag, const char* name,
                                         const tinyxml2::XMLElement* elem) const
{
  auto value = get(tag, name, elem);
  if (!value)
    throw ConversionError("Missing required attribute", tag, name, elem ? elem->GetLineNum() : 0);
  return *value;
}

double AttributeSchema::getDouble(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const
{
  auto value = getOptionalDouble(tag, name, elem);
  if (!value)
    throw ConversionError("Missing required attribute", tag, name, elem ? elem->GetLineNum() : 0);
  return *value;
}

std::optional<double> AttributeSchema::getOptionalDouble(const std::string& tag, const char* name,
                                                         const tinyxml2::XMLElement* elem) const
{
  auto text = get(tag, name, elem);
  if (!text)
    return std::nullopt;
  auto value = info(tag, name).kind == ValueKind::Rotation ? parseRotation(*text) : parseDouble(*text);
  if (!value)
    throw ConversionError("Malformed number '" + *text + "'", tag, name, elem ? elem->GetLineNum() : 0);
  return value;
}

int AttributeSchema::getInt(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const
{
  auto value = getOptionalInt(tag, name, elem);
  if (!value)
    throw ConversionError("Missing required attribute", tag, name, elem ? elem->GetLineNum() : 0);
  return *value;
}

std::optional<int> AttributeSchema::getOptionalInt(const std::string& tag, const char* name,
                                                   const tinyxml2::XMLElement* elem) const
{
  auto text = get(tag, name, elem);
  if (!text)
    return std::nullopt;
  auto value = parseInt(*text);
  if (!value)
    throw ConversionError("Malformed integer '" + *text + "'", tag, name, elem ? elem->GetLineNum() : 0);
  return value;
}

void AttributeSchema::set(const std::string& tag, const char* name, tinyxml2::XMLElement* elem,
                          const std::string& value) const
{
  if (isDefault(tag, name, value))
    return;
  elem->SetAttribute(name, value.c_str());
}

void AttributeSchema::setDouble(const std::string& tag, const char* name, tinyxml2::XMLElement* elem,
                                double value) const
{
  set(tag, name, elem, formatNumber(value));
}

void AttributeSchema::setInt(const std::string& tag, const char* name, tinyxml2::XMLElement* elem, int value) const
{
  set(tag, name, elem, std::to_string(value));
}

}  // namespace xml
}  // namespace gpml
