#include <gpml/model/types.h>

namespace gpml {

// GPML_KIND is redefined before each block so the X entries expand against it.
#define GPML_KIND_CASE(name, str)                                                                                      \
  case GPML_KIND::name:                                                                                                \
    return str;
#define GPML_KIND_MATCH(name, str)                                                                                     \
  if (value == str)                                                                                                    \
    return GPML_KIND::name;

#define GPML_KIND ShapeKind
const char* toString(ShapeKind kind)
{
  switch (kind)
  {
    GPML_SHAPE_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<ShapeKind> kindFromString<ShapeKind>(const std::string& value)
{
  GPML_SHAPE_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND LineStyleKind
const char* toString(LineStyleKind kind)
{
  switch (kind)
  {
    GPML_LINE_STYLE_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<LineStyleKind> kindFromString<LineStyleKind>(const std::string& value)
{
  GPML_LINE_STYLE_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND GroupKind
const char* toString(GroupKind kind)
{
  switch (kind)
  {
    GPML_GROUP_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<GroupKind> kindFromString<GroupKind>(const std::string& value)
{
  GPML_GROUP_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND DataNodeKind
const char* toString(DataNodeKind kind)
{
  switch (kind)
  {
    GPML_DATA_NODE_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<DataNodeKind> kindFromString<DataNodeKind>(const std::string& value)
{
  GPML_DATA_NODE_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND StateKind
const char* toString(StateKind kind)
{
  switch (kind)
  {
    GPML_STATE_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<StateKind> kindFromString<StateKind>(const std::string& value)
{
  GPML_STATE_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND ConnectorKind
const char* toString(ConnectorKind kind)
{
  switch (kind)
  {
    GPML_CONNECTOR_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<ConnectorKind> kindFromString<ConnectorKind>(const std::string& value)
{
  GPML_CONNECTOR_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND ArrowHeadKind
const char* toString(ArrowHeadKind kind)
{
  switch (kind)
  {
    GPML_ARROW_HEAD_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<ArrowHeadKind> kindFromString<ArrowHeadKind>(const std::string& value)
{
  GPML_ARROW_HEAD_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND AnchorShapeKind
const char* toString(AnchorShapeKind kind)
{
  switch (kind)
  {
    GPML_ANCHOR_SHAPE_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<AnchorShapeKind> kindFromString<AnchorShapeKind>(const std::string& value)
{
  GPML_ANCHOR_SHAPE_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#define GPML_KIND AnnotationKind
const char* toString(AnnotationKind kind)
{
  switch (kind)
  {
    GPML_ANNOTATION_KINDS(GPML_KIND_CASE)
    default:
      return "Custom";
  }
}

template <>
std::optional<AnnotationKind> kindFromString<AnnotationKind>(const std::string& value)
{
  GPML_ANNOTATION_KINDS(GPML_KIND_MATCH)
  return std::nullopt;
}
#undef GPML_KIND

#undef GPML_KIND_MATCH
#undef GPML_KIND_CASE

const char* toString(HAlign align)
{
  switch (align)
  {
    case HAlign::Left:
      return "Left";
    case HAlign::Center:
      return "Center";
    case HAlign::Right:
      return "Right";
  }
  return "Center";
}

const char* toString(VAlign align)
{
  switch (align)
  {
    case VAlign::Top:
      return "Top";
    case VAlign::Middle:
      return "Middle";
    case VAlign::Bottom:
      return "Bottom";
  }
  return "Middle";
}

std::optional<HAlign> hAlignFromString(const std::string& name)
{
  if (name == "Left")
    return HAlign::Left;
  if (name == "Center")
    return HAlign::Center;
  if (name == "Right")
    return HAlign::Right;
  return std::nullopt;
}

std::optional<VAlign> vAlignFromString(const std::string& name)
{
  if (name == "Top")
    return VAlign::Top;
  if (name == "Middle")
    return VAlign::Middle;
  if (name == "Bottom")
    return VAlign::Bottom;
  return std::nullopt;
}

}  // namespace gpml
