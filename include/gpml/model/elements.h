#ifndef GPML_MODEL_ELEMENTS_H_
#define GPML_MODEL_ELEMENTS_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include <gpml/model/color.h>
#include <gpml/model/types.h>
#include <gpml/model/xref.h>

namespace gpml {

enum class ObjectType
{
  Pathway,
  DataNode,
  State,
  Interaction,
  GraphicalLine,
  Label,
  Shape,
  Group,
  LinePoint,
  Anchor,
  Annotation,
  Citation,
  Evidence
};

const char* toString(ObjectType type);

struct Comment
{
  std::string text;
  std::string source;  // empty when absent
};

struct EvidenceRef
{
  std::string evidence_id;
};

struct CitationRef;

struct AnnotationRef
{
  std::string annotation_id;
  std::vector<CitationRef> citation_refs;
  std::vector<EvidenceRef> evidence_refs;
};

struct CitationRef
{
  std::string citation_id;
  std::vector<AnnotationRef> annotation_refs;
};

/// Anything that can carry an element id and be looked up in the registry.
struct PathwayObject
{
  virtual ~PathwayObject() = default;
  virtual ObjectType objectType() const = 0;

  std::string element_id;  // empty until admitted to a model
};

/// Identifiable, commentable element with dynamic properties and pooled refs.
struct PathwayElement : PathwayObject
{
  std::vector<Comment> comments;
  std::map<std::string, std::string> dynamic_properties;

  std::vector<AnnotationRef> annotation_refs;
  std::vector<CitationRef> citation_refs;
  std::vector<EvidenceRef> evidence_refs;

  std::optional<std::string> dynamicProperty(const std::string& key) const;
  void setDynamicProperty(const std::string& key, const std::string& value);
};

/// Mixin for elements that can be members of a Group.
struct Groupable
{
  virtual ~Groupable() = default;

  std::string group_ref;  // element id of the owning Group, empty if none
};

struct Author
{
  std::string name;
  std::string username;
  int order = 0;
  std::optional<Xref> xref;
};

struct Pathway : PathwayElement
{
  ObjectType objectType() const override
  {
    return ObjectType::Pathway;
  }

  std::string title;
  std::string organism;
  std::string source;
  std::string version;
  std::string license;
  std::optional<std::string> description;
  std::optional<Xref> xref;

  double board_width = 0.0;
  double board_height = 0.0;
  Color background_color = Color::white();

  std::vector<Author> authors;
};

struct FontProperty
{
  Color text_color;
  std::string name = "Arial";
  bool bold = false;
  bool italic = false;
  bool underline = false;
  bool strikethru = false;
  int size = 12;
  HAlign h_align = HAlign::Center;
  VAlign v_align = VAlign::Middle;
};

struct ShapeStyleProperty
{
  Color border_color;
  LineStyleType border_style = LineStyleKind::Solid;
  double border_width = 1.0;
  Color fill_color = Color::white();
  ShapeType shape_type = ShapeKind::Rectangle;
  std::optional<int> z_order;
};

/// Element with rectangular geometry. center is absolute for every kind
/// except State, whose position is kept relative to its DataNode.
struct ShapedElement : PathwayElement
{
  Eigen::Vector2d center = Eigen::Vector2d::Zero();
  double width = 0.0;
  double height = 0.0;
  double rotation = 0.0;  // radians

  FontProperty font;
  ShapeStyleProperty style;
};

struct DataNode : ShapedElement, Groupable
{
  ObjectType objectType() const override
  {
    return ObjectType::DataNode;
  }

  std::string text_label;
  DataNodeType type = DataNodeKind::Undefined;
  std::optional<Xref> xref;
  std::string alias_ref;  // Group this node is an alias of (type Alias)
};

struct State : ShapedElement
{
  ObjectType objectType() const override
  {
    return ObjectType::State;
  }

  std::string element_ref;  // parent DataNode
  Eigen::Vector2d relative = Eigen::Vector2d::Zero();
  std::string text_label;
  StateType type = StateKind::Undefined;
  std::optional<Xref> xref;
};

struct Label : ShapedElement, Groupable
{
  ObjectType objectType() const override
  {
    return ObjectType::Label;
  }

  std::string text_label;
  std::string href;
};

struct Shape : ShapedElement, Groupable
{
  ObjectType objectType() const override
  {
    return ObjectType::Shape;
  }

  std::string text_label;
};

/// Members are the elements whose group_ref equals this group's id; the list
/// is derived by PathwayModel::groupMembers.
struct Group : ShapedElement, Groupable
{
  ObjectType objectType() const override
  {
    return ObjectType::Group;
  }

  std::string text_label;
  GroupType type = GroupKind::Group;
  std::optional<Xref> xref;
};

struct LinePoint : PathwayObject
{
  ObjectType objectType() const override
  {
    return ObjectType::LinePoint;
  }

  Eigen::Vector2d position = Eigen::Vector2d::Zero();  // authoritative only when unbound
  std::string element_ref;                             // bound target (shaped element or anchor)
  std::optional<Eigen::Vector2d> relative;             // in the target's [-1,1] frame
};

struct Anchor : PathwayObject
{
  ObjectType objectType() const override
  {
    return ObjectType::Anchor;
  }

  double position = 0.5;  // fraction along the line, 0.0 - 1.0
  AnchorShapeType shape_type = AnchorShapeKind::Square;
};

struct LineElement : PathwayElement, Groupable
{
  // Ordered; the first and last points are the line ends.
  std::vector<std::unique_ptr<LinePoint>> points;
  std::vector<std::unique_ptr<Anchor>> anchors;

  Color line_color;
  LineStyleType line_style = LineStyleKind::Solid;
  double line_width = 1.0;
  ConnectorType connector_type = ConnectorKind::Straight;
  std::optional<int> z_order;

  ArrowHeadType start_arrow_head = ArrowHeadKind::Undirected;
  ArrowHeadType end_arrow_head = ArrowHeadKind::Undirected;

  LinePoint& addPoint(double x, double y);
  Anchor& addAnchor(double position, AnchorShapeType shape_type = AnchorShapeKind::Square);

  LinePoint* startPoint() const;
  LinePoint* endPoint() const;
};

struct Interaction : LineElement
{
  ObjectType objectType() const override
  {
    return ObjectType::Interaction;
  }

  std::optional<Xref> xref;
};

struct GraphicalLine : LineElement
{
  ObjectType objectType() const override
  {
    return ObjectType::GraphicalLine;
  }
};

/// Pooled entities. Identical content is stored once per pathway and shared
/// through refs.
struct Annotation : PathwayObject
{
  ObjectType objectType() const override
  {
    return ObjectType::Annotation;
  }

  std::string value;
  AnnotationType type = AnnotationKind::Undefined;
  std::optional<Xref> xref;
  std::string url;

  bool sameContent(const Annotation& other) const;
};

struct Citation : PathwayObject
{
  ObjectType objectType() const override
  {
    return ObjectType::Citation;
  }

  std::optional<Xref> xref;
  std::string url;

  // Bibliographic fields carried by GPML2013a Biopax blocks.
  std::string title;
  std::string source;
  std::string year;
  std::vector<std::string> authors;

  bool sameContent(const Citation& other) const;
};

struct Evidence : PathwayObject
{
  ObjectType objectType() const override
  {
    return ObjectType::Evidence;
  }

  std::string value;
  std::optional<Xref> xref;
  std::string url;

  bool sameContent(const Evidence& other) const;
};

/// True for objects a line point can be bound to.
bool isLinkable(const PathwayObject& object);

}  // namespace gpml

#endif  // GPML_MODEL_ELEMENTS_H_
