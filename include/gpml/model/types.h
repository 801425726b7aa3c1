#ifndef GPML_MODEL_TYPES_H_
#define GPML_MODEL_TYPES_H_

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace gpml {

/// Shape kinds. The trailing block holds kinds GPML2013a retired as plain
/// graphics shapes; some of them live on as cellular component shapes.
#define GPML_SHAPE_KINDS(X)                                                                                            \
  X(Rectangle, "Rectangle")                                                                                            \
  X(RoundedRectangle, "RoundedRectangle")                                                                              \
  X(Oval, "Oval")                                                                                                      \
  X(Triangle, "Triangle")                                                                                              \
  X(Pentagon, "Pentagon")                                                                                              \
  X(Hexagon, "Hexagon")                                                                                                \
  X(Octagon, "Octagon")                                                                                                \
  X(Arc, "Arc")                                                                                                        \
  X(Brace, "Brace")                                                                                                    \
  X(None, "None")                                                                                                      \
  X(Mitochondria, "Mitochondria")                                                                                      \
  X(SarcoplasmicReticulum, "SarcoplasmicReticulum")                                                                    \
  X(EndoplasmicReticulum, "EndoplasmicReticulum")                                                                      \
  X(GolgiApparatus, "GolgiApparatus")                                                                                  \
  X(Nucleolus, "Nucleolus")                                                                                            \
  X(Vacuole, "Vacuole")                                                                                                \
  X(Lysosome, "Lysosome")                                                                                              \
  X(CytosolRegion, "CytosolRegion")                                                                                    \
  X(ExtracellularRegion, "ExtracellularRegion")                                                                        \
  X(MimDegradation, "mim-degradation")                                                                                 \
  /* Retired in GPML2013a */                                                                                           \
  X(Cell, "Cell")                                                                                                      \
  X(Organelle, "Organelle")                                                                                            \
  X(Membrane, "Membrane")                                                                                              \
  X(CellA, "CellA")                                                                                                    \
  X(Nucleus, "Nucleus")                                                                                                \
  X(OrganA, "OrganA")                                                                                                  \
  X(OrganB, "OrganB")                                                                                                  \
  X(OrganC, "OrganC")                                                                                                  \
  X(Vesicle, "Vesicle")                                                                                                \
  X(ProteinB, "ProteinB")                                                                                              \
  X(Ribosome, "Ribosome")

/// "Broken" is the GPML2013a spelling of "Dashed". GPML2013a has no Double
/// style, it is carried as a dynamic property there.
#define GPML_LINE_STYLE_KINDS(X)                                                                                       \
  X(Solid, "Solid")                                                                                                    \
  X(Dashed, "Dashed")                                                                                                  \
  X(Double, "Double")                                                                                                  \
  X(Broken, "Broken")

/// GPML2013a group styles are None, Group, Complex and Pathway. GPML2021
/// renames None to Group and Group to Transparent.
#define GPML_GROUP_KINDS(X)                                                                                            \
  X(None, "None")                                                                                                      \
  X(Group, "Group")                                                                                                    \
  X(Transparent, "Transparent")                                                                                        \
  X(Complex, "Complex")                                                                                                \
  X(Pathway, "Pathway")                                                                                                \
  X(Analog, "Analog")                                                                                                  \
  X(Paralog, "Paralog")

#define GPML_DATA_NODE_KINDS(X)                                                                                        \
  X(Unknown, "Unknown")                                                                                                \
  X(Undefined, "Undefined")                                                                                            \
  X(GeneProduct, "GeneProduct")                                                                                        \
  X(Dna, "DNA")                                                                                                        \
  X(Rna, "RNA")                                                                                                        \
  X(Protein, "Protein")                                                                                                \
  X(Complex, "Complex")                                                                                                \
  X(Metabolite, "Metabolite")                                                                                          \
  X(Pathway, "Pathway")                                                                                                \
  X(Disease, "Disease")                                                                                                \
  X(Phenotype, "Phenotype")                                                                                            \
  X(Alias, "Alias")                                                                                                    \
  X(Event, "Event")                                                                                                    \
  X(Cell, "Cell")                                                                                                      \
  X(Organ, "Organ")

#define GPML_STATE_KINDS(X)                                                                                            \
  X(Unknown, "Unknown")                                                                                                \
  X(Undefined, "Undefined")                                                                                            \
  X(ProteinModification, "ProteinModification")                                                                        \
  X(GeneticVariant, "GeneticVariant")                                                                                  \
  X(EpigeneticModification, "EpigeneticModification")

#define GPML_CONNECTOR_KINDS(X)                                                                                        \
  X(Straight, "Straight")                                                                                              \
  X(Elbow, "Elbow")                                                                                                    \
  X(Curved, "Curved")                                                                                                  \
  X(Segmented, "Segmented")

/// First block: GPML2021 interaction panel. Second block: GPML2013a names.
#define GPML_ARROW_HEAD_KINDS(X)                                                                                       \
  X(Undirected, "Undirected")                                                                                          \
  X(Directed, "Directed")                                                                                              \
  X(Conversion, "Conversion")                                                                                          \
  X(Inhibition, "Inhibition")                                                                                          \
  X(Catalysis, "Catalysis")                                                                                            \
  X(Stimulation, "Stimulation")                                                                                        \
  X(Binding, "Binding")                                                                                                \
  X(Translocation, "Translocation")                                                                                    \
  X(TranscriptionTranslation, "TranscriptionTranslation")                                                              \
  X(Line, "Line")                                                                                                      \
  X(Arrow, "Arrow")                                                                                                    \
  X(TBar, "TBar")                                                                                                      \
  X(MimConversion, "mim-conversion")                                                                                   \
  X(MimModification, "mim-modification")                                                                               \
  X(MimCleavage, "mim-cleavage")                                                                                       \
  X(MimGap, "mim-gap")                                                                                                 \
  X(MimBranchingLeft, "mim-branching-left")                                                                            \
  X(MimBranchingRight, "mim-branching-right")                                                                          \
  X(MimInhibition, "mim-inhibition")                                                                                   \
  X(MimCatalysis, "mim-catalysis")                                                                                     \
  X(MimStimulation, "mim-stimulation")                                                                                 \
  X(MimNecessaryStimulation, "mim-necessary-stimulation")                                                              \
  X(MimBinding, "mim-binding")                                                                                         \
  X(MimCovalentBond, "mim-covalent-bond")                                                                              \
  X(MimTranslocation, "mim-translocation")                                                                             \
  X(MimTranscriptionTranslation, "mim-transcription-translation")

#define GPML_ANCHOR_SHAPE_KINDS(X)                                                                                     \
  X(Square, "Square")                                                                                                  \
  X(Circle, "Circle")                                                                                                  \
  X(None, "None")                                                                                                      \
  X(ReceptorRound, "ReceptorRound")

#define GPML_ANNOTATION_KINDS(X)                                                                                       \
  X(Undefined, "Undefined")                                                                                            \
  X(Ontology, "Ontology")                                                                                              \
  X(Taxonomy, "Taxonomy")

#define GPML_KIND_ENUMERATOR(name, str) name,

enum class ShapeKind
{
  GPML_SHAPE_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class LineStyleKind
{
  GPML_LINE_STYLE_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class GroupKind
{
  GPML_GROUP_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class DataNodeKind
{
  GPML_DATA_NODE_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class StateKind
{
  GPML_STATE_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class ConnectorKind
{
  GPML_CONNECTOR_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class ArrowHeadKind
{
  GPML_ARROW_HEAD_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class AnchorShapeKind
{
  GPML_ANCHOR_SHAPE_KINDS(GPML_KIND_ENUMERATOR) Custom
};
enum class AnnotationKind
{
  GPML_ANNOTATION_KINDS(GPML_KIND_ENUMERATOR) Custom
};

#undef GPML_KIND_ENUMERATOR

const char* toString(ShapeKind kind);
const char* toString(LineStyleKind kind);
const char* toString(GroupKind kind);
const char* toString(DataNodeKind kind);
const char* toString(StateKind kind);
const char* toString(ConnectorKind kind);
const char* toString(ArrowHeadKind kind);
const char* toString(AnchorShapeKind kind);
const char* toString(AnnotationKind kind);

/// Exact, case-sensitive name lookup. Returns nullopt for names outside the
/// closed set; callers wrap those as Custom.
template <typename Kind>
std::optional<Kind> kindFromString(const std::string& name);

template <>
std::optional<ShapeKind> kindFromString<ShapeKind>(const std::string& name);
template <>
std::optional<LineStyleKind> kindFromString<LineStyleKind>(const std::string& name);
template <>
std::optional<GroupKind> kindFromString<GroupKind>(const std::string& name);
template <>
std::optional<DataNodeKind> kindFromString<DataNodeKind>(const std::string& name);
template <>
std::optional<StateKind> kindFromString<StateKind>(const std::string& name);
template <>
std::optional<ConnectorKind> kindFromString<ConnectorKind>(const std::string& name);
template <>
std::optional<ArrowHeadKind> kindFromString<ArrowHeadKind>(const std::string& name);
template <>
std::optional<AnchorShapeKind> kindFromString<AnchorShapeKind>(const std::string& name);
template <>
std::optional<AnnotationKind> kindFromString<AnnotationKind>(const std::string& name);

/// A closed kind with a Custom(name) fallback for values outside the set.
template <typename Kind>
class ExtensibleType
{
public:
  ExtensibleType() = default;

  ExtensibleType(Kind kind) : kind_(kind)
  {
  }

  static ExtensibleType custom(std::string name)
  {
    ExtensibleType type;
    type.kind_ = Kind::Custom;
    type.custom_name_ = std::move(name);
    return type;
  }

  static ExtensibleType fromName(const std::string& name)
  {
    if (auto kind = kindFromString<Kind>(name))
      return ExtensibleType(*kind);
    return custom(name);
  }

  Kind kind() const
  {
    return kind_;
  }

  bool isCustom() const
  {
    return kind_ == Kind::Custom;
  }

  std::string name() const
  {
    return isCustom() ? custom_name_ : std::string(toString(kind_));
  }

  bool operator==(const ExtensibleType& other) const
  {
    return kind_ == other.kind_ && (!isCustom() || custom_name_ == other.custom_name_);
  }
  bool operator!=(const ExtensibleType& other) const
  {
    return !(*this == other);
  }
  bool operator==(Kind kind) const
  {
    return kind_ == kind;
  }
  bool operator!=(Kind kind) const
  {
    return kind_ != kind;
  }

private:
  Kind kind_ = static_cast<Kind>(0);
  std::string custom_name_;
};

template <typename Kind>
std::ostream& operator<<(std::ostream& os, const ExtensibleType<Kind>& type)
{
  return os << type.name();
}

using ShapeType = ExtensibleType<ShapeKind>;
using LineStyleType = ExtensibleType<LineStyleKind>;
using GroupType = ExtensibleType<GroupKind>;
using DataNodeType = ExtensibleType<DataNodeKind>;
using StateType = ExtensibleType<StateKind>;
using ConnectorType = ExtensibleType<ConnectorKind>;
using ArrowHeadType = ExtensibleType<ArrowHeadKind>;
using AnchorShapeType = ExtensibleType<AnchorShapeKind>;
using AnnotationType = ExtensibleType<AnnotationKind>;

enum class HAlign
{
  Left,
  Center,
  Right
};

enum class VAlign
{
  Top,
  Middle,
  Bottom
};

const char* toString(HAlign align);
const char* toString(VAlign align);
std::optional<HAlign> hAlignFromString(const std::string& name);
std::optional<VAlign> vAlignFromString(const std::string& name);

}  // namespace gpml

#endif  // GPML_MODEL_TYPES_H_
