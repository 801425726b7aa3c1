#include <gpml/xml/gpml2013a_format.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace gpml {
namespace xml {
namespace gpml2013a {

namespace {

const std::vector<std::pair<std::string, std::string>>& camelCaseTable()
{
  static const std::vector<std::pair<std::string, std::string>> table = {
    { "Sarcoplasmic Reticulum", "SarcoplasmicReticulum" },
    { "Endoplasmic Reticulum", "EndoplasmicReticulum" },
    { "Golgi Apparatus", "GolgiApparatus" },
    { "Cytosol region", "CytosolRegion" },
    { "Extracellular region", "ExtracellularRegion" },
  };
  return table;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b)
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

bool isPathwayOnlyKey(const std::string& key)
{
  static const char* const keys[] = { kPathwayAuthor, kPathwayMaintainer, kPathwayEmail, kPathwayLastModified,
                                      kInfoBoxCenterX, kInfoBoxCenterY,   kLegendCenterX, kLegendCenterY };
  for (const char* k : keys)
  {
    if (key == k)
      return true;
  }
  return false;
}

std::string shapeNameToCamelCase(const std::string& name)
{
  for (const auto& [spaced, camel] : camelCaseTable())
  {
    if (name == spaced)
      return camel;
  }
  return name;
}

std::string shapeNameFromCamelCase(const std::string& name)
{
  for (const auto& [spaced, camel] : camelCaseTable())
  {
    if (name == camel)
      return spaced;
  }
  return name;
}

std::optional<ShapeKind> deprecatedShapeReplacement(ShapeKind kind)
{
  switch (kind)
  {
    case ShapeKind::Cell:
    case ShapeKind::Organelle:
    case ShapeKind::Membrane:
      return ShapeKind::RoundedRectangle;
    case ShapeKind::CellA:
    case ShapeKind::Nucleus:
    case ShapeKind::OrganA:
    case ShapeKind::OrganB:
    case ShapeKind::OrganC:
    case ShapeKind::Vesicle:
      return ShapeKind::Oval;
    case ShapeKind::ProteinB:
    case ShapeKind::Ribosome:
      return ShapeKind::Hexagon;
    default:
      return std::nullopt;
  }
}

std::optional<ShapeKind> cellularComponentBaseShape(ShapeKind kind)
{
  switch (kind)
  {
    case ShapeKind::Cell:
    case ShapeKind::Organelle:
    case ShapeKind::Membrane:
    case ShapeKind::CytosolRegion:
    case ShapeKind::ExtracellularRegion:
      return ShapeKind::RoundedRectangle;
    case ShapeKind::Nucleus:
    case ShapeKind::Lysosome:
    case ShapeKind::Nucleolus:
    case ShapeKind::Vacuole:
    case ShapeKind::Vesicle:
      return ShapeKind::Oval;
    case ShapeKind::EndoplasmicReticulum:
    case ShapeKind::GolgiApparatus:
    case ShapeKind::Mitochondria:
    case ShapeKind::SarcoplasmicReticulum:
      return kind;
    default:
      return std::nullopt;
  }
}

const std::vector<std::string>& arrowHeadNames(ArrowHeadKind panel_kind)
{
  static const std::map<ArrowHeadKind, std::vector<std::string>> panel = {
    { ArrowHeadKind::Undirected, { "Line" } },
    { ArrowHeadKind::Directed, { "Arrow" } },
    { ArrowHeadKind::Conversion,
      { "mim-conversion", "mim-modification", "mim-cleavage", "mim-gap", "mim-branching-left",
        "mim-branching-right" } },
    { ArrowHeadKind::Inhibition, { "mim-inhibition", "TBar" } },
    { ArrowHeadKind::Catalysis, { "mim-catalysis" } },
    { ArrowHeadKind::Stimulation, { "mim-stimulation", "mim-necessary-stimulation" } },
    { ArrowHeadKind::Binding, { "mim-binding", "mim-covalent-bond" } },
    { ArrowHeadKind::Translocation, { "mim-translocation" } },
    { ArrowHeadKind::TranscriptionTranslation, { "mim-transcription-translation" } },
  };
  static const std::vector<std::string> none;
  auto it = panel.find(panel_kind);
  return it == panel.end() ? none : it->second;
}

std::optional<ArrowHeadKind> panelArrowHead(const std::string& name)
{
  static const ArrowHeadKind kinds[] = { ArrowHeadKind::Undirected,  ArrowHeadKind::Directed,
                                         ArrowHeadKind::Conversion,  ArrowHeadKind::Inhibition,
                                         ArrowHeadKind::Catalysis,   ArrowHeadKind::Stimulation,
                                         ArrowHeadKind::Binding,     ArrowHeadKind::Translocation,
                                         ArrowHeadKind::TranscriptionTranslation };
  for (ArrowHeadKind kind : kinds)
  {
    for (const auto& candidate : arrowHeadNames(kind))
    {
      if (equalsIgnoreCase(candidate, name))
        return kind;
    }
  }
  return std::nullopt;
}

bool isOntologyVocabulary(const std::string& ontology)
{
  return ontology == "Disease" || ontology == "Pathway Ontology" || ontology == "Cell Type";
}

void applyGroupGraphics(Group& group)
{
  const Color grey{ 0x80, 0x80, 0x80, 0xff };

  group.font.text_color = grey;
  group.style.border_width = 1.0;
  if (group.type == GroupKind::Group)
  {
    group.style.border_color = Color::transparent();
    group.style.border_style = LineStyleKind::Solid;
    group.style.fill_color = Color::transparent();
    group.style.shape_type = ShapeKind::Rectangle;
  }
  else if (group.type == GroupKind::Complex)
  {
    group.style.border_color = grey;
    group.style.border_style = LineStyleKind::Solid;
    group.style.fill_color = Color{ 0xb4, 0xb4, 0x64, 0x19 };
    group.style.shape_type = ShapeKind::Octagon;
  }
  else if (group.type == GroupKind::Pathway)
  {
    group.style.border_color = grey;
    group.style.border_style = LineStyleKind::Dashed;
    group.style.fill_color = Color{ 0x00, 0xff, 0x00, 0x0c };
    group.style.shape_type = ShapeKind::Rectangle;
  }
  else
  {
    group.style.border_color = grey;
    group.style.border_style = LineStyleKind::Dashed;
    group.style.fill_color = Color{ 0xb4, 0xb4, 0x64, 0x19 };
    group.style.shape_type = ShapeKind::Rectangle;
  }
}

bool isStateCommentKey(const std::string& key)
{
  static const char* const keys[] = { "parent", "position", kPtm, kDirection, kParentId, kParentSymbol, "site",
                                      kSiteGroupId };
  for (const char* k : keys)
  {
    if (key == k)
      return true;
  }
  return false;
}

std::optional<OntologyTerm> ptmTerm(const std::string& code)
{
  if (code == "p")
    return OntologyTerm{ "Phosphorylation", "0000216", "SBO" };
  if (code == "m" || code == "me")
    return OntologyTerm{ "Methylation", "0000214", "SBO" };
  if (code == "u" || code == "ub")
    return OntologyTerm{ "Ubiquitination", "000022", "SBO" };
  return std::nullopt;
}

std::optional<OntologyTerm> directionTerm(const std::string& code)
{
  if (code == "u")
    return OntologyTerm{ "positive regulation of biological process", "0048518", "GO" };
  if (code == "d")
    return OntologyTerm{ "negative regulation of biological process", "0048519", "GO" };
  return std::nullopt;
}

std::optional<std::string> ptmCode(const std::string& term)
{
  for (const char* code : { "p", "m", "u" })
  {
    if (term == ptmTerm(code)->term)
      return std::string(code);
  }
  return std::nullopt;
}

std::optional<std::string> directionCode(const std::string& term)
{
  for (const char* code : { "u", "d" })
  {
    if (term == directionTerm(code)->term)
      return std::string(code);
  }
  return std::nullopt;
}

std::optional<std::string> ontologyForPrefix(const std::string& prefix)
{
  if (prefix == "PW")
    return std::string("Pathway Ontology");
  if (prefix == "DOID")
    return std::string("Disease");
  if (prefix == "CL")
    return std::string("Cell Type");
  return std::nullopt;
}

}  // namespace gpml2013a
}  // namespace xml
}  // namespace gpml
