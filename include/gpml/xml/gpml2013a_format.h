#ifndef GPML_XML_GPML2013A_FORMAT_H_
#define GPML_XML_GPML2013A_FORMAT_H_

#include <optional>
#include <string>
#include <vector>

#include <gpml/model/elements.h>

namespace gpml {
namespace xml {

/// Vocabulary shared by the GPML2013a reader, writer and the version
/// converter.
namespace gpml2013a {

constexpr const char* kBiopaxNamespace = "http://www.biopax.org/release/biopax-level3.owl#";
constexpr const char* kRdfNamespace = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
constexpr const char* kRdfString = "http://www.w3.org/2001/XMLSchema#string";

/// Pathway attributes without a GPML2021 counterpart, kept as dynamic
/// properties of the Pathway.
constexpr const char* kPathwayAuthor = "pathway_author_gpml2013a";
constexpr const char* kPathwayMaintainer = "pathway_maintainer_gpml2013a";
constexpr const char* kPathwayEmail = "pathway_email_gpml2013a";
constexpr const char* kPathwayLastModified = "pathway_lastModified_gpml2013a";
constexpr const char* kInfoBoxCenterX = "pathway_infobox_centerX_gpml2013a";
constexpr const char* kInfoBoxCenterY = "pathway_infobox_centerY_gpml2013a";
constexpr const char* kLegendCenterX = "pathway_legend_centerX_gpml2013a";
constexpr const char* kLegendCenterY = "pathway_legend_centerY_gpml2013a";

bool isPathwayOnlyKey(const std::string& key);

constexpr const char* kDescriptionSource = "WikiPathways-description";

/// Attribute keys GPML2013a used for data GPML2021 models directly.
constexpr const char* kDoubleLineKey = "org.pathvisio.DoubleLineProperty";
constexpr const char* kCellularComponentKey = "org.pathvisio.CellularComponentProperty";
constexpr const char* kStateRotationKey = "org.pathvisio.core.StateRotation";

/// "Golgi Apparatus" <-> "GolgiApparatus" and friends. Names outside the
/// table are returned unchanged.
std::string shapeNameToCamelCase(const std::string& name);
std::string shapeNameFromCamelCase(const std::string& name);

/// Modern replacement of a retired shape kind, nullopt if kind is current.
std::optional<ShapeKind> deprecatedShapeReplacement(ShapeKind kind);

/// GPML2021 draws cellular components (Nucleus, Organelle, ...) as shape
/// kinds of their own. GPML2013a writes a basic shape plus the component
/// name under kCellularComponentKey. Returns that basic shape, nullopt if
/// kind is not a cellular component.
std::optional<ShapeKind> cellularComponentBaseShape(ShapeKind kind);

/// GPML2013a arrowhead names grouped by the GPML2021 interaction panel
/// type they fold into. The first name of each list is the one written when
/// going back to GPML2013a.
const std::vector<std::string>& arrowHeadNames(ArrowHeadKind panel_kind);

/// GPML2021 panel kind for a GPML2013a arrowhead name (case insensitive).
std::optional<ArrowHeadKind> panelArrowHead(const std::string& name);

/// Ontology names whose openControlledVocabulary entries are typed Ontology.
bool isOntologyVocabulary(const std::string& ontology);

/// Fixed graphics GPML2013a implies for a group of the given style
/// (None, Group, Complex or Pathway).
void applyGroupGraphics(Group& group);

/// Phosphosite state comment keys.
constexpr const char* kParentId = "parentid";
constexpr const char* kParentSymbol = "parentsymbol";
constexpr const char* kSiteGroupId = "sitegrpid";
constexpr const char* kPtm = "ptm";
constexpr const char* kDirection = "direction";

constexpr const char* kParentIdDatabase = "uniprot";
constexpr const char* kParentSymbolDatabase = "hgnc";
constexpr const char* kSiteGroupIdDatabase = "phosphositeplus";

bool isStateCommentKey(const std::string& key);

struct OntologyTerm
{
  const char* term;
  const char* identifier;
  const char* database;
};

/// "p" -> Phosphorylation (SBO:0000216) etc.
std::optional<OntologyTerm> ptmTerm(const std::string& code);

/// "u"/"d" -> positive/negative regulation of biological process (GO).
std::optional<OntologyTerm> directionTerm(const std::string& code);

/// Reverse of ptmTerm / directionTerm: the comment code for a term name.
std::optional<std::string> ptmCode(const std::string& term);
std::optional<std::string> directionCode(const std::string& term);

/// openControlledVocabulary ontologies and their identifier prefixes:
/// Pathway Ontology (PW), Disease (DOID), Cell Type (CL).
std::optional<std::string> ontologyForPrefix(const std::string& prefix);

}  // namespace gpml2013a
}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_GPML2013A_FORMAT_H_
