#ifndef GPML_XML_GPML2013A_READER_H_
#define GPML_XML_GPML2013A_READER_H_

#include <cstdint>
#include <random>

#include <tinyxml2.h>

#include <gpml/model/pathway_model.h>
#include <gpml/model/xref.h>

namespace gpml {
namespace xml {

/**
 * @brief Decodes a GPML2013a <Pathway> element into a PathwayModel.
 *
 * The model keeps the GPML2013a vocabulary (group styles, "Unknown" types,
 * "Broken" lines, mim-* arrowheads, retired shapes); VersionConverter lifts
 * it to GPML2021. Structural data that GPML2013a spreads over other places
 * is gathered on read:
 *  - Biopax PublicationXrefs referenced by BiopaxRef become Citations;
 *  - openControlledVocabulary entries become pathway Annotations;
 *  - phosphosite State comments become Annotations and an Xref;
 *  - Group GroupId/GraphId are folded into one element id;
 *  - group graphics are implied from the group style and member bounds.
 *
 * Lines without GraphId get a deterministic id derived from their geometry.
 * Empty groups are dropped.
 */
class Gpml2013aReader
{
public:
  explicit Gpml2013aReader(const DataSourceResolver* resolver = nullptr);

  /// @throws ConversionError on malformed or missing values (all-or-nothing)
  PathwayModel read(const tinyxml2::XMLElement* root, std::uint32_t id_seed = std::random_device{}()) const;

private:
  const DataSourceResolver* resolver_;
};

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_GPML2013A_READER_H_
