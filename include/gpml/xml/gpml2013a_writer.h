#ifndef GPML_XML_GPML2013A_WRITER_H_
#define GPML_XML_GPML2013A_WRITER_H_

#include <memory>

#include <tinyxml2.h>

#include <gpml/model/pathway_model.h>

namespace gpml {
namespace xml {

/**
 * @brief Encodes a PathwayModel in GPML2013a vocabulary as a GPML2013a document.
 *
 * Children are emitted per category and then put in schema order by
 * sortChildrenRecursive. Citations become a Biopax block of PublicationXrefs
 * sorted by rdf:id, pathway Annotations become openControlledVocabulary
 * entries and State annotations are folded back into a "key=value; ..."
 * comment. Evidences and Group Xrefs have no GPML2013a form and are not
 * written.
 */
class Gpml2013aWriter
{
public:
  /// @throws ConversionError if model.version() is not GPML2013a
  std::unique_ptr<tinyxml2::XMLDocument> write(const PathwayModel& model) const;
};

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_GPML2013A_WRITER_H_
