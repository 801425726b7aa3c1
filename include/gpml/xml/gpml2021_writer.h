#ifndef GPML_XML_GPML2021_WRITER_H_
#define GPML_XML_GPML2021_WRITER_H_

#include <memory>

#include <tinyxml2.h>

#include <gpml/model/pathway_model.h>

namespace gpml {
namespace xml {

/**
 * @brief Encodes a PathwayModel in GPML2021 vocabulary as a GPML2021 document.
 *
 * Categories are wrapped, States are nested under their DataNode (a State
 * whose DataNode is gone is dropped with a warning) and pool entries are
 * written sorted by elementId.
 */
class Gpml2021Writer
{
public:
  /// @throws ConversionError if model.version() is not GPML2021
  std::unique_ptr<tinyxml2::XMLDocument> write(const PathwayModel& model) const;
};

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_GPML2021_WRITER_H_
