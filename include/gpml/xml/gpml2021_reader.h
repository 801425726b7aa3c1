#ifndef GPML_XML_GPML2021_READER_H_
#define GPML_XML_GPML2021_READER_H_

#include <cstdint>
#include <random>

#include <tinyxml2.h>

#include <gpml/model/pathway_model.h>
#include <gpml/model/xref.h>

namespace gpml {
namespace xml {

/**
 * @brief Decodes a GPML2021 <Pathway> element into a PathwayModel.
 *
 * Categories come wrapped (<DataNodes>, <Interactions>, ...), States are
 * nested in their DataNode and line geometry lives in <Waypoints>. Pool
 * entries (<Annotations>, <Citations>, <Evidences>) are admitted before the
 * elements that refer to them; entries with identical content collapse into
 * one and the refs are redirected.
 */
class Gpml2021Reader
{
public:
  explicit Gpml2021Reader(const DataSourceResolver* resolver = nullptr);

  /// @throws ConversionError on malformed or missing values (all-or-nothing)
  PathwayModel read(const tinyxml2::XMLElement* root, std::uint32_t id_seed = std::random_device{}()) const;

private:
  const DataSourceResolver* resolver_;
};

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_GPML2021_READER_H_
