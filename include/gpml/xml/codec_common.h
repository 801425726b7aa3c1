#ifndef GPML_XML_CODEC_COMMON_H_
#define GPML_XML_CODEC_COMMON_H_

#include <optional>
#include <string>

#include <tinyxml2.h>

#include <gpml/model/color.h>
#include <gpml/model/xref.h>
#include <gpml/schema_version.h>
#include <gpml/xml/attribute_schema.h>

namespace gpml {
namespace xml {

/// Color attribute through the schema table. Unparseable text throws
/// ConversionError.
Color readColor(const AttributeSchema& schema, const std::string& tag, const char* name,
                const tinyxml2::XMLElement* elem);

/// Text written for a color. GPML2013a spells a fully transparent color as
/// "Transparent"; otherwise lowercase hex without '#', alpha only when not
/// opaque.
std::string colorText(const Color& color, SchemaVersion version);

/// Xref from its two parts, nullopt when both are empty. The resolver, when
/// given, fills in data_source_id.
std::optional<Xref> makeXref(const std::string& identifier, const std::string& data_source,
                             const DataSourceResolver* resolver);

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_CODEC_COMMON_H_
