#include <gpml/xml/codec_common.h>

#include <gpml/errors.h>

namespace gpml {
namespace xml {

Color readColor(const AttributeSchema& schema, const std::string& tag, const char* name,
                const tinyxml2::XMLElement* elem)
{
  const std::string text = schema.getString(tag, name, elem);
  if (text.empty())
    return Color::black();
  auto color = parseColor(text);
  if (!color)
    throw ConversionError("Malformed color '" + text + "'", tag, name, elem ? elem->GetLineNum() : 0);
  return *color;
}

std::string colorText(const Color& color, SchemaVersion version)
{
  if (version == SchemaVersion::Gpml2013a && color.isTransparent())
    return "Transparent";
  return toHex(color);
}

std::optional<Xref> makeXref(const std::string& identifier, const std::string& data_source,
                             const DataSourceResolver* resolver)
{
  if (identifier.empty() && data_source.empty())
    return std::nullopt;

  Xref xref;
  xref.identifier = identifier;
  xref.data_source = data_source;
  if (resolver && !data_source.empty())
    xref.data_source_id = resolver->resolveDataSource(data_source);
  return xref;
}

}  // namespace xml
}  // namespace gpml
