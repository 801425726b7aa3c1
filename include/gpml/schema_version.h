#ifndef GPML_SCHEMA_VERSION_H_
#define GPML_SCHEMA_VERSION_H_

#include <optional>
#include <string>

namespace gpml {

enum class SchemaVersion
{
  Gpml2013a,
  Gpml2021
};

inline const char* toString(SchemaVersion version)
{
  switch (version)
  {
    case SchemaVersion::Gpml2013a:
      return "GPML2013a";
    case SchemaVersion::Gpml2021:
      return "GPML2021";
  }
  return "GPML2021";
}

inline const char* namespaceUri(SchemaVersion version)
{
  switch (version)
  {
    case SchemaVersion::Gpml2013a:
      return "http://pathvisio.org/GPML/2013a";
    case SchemaVersion::Gpml2021:
      return "http://pathvisio.org/GPML/2021";
  }
  return "http://pathvisio.org/GPML/2021";
}

/// XSD resource file name, looked up by the schema validator.
inline const char* schemaFileName(SchemaVersion version)
{
  return version == SchemaVersion::Gpml2013a ? "GPML2013a.xsd" : "GPML2021.xsd";
}

inline std::optional<SchemaVersion> schemaVersionFromNamespace(const std::string& uri)
{
  if (uri == namespaceUri(SchemaVersion::Gpml2013a))
    return SchemaVersion::Gpml2013a;
  if (uri == namespaceUri(SchemaVersion::Gpml2021))
    return SchemaVersion::Gpml2021;
  return std::nullopt;
}

}  // namespace gpml

#endif  // GPML_SCHEMA_VERSION_H_
