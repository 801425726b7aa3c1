#ifndef GPML_XML_SCHEMA_VALIDATOR_H_
#define GPML_XML_SCHEMA_VALIDATOR_H_

#include <string>
#include <vector>

#include <gpml/schema_version.h>

namespace gpml {
namespace xml {

/**
 * @brief Checks serialized GPML documents against the GPML2013a / GPML2021 XSD.
 *
 * Schema files are looked up by file name in the directory given to the
 * constructor. Without one, every root listed in GPML_SCHEMA_PATH
 * (':'-separated) is tried in turn, falling back to the compiled-in
 * GPML_SCHEMA_DIR.
 */
class SchemaValidator
{
public:
  explicit SchemaValidator(std::string schema_dir = {});

  /// Full path of the XSD for version. Throws ConversionError if no search
  /// root holds it.
  std::string schemaPath(SchemaVersion version) const;

  /// Throws SchemaValidationError carrying the first violation and the
  /// document when it does not conform.
  void validate(const std::string& document, SchemaVersion version) const;

  /// Every violation found, empty if the document is valid.
  std::vector<std::string> violations(const std::string& document, SchemaVersion version) const;

private:
  std::vector<std::string> searchRoots() const;

  std::string schema_dir_;
};

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_SCHEMA_VALIDATOR_H_
