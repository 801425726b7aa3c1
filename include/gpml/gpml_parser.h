#ifndef GPML_GPML_PARSER_H_
#define GPML_GPML_PARSER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <tinyxml2.h>

#include <gpml/convert/version_converter.h>
#include <gpml/model/pathway_model.h>
#include <gpml/model/xref.h>
#include <gpml/schema_version.h>
#include <gpml/xml/schema_validator.h>

namespace gpml {

struct ReadOptions
{
  bool validate = false;
  const DataSourceResolver* resolver = nullptr;
  bool reconcile = true;
  bool fix_references = true;
  // Seed of the id generator; random when unset.
  std::optional<std::uint32_t> id_seed;
};

struct WriteOptions
{
  bool validate = false;
  bool pretty = true;
};

/**
 * @brief Entry point for loading and saving GPML documents.
 *
 * Loading detects the schema version from the root xmlns and returns a model
 * in that version's vocabulary. Saving converts the model in place to the
 * requested version, repairs dangling references, drops empty groups and
 * then encodes it; the caller's model is left in the written vocabulary.
 */
class PathwayParser
{
public:
  explicit PathwayParser(std::string schema_dir = {});

  PathwayModel loadPathwayFromFile(const std::string& filename, const ReadOptions& options = {}) const;
  PathwayModel loadPathwayFromText(const std::string& text, const ReadOptions& options = {}) const;

  void savePathwayToFile(PathwayModel& model, const std::string& filename, SchemaVersion version,
                         const WriteOptions& options = {}) const;
  std::string savePathwayToText(PathwayModel& model, SchemaVersion version, const WriteOptions& options = {}) const;

  /// Report of the conversion done by the last save, if any.
  const convert::ConversionReport& lastConversion() const
  {
    return last_conversion_;
  }

  /// Schema version named by the root xmlns. Throws ConversionError for a
  /// missing or unknown namespace.
  static SchemaVersion detectVersion(const tinyxml2::XMLElement* root);

private:
  PathwayModel loadPathway(const tinyxml2::XMLDocument& doc, const std::string& text,
                           const ReadOptions& options) const;

  std::unique_ptr<tinyxml2::XMLDocument> encode(PathwayModel& model, SchemaVersion version) const;

  xml::SchemaValidator validator_;
  convert::VersionConverter converter_;
  mutable convert::ConversionReport last_conversion_;
};

}  // namespace gpml

#endif  // GPML_GPML_PARSER_H_
