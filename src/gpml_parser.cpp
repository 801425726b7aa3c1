#include <gpml/gpml_parser.h>

#include <fstream>
#include <random>
#include <sstream>

#include <gpml/errors.h>
#include <gpml/logging.h>
#include <gpml/model/coordinates.h>
#include <gpml/xml/gpml2013a_reader.h>
#include <gpml/xml/gpml2013a_writer.h>
#include <gpml/xml/gpml2021_reader.h>
#include <gpml/xml/gpml2021_writer.h>
#include <gpml/xml/utils.h>

namespace gpml {

PathwayParser::PathwayParser(std::string schema_dir) : validator_(std::move(schema_dir))
{
}

SchemaVersion PathwayParser::detectVersion(const tinyxml2::XMLElement* root)
{
  if (!root)
    throw ConversionError("Document has no root element");

  // xmlns is a namespace declaration, not a GPML attribute, and it selects
  // which attribute table applies; it is read before any table exists.
  const char* xmlns = root->Attribute("xmlns");
  if (!xmlns)
    throw ConversionError("Missing namespace", root->Name(), "xmlns", root->GetLineNum());

  auto version = schemaVersionFromNamespace(xmlns);
  if (!version)
    throw ConversionError(std::string("Unsupported namespace '") + xmlns + "'", root->Name(), "xmlns",
                          root->GetLineNum());
  return *version;
}

PathwayModel PathwayParser::loadPathwayFromFile(const std::string& filename, const ReadOptions& options) const
{
  std::ifstream in(filename, std::ios::binary);
  if (!in)
    throw ConversionError("Error loading GPML file: " + filename);

  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad())
    throw ConversionError("Error reading GPML file: " + filename);

  logger()->debug("Loading pathway from '{}'", filename);
  return loadPathwayFromText(buffer.str(), options);
}

PathwayModel PathwayParser::loadPathwayFromText(const std::string& text, const ReadOptions& options) const
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->Parse(text.c_str(), text.size()) != tinyxml2::XML_SUCCESS)
    throw ConversionError(std::string("Error parsing GPML text: ") + doc->ErrorStr());

  return loadPathway(*doc, text, options);
}

PathwayModel PathwayParser::loadPathway(const tinyxml2::XMLDocument& doc, const std::string& text,
                                        const ReadOptions& options) const
{
  const tinyxml2::XMLElement* root = doc.RootElement();
  SchemaVersion version = detectVersion(root);

  if (options.validate)
    validator_.validate(text, version);

  const std::uint32_t seed = options.id_seed ? *options.id_seed : std::random_device{}();
  PathwayModel model = version == SchemaVersion::Gpml2013a ? xml::Gpml2013aReader(options.resolver).read(root, seed) :
                                                             xml::Gpml2021Reader(options.resolver).read(root, seed);

  if (options.fix_references)
    model.fixReferences();
  if (options.reconcile)
  {
    std::size_t n = reconcileCoordinates(model);
    if (n > 0)
      logger()->debug("Reconciled {} line point(s)", n);
  }
  return model;
}

std::unique_ptr<tinyxml2::XMLDocument> PathwayParser::encode(PathwayModel& model, SchemaVersion version) const
{
  last_conversion_ = converter_.convert(model, version);

  model.fixReferences();
  std::size_t removed = model.removeEmptyGroups();
  if (removed > 0)
    logger()->debug("Removed {} empty group(s) before writing", removed);

  if (version == SchemaVersion::Gpml2013a)
    return xml::Gpml2013aWriter().write(model);
  return xml::Gpml2021Writer().write(model);
}

std::string PathwayParser::savePathwayToText(PathwayModel& model, SchemaVersion version,
                                             const WriteOptions& options) const
{
  auto doc = encode(model, version);
  std::string text = xml::printDocument(*doc, options.pretty);

  if (options.validate)
    validator_.validate(text, version);
  return text;
}

void PathwayParser::savePathwayToFile(PathwayModel& model, const std::string& filename, SchemaVersion version,
                                      const WriteOptions& options) const
{
  WriteOptions encode_only = options;
  encode_only.validate = false;
  const std::string text = savePathwayToText(model, version, encode_only);

  std::ofstream out(filename, std::ios::binary | std::ios::trunc);
  if (!out)
    throw ConversionError("Error opening GPML file for writing: " + filename);
  out << text;
  out.flush();
  if (!out)
    throw ConversionError("Error writing GPML file: " + filename);
  logger()->debug("Saved pathway '{}' to '{}' as {}", model.pathway().title, filename, toString(version));

  // The file is kept even when it does not conform.
  if (options.validate)
    validator_.validate(text, version);
}

}  // namespace gpml
