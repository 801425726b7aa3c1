#include <gpml/xml/schema_validator.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>

#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlschemas.h>

#include <gpml/errors.h>
#include <gpml/logging.h>

#ifndef GPML_SCHEMA_DIR
#define GPML_SCHEMA_DIR ""
#endif

namespace gpml {
namespace xml {

namespace {

// libxml2 2.12 made the structured error argument const.
#if LIBXML_VERSION >= 21200
using ErrorPtr = const xmlError*;
#else
using ErrorPtr = xmlError*;
#endif

struct SchemaParserCtxtDeleter
{
  void operator()(xmlSchemaParserCtxt* ctxt) const
  {
    xmlSchemaFreeParserCtxt(ctxt);
  }
};
struct SchemaDeleter
{
  void operator()(xmlSchema* schema) const
  {
    xmlSchemaFree(schema);
  }
};
struct SchemaValidCtxtDeleter
{
  void operator()(xmlSchemaValidCtxt* ctxt) const
  {
    xmlSchemaFreeValidCtxt(ctxt);
  }
};
struct DocDeleter
{
  void operator()(xmlDoc* doc) const
  {
    xmlFreeDoc(doc);
  }
};

std::string describe(const xmlError* error)
{
  std::string message = error->message ? error->message : "unknown error";
  while (!message.empty() && (message.back() == '\n' || message.back() == ' '))
    message.pop_back();
  if (error->line > 0)
    message += " at line " + std::to_string(error->line);
  return message;
}

void collectError(void* user_data, ErrorPtr error)
{
  if (!error || error->level < XML_ERR_ERROR)
    return;
  static_cast<std::vector<std::string>*>(user_data)->push_back(describe(error));
}

std::vector<std::string> splitPath(const std::string& value)
{
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ':'))
  {
    if (!item.empty())
      out.push_back(item);
  }
  return out;
}

}  // namespace

SchemaValidator::SchemaValidator(std::string schema_dir) : schema_dir_(std::move(schema_dir))
{
}

std::vector<std::string> SchemaValidator::searchRoots() const
{
  if (!schema_dir_.empty())
    return { schema_dir_ };
  if (const char* env = std::getenv("GPML_SCHEMA_PATH"))
  {
    auto roots = splitPath(env);
    if (!roots.empty())
      return roots;
  }
  return { GPML_SCHEMA_DIR };
}

std::string SchemaValidator::schemaPath(SchemaVersion version) const
{
  for (const auto& root : searchRoots())
  {
    std::filesystem::path candidate = std::filesystem::path(root) / schemaFileName(version);
    if (std::filesystem::is_regular_file(candidate))
      return candidate.string();
  }
  throw ConversionError(std::string("Schema file '") + schemaFileName(version) + "' not found");
}

std::vector<std::string> SchemaValidator::violations(const std::string& document, SchemaVersion version) const
{
  const std::string path = schemaPath(version);
  std::vector<std::string> errors;

  std::unique_ptr<xmlSchemaParserCtxt, SchemaParserCtxtDeleter> parser(xmlSchemaNewParserCtxt(path.c_str()));
  if (!parser)
    throw ConversionError("Could not create schema parser for '" + path + "'");
  xmlSchemaSetParserStructuredErrors(parser.get(), collectError, &errors);

  std::unique_ptr<xmlSchema, SchemaDeleter> schema(xmlSchemaParse(parser.get()));
  if (!schema)
    throw ConversionError("Invalid schema '" + path + "'" + (errors.empty() ? "" : ": " + errors.front()));

  std::unique_ptr<xmlDoc, DocDeleter> doc(xmlReadMemory(document.data(), static_cast<int>(document.size()),
                                                        "document.gpml", nullptr,
                                                        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if (!doc)
  {
    const xmlError* error = xmlGetLastError();
    errors.push_back(error ? describe(error) : "document is not well-formed");
    return errors;
  }

  std::unique_ptr<xmlSchemaValidCtxt, SchemaValidCtxtDeleter> valid(xmlSchemaNewValidCtxt(schema.get()));
  if (!valid)
    throw ConversionError("Could not create schema validation context for '" + path + "'");
  xmlSchemaSetValidStructuredErrors(valid.get(), collectError, &errors);

  int rc = xmlSchemaValidateDoc(valid.get(), doc.get());
  if (rc != 0 && errors.empty())
    errors.push_back("validation failed with code " + std::to_string(rc));
  return errors;
}

void SchemaValidator::validate(const std::string& document, SchemaVersion version) const
{
  auto errors = violations(document, version);
  if (errors.empty())
    return;

  logger()->error("{} validation failed with {} violation(s), first: {}", toString(version), errors.size(),
                  errors.front());
  throw SchemaValidationError(errors.front(), document);
}

}  // namespace xml
}  // namespace gpml
