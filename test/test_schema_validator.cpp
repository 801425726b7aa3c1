#include <cstdlib>
#include <string>

#include <gpml/errors.h>
#include <gpml/xml/gpml2013a_reader.h>
#include <gpml/xml/gpml2013a_writer.h>
#include <gpml/xml/gpml2021_reader.h>
#include <gpml/xml/gpml2021_writer.h>
#include <gpml/xml/schema_validator.h>
#include <gpml/xml/utils.h>

#include <gtest/gtest.h>

using namespace gpml;
using namespace gpml::xml;

static std::string writtenFixture(const std::string& name, SchemaVersion version)
{
  tinyxml2::XMLDocument doc;
  const std::string filename = std::string(GPML_TEST_FOLDER) + name;
  EXPECT_EQ(doc.LoadFile(filename.c_str()), tinyxml2::XML_SUCCESS) << filename;
  if (version == SchemaVersion::Gpml2013a)
  {
    PathwayModel model = Gpml2013aReader().read(doc.RootElement(), 11);
    return printDocument(*Gpml2013aWriter().write(model));
  }
  PathwayModel model = Gpml2021Reader().read(doc.RootElement(), 11);
  return printDocument(*Gpml2021Writer().write(model));
}

TEST(SchemaValidator, SchemaPathFollowsVersion)
{
  SchemaValidator validator(GPML_SCHEMA_DIR);
  const std::string path = validator.schemaPath(SchemaVersion::Gpml2013a);
  EXPECT_NE(path.find("GPML2013a.xsd"), std::string::npos);
  EXPECT_NE(validator.schemaPath(SchemaVersion::Gpml2021).find("GPML2021.xsd"), std::string::npos);
}

TEST(SchemaValidator, Gpml2013aWriterOutputConforms)
{
  SchemaValidator validator(GPML_SCHEMA_DIR);
  const std::string text = writtenFixture("caspase_cascade_2013a.gpml", SchemaVersion::Gpml2013a);
  auto errors = validator.violations(text, SchemaVersion::Gpml2013a);
  EXPECT_TRUE(errors.empty()) << errors.front();
  EXPECT_NO_THROW(validator.validate(text, SchemaVersion::Gpml2013a));
}

TEST(SchemaValidator, Gpml2021WriterOutputConforms)
{
  SchemaValidator validator(GPML_SCHEMA_DIR);
  const std::string text = writtenFixture("caspase_cascade_2021.gpml", SchemaVersion::Gpml2021);
  auto errors = validator.violations(text, SchemaVersion::Gpml2021);
  EXPECT_TRUE(errors.empty()) << errors.front();
}

TEST(SchemaValidator, ViolationCarriesDocument)
{
  const std::string text = R"(<?xml version="1.0" encoding="UTF-8"?>
<Pathway xmlns="http://pathvisio.org/GPML/2021" title="Broken">
  <Graphics boardWidth="100" boardHeight="100"/>
  <DataNodes>
    <DataNode textLabel="no id" type="GeneProduct">
      <Graphics centerX="1" centerY="1" width="1" height="1"/>
    </DataNode>
  </DataNodes>
</Pathway>)";

  SchemaValidator validator(GPML_SCHEMA_DIR);
  EXPECT_FALSE(validator.violations(text, SchemaVersion::Gpml2021).empty());
  try
  {
    validator.validate(text, SchemaVersion::Gpml2021);
    FAIL() << "Expected SchemaValidationError";
  }
  catch (const SchemaValidationError& e)
  {
    EXPECT_FALSE(e.violation().empty());
    EXPECT_EQ(e.document(), text);
  }
}

TEST(SchemaValidator, WrongVersionIsRejected)
{
  SchemaValidator validator(GPML_SCHEMA_DIR);
  const std::string text = writtenFixture("caspase_cascade_2021.gpml", SchemaVersion::Gpml2021);
  EXPECT_THROW(validator.validate(text, SchemaVersion::Gpml2013a), SchemaValidationError);
}

TEST(SchemaValidator, MalformedDocumentIsAViolation)
{
  SchemaValidator validator(GPML_SCHEMA_DIR);
  auto errors = validator.violations("<Pathway xmlns=\"http://pathvisio.org/GPML/2021\">", SchemaVersion::Gpml2021);
  EXPECT_FALSE(errors.empty());
}

TEST(SchemaValidator, SearchPathFromEnvironment)
{
  ASSERT_EQ(setenv("GPML_SCHEMA_PATH", (std::string("/nonexistent:") + GPML_SCHEMA_DIR).c_str(), 1), 0);
  SchemaValidator validator;
  EXPECT_NE(validator.schemaPath(SchemaVersion::Gpml2021).find("GPML2021.xsd"), std::string::npos);
  unsetenv("GPML_SCHEMA_PATH");
}

TEST(SchemaValidator, MissingSchemaThrows)
{
  SchemaValidator validator("/nonexistent/schema/dir");
  EXPECT_THROW(validator.schemaPath(SchemaVersion::Gpml2021), ConversionError);
  EXPECT_THROW(validator.validate("<Pathway/>", SchemaVersion::Gpml2021), ConversionError);
}
