#include <cmath>
#include <memory>
#include <string>

#include <gpml/errors.h>
#include <gpml/xml/attribute_schema.h>
#include <gpml/xml/utils.h>

#include <gtest/gtest.h>

using namespace gpml;
using namespace gpml::xml;

static tinyxml2::XMLElement* parseElement(tinyxml2::XMLDocument& doc, const char* text)
{
  EXPECT_EQ(doc.Parse(text), tinyxml2::XML_SUCCESS);
  return doc.RootElement();
}

TEST(AttributeSchema, UnknownKeyIsProgrammingError)
{
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2021);
  try
  {
    schema.info("DataNode", "colour");
    FAIL() << "expected UnknownAttributeError";
  }
  catch (const UnknownAttributeError& e)
  {
    EXPECT_EQ(e.key(), "DataNode@colour");
  }
}

TEST(AttributeSchema, TablesAreVersionSpecific)
{
  const auto& v2013 = AttributeSchema::forVersion(SchemaVersion::Gpml2013a);
  const auto& v2021 = AttributeSchema::forVersion(SchemaVersion::Gpml2021);

  EXPECT_TRUE(v2013.contains("Group", "Style"));
  EXPECT_FALSE(v2021.contains("Group", "Style"));
  EXPECT_TRUE(v2021.contains("Group", "type"));
  EXPECT_TRUE(v2013.contains("Shape.Graphics", "Rotation"));
  EXPECT_TRUE(v2021.contains("Pathway.Graphics", "backgroundColor"));
}

TEST(AttributeSchema, BiopaxRefIsNotAnAttribute)
{
  const auto& v2013 = AttributeSchema::forVersion(SchemaVersion::Gpml2013a);
  for (const char* tag : { "Pathway", "DataNode", "State", "Label", "Shape", "Group", "Interaction", "GraphicalLine" })
    EXPECT_FALSE(v2013.contains(tag, "BiopaxRef")) << tag;
  EXPECT_FALSE(v2013.contains("Interaction", "Type"));
  EXPECT_FALSE(v2013.contains("GraphicalLine", "Type"));
  EXPECT_TRUE(v2013.contains("Interaction", "GraphId"));
}

TEST(AttributeSchema, MissingOptionalAttributeReadsAsDefault)
{
  tinyxml2::XMLDocument doc;
  auto* elem = parseElement(doc, R"(<DataNode textLabel="p53"/>)");
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2021);

  EXPECT_EQ(schema.getString("DataNode", "type", elem), "Undefined");
  EXPECT_EQ(schema.getString("DataNode", "textLabel", elem), "p53");
  EXPECT_FALSE(schema.get("DataNode", "aliasRef", elem).has_value());
}

TEST(AttributeSchema, MissingRequiredAttributeThrows)
{
  tinyxml2::XMLDocument doc;
  auto* elem = parseElement(doc, R"(<Graphics centerY="10"/>)");
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2021);

  EXPECT_THROW(schema.getDouble("DataNode.Graphics", "centerX", elem), ConversionError);
}

TEST(AttributeSchema, MalformedNumberNamesTagAndAttribute)
{
  tinyxml2::XMLDocument doc;
  auto* elem = parseElement(doc, "<Graphics\n CenterX=\"12,5\"/>");
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2013a);

  try
  {
    schema.getDouble("DataNode.Graphics", "CenterX", elem);
    FAIL() << "expected ConversionError";
  }
  catch (const ConversionError& e)
  {
    EXPECT_EQ(e.tag(), "DataNode.Graphics");
    EXPECT_EQ(e.attribute(), "CenterX");
    EXPECT_EQ(e.line(), 1);
    EXPECT_NE(std::string(e.what()).find("12,5"), std::string::npos);
  }
}

TEST(AttributeSchema, RotationKeywordsMapToRadians)
{
  tinyxml2::XMLDocument doc;
  auto* elem = parseElement(doc, R"(<Graphics Rotation="Right"/>)");
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2013a);

  EXPECT_NEAR(*schema.getOptionalDouble("Shape.Graphics", "Rotation", elem), M_PI / 2.0, 1e-12);
  EXPECT_NEAR(*parseRotation("Bottom"), M_PI, 1e-12);
  EXPECT_NEAR(*parseRotation("Left"), 3.0 * M_PI / 2.0, 1e-12);
  EXPECT_DOUBLE_EQ(*parseRotation("0.5"), 0.5);
}

TEST(AttributeSchema, DefaultValuesAreElided)
{
  tinyxml2::XMLDocument doc;
  auto* elem = doc.NewElement("Graphics");
  doc.InsertEndChild(elem);
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2021);

  schema.setDouble("DataNode.Graphics", "borderWidth", elem, 1.0000001);
  schema.set("DataNode.Graphics", "fontName", elem, "Arial");
  schema.set("DataNode.Graphics", "fillColor", elem, "FFFFFF");
  schema.set("DataNode.Graphics", "textColor", elem, "Black");
  EXPECT_EQ(elem->FirstAttribute(), nullptr);

  schema.setDouble("DataNode.Graphics", "borderWidth", elem, 2.0);
  schema.set("DataNode.Graphics", "fontName", elem, "Helvetica");
  EXPECT_STREQ(elem->Attribute("borderWidth"), "2");
  EXPECT_STREQ(elem->Attribute("fontName"), "Helvetica");
}

TEST(AttributeSchema, RequiredValuesAreAlwaysWritten)
{
  tinyxml2::XMLDocument doc;
  auto* elem = doc.NewElement("Xref");
  doc.InsertEndChild(elem);
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2013a);

  schema.set("DataNode.Xref", "Database", elem, "");
  schema.set("DataNode.Xref", "ID", elem, "");
  EXPECT_STREQ(elem->Attribute("Database"), "");
  EXPECT_STREQ(elem->Attribute("ID"), "");
}

TEST(AttributeSchema, TransparentMatchesOnlyTransparent)
{
  const auto& schema = AttributeSchema::forVersion(SchemaVersion::Gpml2013a);
  EXPECT_TRUE(schema.isDefault("Shape.Graphics", "FillColor", "Transparent"));
  EXPECT_TRUE(schema.isDefault("Shape.Graphics", "FillColor", "ffffff00"));
  EXPECT_FALSE(schema.isDefault("Shape.Graphics", "FillColor", "ffffff"));
}

TEST(AttributeSchema, FormatNumberIsShortest)
{
  EXPECT_EQ(formatNumber(1.0), "1");
  EXPECT_EQ(formatNumber(-0.0), "0");
  EXPECT_EQ(formatNumber(12.5), "12.5");
  EXPECT_EQ(formatNumber(0.1), "0.1");
}
