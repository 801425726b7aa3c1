#ifndef GPML_XML_ATTRIBUTE_SCHEMA_H_
#define GPML_XML_ATTRIBUTE_SCHEMA_H_

#include <optional>
#include <string>
#include <unordered_map>

#include <tinyxml2.h>

#include <gpml/schema_version.h>

namespace gpml {
namespace xml {

/// Coercion class of an attribute value. Drives default comparison.
enum class ValueKind
{
  String,
  Id,
  IdRef,
  Float,
  Dimension,
  Integer,
  Color,
  Style,
  Rotation
};

struct AttributeInfo
{
  ValueKind kind;
  const char* default_value;  // nullptr when the attribute has no default
  bool required;
};

/// Per-version table of (tag, attribute) -> AttributeInfo.
///
/// Keys are "Tag@Attribute", where Tag is the dotted element path used by the
/// readers and writers ("DataNode.Graphics", "Interaction.Graphics.Point").
/// Every attribute the codec reads or writes must be listed; access to any
/// other key throws UnknownAttributeError.
class AttributeSchema
{
public:
  static const AttributeSchema& forVersion(SchemaVersion version);

  SchemaVersion version() const
  {
    return version_;
  }

  bool contains(const std::string& tag, const char* name) const;

  /// Throws UnknownAttributeError for keys outside the table.
  const AttributeInfo& info(const std::string& tag, const char* name) const;

  /// True when value equals the registered default of an optional attribute:
  /// string equality, |a-b| < 1e-6 for numbers, color equivalence for colors.
  bool isDefault(const std::string& tag, const char* name, const std::string& value) const;

  /// ---------------------------------------------------------------------------
  /// Reading. Absent attributes yield the registered default.
  /// ---------------------------------------------------------------------------

  /// Value or default; nullopt when neither exists.
  std::optional<std::string> get(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const;

  /// Value or default; empty string when neither exists.
  std::string getString(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const;

  /// Throws ConversionError when the attribute is absent and has no default.
  std::string getRequired(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const;

  /// Numeric accessors. Malformed text throws ConversionError naming tag,
  /// attribute and line; a missing value without default throws as well.
  double getDouble(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const;
  std::optional<double> getOptionalDouble(const std::string& tag, const char* name,
                                          const tinyxml2::XMLElement* elem) const;
  int getInt(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const;
  std::optional<int> getOptionalInt(const std::string& tag, const char* name, const tinyxml2::XMLElement* elem) const;

  /// ---------------------------------------------------------------------------
  /// Writing. Optional attributes equal to their default are left out.
  /// ---------------------------------------------------------------------------
  void set(const std::string& tag, const char* name, tinyxml2::XMLElement* elem, const std::string& value) const;
  void setDouble(const std::string& tag, const char* name, tinyxml2::XMLElement* elem, double value) const;
  void setInt(const std::string& tag, const char* name, tinyxml2::XMLElement* elem, int value) const;

private:
  AttributeSchema(SchemaVersion version, std::unordered_map<std::string, AttributeInfo> table);

  SchemaVersion version_;
  std::unordered_map<std::string, AttributeInfo> table_;
};

/// Strict number parsing; the whole text must be consumed.
std::optional<double> parseDouble(const std::string& text);
std::optional<int> parseInt(const std::string& text);

/// GPML2013a rotation: radians, or one of Top, Right, Bottom, Left.
std::optional<double> parseRotation(const std::string& text);

}  // namespace xml
}  // namespace gpml

#endif  // GPML_XML_ATTRIBUTE_SCHEMA_H_
