#ifndef GPML_ERRORS_H_
#define GPML_ERRORS_H_

#include <stdexcept>
#include <string>
#include <utility>

namespace gpml {

/// Base class of every codec failure.
class GpmlError : public std::runtime_error
{
public:
  explicit GpmlError(const std::string& what) : std::runtime_error(what)
  {
  }
};

/// Attribute access outside the schema table. Indicates a programming error
/// or a drift between the code and the table, never bad input.
class UnknownAttributeError : public std::logic_error
{
public:
  explicit UnknownAttributeError(const std::string& key)
    : std::logic_error("Trying to access invalid attribute '" + key + "'"), key_(key)
  {
  }

  const std::string& key() const
  {
    return key_;
  }

private:
  std::string key_;
};

/// Malformed or missing value while decoding or encoding a document.
class ConversionError : public GpmlError
{
public:
  explicit ConversionError(const std::string& what) : GpmlError(what)
  {
  }

  ConversionError(const std::string& what, const std::string& tag, const std::string& attribute, int line)
    : GpmlError(what + " (<" + tag + (attribute.empty() ? "" : " " + attribute) + ">" +
                (line > 0 ? " at line " + std::to_string(line) : "") + ")")
    , tag_(tag)
    , attribute_(attribute)
    , line_(line)
  {
  }

  const std::string& tag() const
  {
    return tag_;
  }
  const std::string& attribute() const
  {
    return attribute_;
  }
  int line() const
  {
    return line_;
  }

private:
  std::string tag_;
  std::string attribute_;
  int line_ = 0;
};

/// Explicit registration of an identifier that is already mapped.
class DuplicateIdError : public GpmlError
{
public:
  explicit DuplicateIdError(const std::string& id) : GpmlError("Duplicate element id '" + id + "'"), id_(id)
  {
  }

  const std::string& id() const
  {
    return id_;
  }

private:
  std::string id_;
};

/// Aggregated XSD validation failure. Carries the first violation and the
/// serialized document that was checked.
class SchemaValidationError : public GpmlError
{
public:
  SchemaValidationError(const std::string& violation, std::string document)
    : GpmlError("Document is not valid against its schema: " + violation)
    , violation_(violation)
    , document_(std::move(document))
  {
  }

  const std::string& violation() const
  {
    return violation_;
  }
  const std::string& document() const
  {
    return document_;
  }

private:
  std::string violation_;
  std::string document_;
};

}  // namespace gpml

#endif  // GPML_ERRORS_H_
