#ifndef GPML_MODEL_XREF_H_
#define GPML_MODEL_XREF_H_

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace gpml {

/// Cross-reference into an external biological database.
struct Xref
{
  std::string identifier;
  std::string data_source;  // as written in the document, e.g. "Entrez Gene" or "ncbigene"

  // Set when a DataSourceResolver recognized data_source.
  std::optional<std::string> data_source_id;

  bool operator==(const Xref& other) const
  {
    return identifier == other.identifier && data_source == other.data_source;
  }
  bool operator!=(const Xref& other) const
  {
    return !(*this == other);
  }
};

/// Lookup of a database full name to its compact data source id. Owned by
/// the caller and injected into the readers.
class DataSourceResolver
{
public:
  virtual ~DataSourceResolver() = default;

  virtual std::optional<std::string> resolveDataSource(const std::string& full_name) const = 0;
};

/// Resolver backed by a fixed name -> id table.
class MapDataSourceResolver : public DataSourceResolver
{
public:
  MapDataSourceResolver() = default;
  explicit MapDataSourceResolver(std::map<std::string, std::string> table) : table_(std::move(table))
  {
  }

  void add(const std::string& full_name, const std::string& id)
  {
    table_[full_name] = id;
  }

  std::optional<std::string> resolveDataSource(const std::string& full_name) const override
  {
    auto it = table_.find(full_name);
    if (it == table_.end())
      return std::nullopt;
    return it->second;
  }

private:
  std::map<std::string, std::string> table_;
};

}  // namespace gpml

#endif  // GPML_MODEL_XREF_H_
