#ifndef GPML_CONVERT_VERSION_CONVERTER_H_
#define GPML_CONVERT_VERSION_CONVERTER_H_

#include <string>
#include <vector>

#include <gpml/model/pathway_model.h>
#include <gpml/schema_version.h>

namespace gpml {
namespace convert {

/// Outcome of a conversion. lossy is set when some data has no form in the
/// target version; messages say what was dropped or approximated.
struct ConversionReport
{
  bool lossy = false;
  std::vector<std::string> messages;

  void lost(const std::string& message)
  {
    lossy = true;
    messages.push_back(message);
  }
};

/**
 * @brief Rewrites a model from one schema vocabulary into the other, in place.
 *
 * Upgrade (GPML2013a -> GPML2021):
 *  - group styles None/Group become Group/Transparent;
 *  - "Unknown" data node and state types become "Undefined", "Broken" lines "Dashed";
 *  - spaced shape names become camelCase;
 *  - retired shapes become their replacement drawn with a double border of
 *    width 3 and a transparent fill;
 *  - the DoubleLine and CellularComponent attributes become the Double style
 *    and the component shape;
 *  - arrowheads fold into the interaction panel set.
 *
 * Downgrade reverses the renames. It is not lossless; every loss is
 * recorded in the report and logged as a warning.
 */
class VersionConverter
{
public:
  /// No-op when the model already is in target vocabulary.
  ConversionReport convert(PathwayModel& model, SchemaVersion target) const;

  ConversionReport upgrade(PathwayModel& model) const;
  ConversionReport downgrade(PathwayModel& model) const;
};

}  // namespace convert
}  // namespace gpml

#endif  // GPML_CONVERT_VERSION_CONVERTER_H_
