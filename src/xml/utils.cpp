#include <gpml/xml/utils.h>

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace gpml {
namespace xml {

std::string formatNumber(double value)
{
  if (value == 0.0)
    return "0";  // also folds -0
  if (std::isfinite(value) && value == std::floor(value) && std::abs(value) < 1e15)
    return fmt::format("{:.0f}", value);
  return fmt::format("{}", value);
}

}  // namespace xml
}  // namespace gpml
