#ifndef GPML_MODEL_COLOR_H_
#define GPML_MODEL_COLOR_H_

#include <cstdint>
#include <optional>
#include <string>

namespace gpml {

struct Color
{
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 255;

  bool isTransparent() const
  {
    return a == 0;
  }

  bool operator==(const Color& other) const
  {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
  bool operator!=(const Color& other) const
  {
    return !(*this == other);
  }

  static Color black()
  {
    return {};
  }
  static Color white()
  {
    return { 255, 255, 255, 255 };
  }
  static Color transparent()
  {
    return { 0, 0, 0, 0 };
  }
};

/// Parse a named color ("Black", "Transparent", case insensitive) or a hex
/// string "rrggbb" / "rrggbbaa", with or without a leading '#'.
std::optional<Color> parseColor(const std::string& text);

/// Lower-case hex without '#'; the alpha byte is appended only when it is not 255.
std::string toHex(const Color& color);

/// Equivalence used for default elision: both sides must agree on being
/// transparent, and opaque colors compare by value.
bool colorEquivalent(const std::string& lhs, const std::string& rhs);

}  // namespace gpml

#endif  // GPML_MODEL_COLOR_H_
