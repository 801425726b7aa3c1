#include <gpml/model/color.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>

namespace gpml {

namespace {

struct CaseInsensitiveLess
{
  bool operator()(const std::string& a, const std::string& b) const
  {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
      return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
  }
};

const std::map<std::string, std::string, CaseInsensitiveLess>& namedColors()
{
  static const std::map<std::string, std::string, CaseInsensitiveLess> colors = {
    { "Aqua", "00ffff" },   { "Black", "000000" },  { "Blue", "0000ff" },       { "Fuchsia", "ff00ff" },
    { "Gray", "808080" },   { "Green", "008000" },  { "Lime", "00ff00" },       { "Maroon", "800000" },
    { "Navy", "000080" },   { "Olive", "808000" },  { "Purple", "800080" },     { "Red", "ff0000" },
    { "Silver", "c0c0c0" }, { "Teal", "008080" },   { "White", "ffffff" },      { "Yellow", "ffff00" },
    { "Transparent", "00000000" },
  };
  return colors;
}

int hexValue(char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

std::optional<std::uint8_t> hexByte(const std::string& hex, size_t pos)
{
  int hi = hexValue(hex[pos]);
  int lo = hexValue(hex[pos + 1]);
  if (hi < 0 || lo < 0)
    return std::nullopt;
  return static_cast<std::uint8_t>(hi * 16 + lo);
}

}  // namespace

std::optional<Color> parseColor(const std::string& text)
{
  std::string hex = text;
  auto named = namedColors().find(text);
  if (named != namedColors().end())
    hex = named->second;
  if (!hex.empty() && hex[0] == '#')
    hex.erase(0, 1);
  if (hex.size() != 6 && hex.size() != 8)
    return std::nullopt;

  Color color;
  auto r = hexByte(hex, 0);
  auto g = hexByte(hex, 2);
  auto b = hexByte(hex, 4);
  if (!r || !g || !b)
    return std::nullopt;
  color.r = *r;
  color.g = *g;
  color.b = *b;
  if (hex.size() == 8)
  {
    auto a = hexByte(hex, 6);
    if (!a)
      return std::nullopt;
    color.a = *a;
  }
  return color;
}

std::string toHex(const Color& color)
{
  char buf[9];
  if (color.a == 255)
    std::snprintf(buf, sizeof(buf), "%02x%02x%02x", color.r, color.g, color.b);
  else
    std::snprintf(buf, sizeof(buf), "%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
  return buf;
}

bool colorEquivalent(const std::string& lhs, const std::string& rhs)
{
  auto a = parseColor(lhs);
  auto b = parseColor(rhs);
  if (!a || !b)
    return lhs == rhs;
  if (a->isTransparent() || b->isTransparent())
    return a->isTransparent() && b->isTransparent();
  return *a == *b;
}

}  // namespace gpml
