// Copyright 2026 Tamaki Nishino
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "geom/color.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

#include "geom/scalar.hpp"

namespace geom
{

namespace
{

constexpr double kInv255 = 1.0 / 255.0;
constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c)
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Expand #RGB / #RGBA / #RRGGBB / #RRGGBBAA into four bytes.
std::optional<std::array<int, 4>> parse_hex(std::string_view hex)
{
  if (!hex.empty() && hex.front() == '#') {
    hex.remove_prefix(1);
  }
  const size_t len = hex.size();
  if (len != 3 && len != 4 && len != 6 && len != 8) {
    return std::nullopt;
  }

  std::array<int, 4> bytes = {0, 0, 0, 255};
  const bool short_form = len <= 4;
  const size_t channels = (len == 4 || len == 8) ? 4 : 3;
  for (size_t i = 0; i < channels; ++i) {
    if (short_form) {
      const int d = hex_value(hex[i]);
      if (d < 0) {
        return std::nullopt;
      }
      bytes[i] = d * 16 + d;
    } else {
      const int hi = hex_value(hex[2 * i]);
      const int lo = hex_value(hex[2 * i + 1]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      bytes[i] = hi * 16 + lo;
    }
  }
  return bytes;
}

// Round half up after clamping to [0, 1]. NaN maps to 0.
int to_byte(double c)
{
  if (std::isnan(c)) {
    return 0;
  }
  return static_cast<int>(clamp01(c) * 255.0 + 0.5);
}

void append_byte(std::string & s, int byte)
{
  s.push_back(kHexDigits[byte >> 4]);
  s.push_back(kHexDigits[byte & 15]);
}

}  // anonymous namespace

std::optional<Rgb> hex_to_rgb(std::string_view hex)
{
  const auto bytes = parse_hex(hex);
  if (!bytes) {
    return std::nullopt;
  }
  return Rgb{(*bytes)[0] * kInv255, (*bytes)[1] * kInv255, (*bytes)[2] * kInv255};
}

std::optional<Rgba> hex_to_rgba(std::string_view hex)
{
  const auto bytes = parse_hex(hex);
  if (!bytes) {
    return std::nullopt;
  }
  return Rgba{
    (*bytes)[0] * kInv255, (*bytes)[1] * kInv255, (*bytes)[2] * kInv255, (*bytes)[3] * kInv255};
}

std::string rgb_to_hex(const Rgb & c)
{
  std::string s = "#";
  s.reserve(7);
  for (double channel : c) {
    append_byte(s, to_byte(channel));
  }
  return s;
}

std::string rgba_to_hex(const Rgba & c)
{
  std::string s = rgb_to_hex({c[0], c[1], c[2]});
  const int a8 = to_byte(c[3]);
  if (a8 != 255) {
    append_byte(s, a8);
  }
  return s;
}

std::string rgba_to_web_string(const Rgba & c)
{
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << std::setprecision(6);
  ss << "rgba(" << to_byte(c[0]) << ", " << to_byte(c[1]) << ", " << to_byte(c[2]) << ", " << c[3]
     << ")";
  return ss.str();
}

Hsv rgb_to_hsv(const Rgb & c)
{
  const double r = c[0], g = c[1], b = c[2];
  const double max = std::max({r, g, b});
  const double min = std::min({r, g, b});
  const double diff = max - min;

  double h = 0.0;
  if (diff != 0.0) {
    if (max == r) {
      h = std::fmod((g - b) / diff, 6.0);
    } else if (max == g) {
      h = (b - r) / diff + 2.0;
    } else {
      h = (r - g) / diff + 4.0;
    }
  }

  h = std::floor(h * 60.0 + 0.5);
  if (h < 0.0) {
    h += 360.0;
  }
  if (h >= 360.0) {
    h -= 360.0;
  }

  const double s = max == 0.0 ? 0.0 : diff / max;
  return {h, s, max};
}

Hsv rgba_to_hsv(const Rgba & c) { return rgb_to_hsv({c[0], c[1], c[2]}); }

Rgb hsv_to_rgb(const Hsv & c)
{
  const double s = c[1], v = c[2];
  if (!std::isfinite(c[0])) {
    // No sector to pick; only the achromatic part remains.
    const double m = v - v * s;
    return {m, m, m};
  }
  double hue = std::fmod(c[0], 360.0);
  if (hue < 0.0) {
    hue += 360.0;
  }
  const double h = hue / 60.0;

  const double chroma = v * s;
  const double x = chroma * (1.0 - std::abs(std::fmod(h, 2.0) - 1.0));
  const double m = v - chroma;

  double r = 0.0, g = 0.0, b = 0.0;
  switch (static_cast<int>(h)) {
    case 0:
      r = chroma;
      g = x;
      break;
    case 1:
      r = x;
      g = chroma;
      break;
    case 2:
      g = chroma;
      b = x;
      break;
    case 3:
      g = x;
      b = chroma;
      break;
    case 4:
      r = x;
      b = chroma;
      break;
    default:
      r = chroma;
      b = x;
      break;
  }
  return {r + m, g + m, b + m};
}

Rgba hsv_to_rgba(const Hsv & c, double alpha)
{
  const Rgb rgb = hsv_to_rgb(c);
  return {rgb[0], rgb[1], rgb[2], alpha};
}

void lerp_rgba(const Rgba & a, const Rgba & b, double t, Rgba & out)
{
  for (int i = 0; i < 4; ++i) {
    out[i] = a[i] + (b[i] - a[i]) * t;
  }
}

void lerp_hsv(const Hsv & a, const Hsv & b, double t, Hsv & out)
{
  double diff = b[0] - a[0];
  if (diff > 180.0) {
    diff -= 360.0;
  } else if (diff < -180.0) {
    diff += 360.0;
  }
  double h = std::fmod(a[0] + diff * t + 360.0, 360.0);
  if (h < 0.0) {
    h += 360.0;
  }
  const double s = a[1] + (b[1] - a[1]) * t;
  const double v = a[2] + (b[2] - a[2]) * t;
  out = {h, s, v};
}

uint32_t rgba_to_u32(const Rgba & c)
{
  return static_cast<uint32_t>(to_byte(c[0])) | static_cast<uint32_t>(to_byte(c[1])) << 8 |
         static_cast<uint32_t>(to_byte(c[2])) << 16 | static_cast<uint32_t>(to_byte(c[3])) << 24;
}

Rgba u32_to_rgba(uint32_t color)
{
  return {
    (color & 0xFF) * kInv255, ((color >> 8) & 0xFF) * kInv255, ((color >> 16) & 0xFF) * kInv255,
    ((color >> 24) & 0xFF) * kInv255};
}

}  // namespace geom
