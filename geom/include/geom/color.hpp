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

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "geom/types.hpp"

namespace geom
{

// Accepts 3, 4, 6 or 8 hex digits with an optional leading '#'. Any alpha
// digits are ignored. std::nullopt for any other length or a non-hex digit.
std::optional<Rgb> hex_to_rgb(std::string_view hex);

// Same formats as hex_to_rgb; alpha defaults to 1 when absent.
std::optional<Rgba> hex_to_rgba(std::string_view hex);

// "#rrggbb", lowercase, channels clamped.
std::string rgb_to_hex(const Rgb & c);

// "#rrggbb" when alpha rounds to 255, otherwise "#rrggbbaa".
std::string rgba_to_hex(const Rgba & c);

// "rgba(R, G, B, a)" with integer channels in [0, 255].
std::string rgba_to_web_string(const Rgba & c);

// Hue is rounded to whole degrees.
Hsv rgb_to_hsv(const Rgb & c);
Hsv rgba_to_hsv(const Rgba & c);

// Hue is wrapped into [0, 360) first.
Rgb hsv_to_rgb(const Hsv & c);
Rgba hsv_to_rgba(const Hsv & c, double alpha = 1.0);

// Unclamped.
void lerp_rgba(const Rgba & a, const Rgba & b, double t, Rgba & out);

// Hue follows the shorter way around the circle and lands in [0, 360).
void lerp_hsv(const Hsv & a, const Hsv & b, double t, Hsv & out);

// R in the low byte, then G, B, A. Channels are clamped before packing.
uint32_t rgba_to_u32(const Rgba & c);
Rgba u32_to_rgba(uint32_t color);

}  // namespace geom
