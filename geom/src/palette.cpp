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

#include "geom/palette.hpp"

#include <cmath>

#include "geom/color.hpp"
#include "geom/scalar.hpp"

namespace geom
{

namespace
{

// Radical inverse of index in the given base, in [0, 1).
double halton(uint64_t index, uint64_t base)
{
  double f = 1.0;
  double r = 0.0;
  while (index > 0) {
    f /= static_cast<double>(base);
    r += f * static_cast<double>(index % base);
    index /= base;
  }
  return r;
}

}  // anonymous namespace

InfinitePalette::InfinitePalette(const PaletteOptions & options)
: options_(options), rng_(options.seed), start_hue_(0.0)
{
  start_hue_ = options_.start_hue ? *options_.start_hue : draw_start_hue();
}

Rgba InfinitePalette::next_rgba()
{
  const uint64_t idx = count_ + 1;

  const double hue =
    std::fmod(start_hue_ + static_cast<double>(idx) * options_.golden_angle, 360.0);
  const double s = clamp01(options_.base_saturation * (0.9 + 0.2 * halton(idx, 3)));
  const double v = clamp01(options_.base_value * (0.9 + 0.2 * halton(idx, 2)));

  ++count_;
  return hsv_to_rgba({hue, s, v}, options_.alpha);
}

std::string InfinitePalette::next_hex() { return rgba_to_hex(next_rgba()); }

void InfinitePalette::reset()
{
  start_hue_ = draw_start_hue();
  count_ = 0;
}

void InfinitePalette::reset(double start_hue)
{
  start_hue_ = start_hue;
  count_ = 0;
}

double InfinitePalette::draw_start_hue()
{
  // Top 53 bits of the engine output as a double in [0, 1). The engine's
  // sequence is fixed by the standard, so this is portable across libraries.
  return static_cast<double>(rng_() >> 11) * 0x1.0p-53 * 360.0;
}

}  // namespace geom
