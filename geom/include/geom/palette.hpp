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
#include <random>
#include <string>

#include "geom/types.hpp"

namespace geom
{

// 360 / phi^2
constexpr double kGoldenAngleDeg = 137.50776405003785;

struct PaletteOptions
{
  // Degrees. Drawn from the seeded generator when absent.
  std::optional<double> start_hue;
  double golden_angle = kGoldenAngleDeg;
  double base_saturation = 0.68;
  double base_value = 0.82;
  double alpha = 1.0;
  uint64_t seed = 0;
};

// Endless sequence of well-separated colors. Hue advances by the golden
// angle; saturation and value are jittered by Halton sequences in bases 3
// and 2. Equal options give equal sequences.
class InfinitePalette
{
public:
  explicit InfinitePalette(const PaletteOptions & options = PaletteOptions());

  Rgba next_rgba();
  std::string next_hex();

  // Restart the sequence with a hue drawn from the generator.
  void reset();
  void reset(double start_hue);

  double start_hue() const { return start_hue_; }
  uint64_t count() const { return count_; }

private:
  double draw_start_hue();

  PaletteOptions options_;
  std::mt19937_64 rng_;
  double start_hue_;
  uint64_t count_ = 0;
};

}  // namespace geom
