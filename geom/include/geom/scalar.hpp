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
#include <algorithm>
#include <cstdint>

namespace geom
{

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

constexpr double kDegToRad = kPi / 180.0;
constexpr double kRadToDeg = 180.0 / kPi;

constexpr double deg_to_rad(double deg) { return deg * kDegToRad; }
constexpr double rad_to_deg(double rad) { return rad * kRadToDeg; }

inline double clamp(double value, double min, double max)
{
  return std::max(min, std::min(max, value));
}

inline double clamp01(double v) { return clamp(v, 0.0, 1.0); }

// Wrap an angle in radians into [0, 2pi).
double normalize_angle(double a);

// Counter-clockwise arc length from start to end in [0, 2pi). A non-zero
// whole-turn difference is reported as 2pi, not 0.
double normalize_arc_length(double start, double end);

// True if angle lies on the arc that starts at start and runs arc_len radians
// counter-clockwise. angle and start must already be normalized.
bool angle_is_between(double angle, double start, double arc_len);

// Smallest power of two >= n (n <= 0 -> 1, n == 1 -> 2). Saturates at 2^62,
// the largest power of two an int64_t holds.
constexpr int64_t kMaxPowerOf2 = INT64_C(1) << 62;

int64_t next_power_of_2(int64_t n);

}  // namespace geom
