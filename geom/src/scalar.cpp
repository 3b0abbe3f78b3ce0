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

#include "geom/scalar.hpp"

#include <cmath>

namespace geom
{

double normalize_angle(double a)
{
  a = std::fmod(a, kTwoPi);
  if (a < 0.0) {
    a += kTwoPi;
  }
  return a;
}

double normalize_arc_length(double start, double end)
{
  const double raw = end - start;
  double d = std::fmod(raw, kTwoPi);
  if (d < 0.0) {
    d += kTwoPi;
  }
  if (std::abs(d) < 1e-12 && std::abs(raw) > 0.0) {
    return kTwoPi;
  }
  return d;
}

bool angle_is_between(double angle, double start, double arc_len)
{
  if (arc_len >= kTwoPi) {
    return true;
  }
  if (arc_len <= 0.0) {
    return false;
  }
  const double end = std::fmod(start + arc_len, kTwoPi);
  if (start <= end) {
    return angle >= start && angle <= end;
  }
  // wraps through zero
  return angle >= start || angle <= end;
}

int64_t next_power_of_2(int64_t n)
{
  if (n <= 0) {
    return 1;
  }
  if (n == 1) {
    return 2;
  }
  if (n >= kMaxPowerOf2) {
    return kMaxPowerOf2;
  }
  int64_t power = 1;
  while (power < n) {
    power <<= 1;
  }
  return power;
}

}  // namespace geom
