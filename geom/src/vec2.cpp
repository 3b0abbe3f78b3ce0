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

#include "geom/vec2.hpp"

#include <algorithm>
#include <cmath>

namespace geom
{

void vec2_add(const Vec2 & a, const Vec2 & b, Vec2 & out)
{
  for (int i = 0; i < 2; ++i) {
    out[i] = a[i] + b[i];
  }
}

void vec2_sub(const Vec2 & a, const Vec2 & b, Vec2 & out)
{
  for (int i = 0; i < 2; ++i) {
    out[i] = a[i] - b[i];
  }
}

void vec2_scale(const Vec2 & v, double s, Vec2 & out)
{
  for (int i = 0; i < 2; ++i) {
    out[i] = v[i] * s;
  }
}

void vec2_div(const Vec2 & v, double s, Vec2 & out)
{
  for (int i = 0; i < 2; ++i) {
    out[i] = v[i] / s;
  }
}

void vec2_negate(const Vec2 & v, Vec2 & out)
{
  for (int i = 0; i < 2; ++i) {
    out[i] = -v[i];
  }
}

double vec2_dot(const Vec2 & a, const Vec2 & b) { return a[0] * b[0] + a[1] * b[1]; }

double vec2_cross(const Vec2 & a, const Vec2 & b) { return a[0] * b[1] - a[1] * b[0]; }

double vec2_length(const Vec2 & v) { return std::sqrt(vec2_length_sq(v)); }

double vec2_length_sq(const Vec2 & v) { return v[0] * v[0] + v[1] * v[1]; }

double vec2_distance(const Vec2 & a, const Vec2 & b) { return std::sqrt(vec2_distance_sq(a, b)); }

double vec2_distance_sq(const Vec2 & a, const Vec2 & b)
{
  const double dx = a[0] - b[0];
  const double dy = a[1] - b[1];
  return dx * dx + dy * dy;
}

void vec2_normalize(const Vec2 & v, Vec2 & out)
{
  const double len = vec2_length(v);
  if (len == 0.0) {
    out = {0.0, 0.0};
    return;
  }
  vec2_div(v, len, out);
}

void vec2_lerp(const Vec2 & a, const Vec2 & b, double t, Vec2 & out)
{
  for (int i = 0; i < 2; ++i) {
    out[i] = a[i] + (b[i] - a[i]) * t;
  }
}

void vec2_reflect(const Vec2 & incident, const Vec2 & normal, Vec2 & out)
{
  const double k = 2.0 * vec2_dot(incident, normal);
  for (int i = 0; i < 2; ++i) {
    out[i] = incident[i] - k * normal[i];
  }
}

void vec2_rotate(const Vec2 & v, double angle, Vec2 & out)
{
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  const double x = v[0];
  const double y = v[1];
  out[0] = x * c - y * s;
  out[1] = x * s + y * c;
}

double vec2_angle(const Vec2 & a, const Vec2 & b)
{
  const double len_a = vec2_length(a);
  const double len_b = vec2_length(b);
  if (len_a == 0.0 || len_b == 0.0) {
    return 0.0;
  }
  const double cos_angle = vec2_dot(a, b) / (len_a * len_b);
  return std::acos(std::max(-1.0, std::min(1.0, cos_angle)));
}

}  // namespace geom
