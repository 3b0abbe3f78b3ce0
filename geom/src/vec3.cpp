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

#include "geom/vec3.hpp"

#include <cmath>

namespace geom
{

void vec3_add(const Vec3 & a, const Vec3 & b, Vec3 & out)
{
  for (int i = 0; i < 3; ++i) {
    out[i] = a[i] + b[i];
  }
}

void vec3_sub(const Vec3 & a, const Vec3 & b, Vec3 & out)
{
  for (int i = 0; i < 3; ++i) {
    out[i] = a[i] - b[i];
  }
}

void vec3_scale(const Vec3 & v, double s, Vec3 & out)
{
  for (int i = 0; i < 3; ++i) {
    out[i] = v[i] * s;
  }
}

void vec3_div(const Vec3 & v, double s, Vec3 & out)
{
  for (int i = 0; i < 3; ++i) {
    out[i] = v[i] / s;
  }
}

void vec3_negate(const Vec3 & v, Vec3 & out)
{
  for (int i = 0; i < 3; ++i) {
    out[i] = -v[i];
  }
}

void vec3_cross(const Vec3 & a, const Vec3 & b, Vec3 & out)
{
  const double x = a[1] * b[2] - a[2] * b[1];
  const double y = a[2] * b[0] - a[0] * b[2];
  const double z = a[0] * b[1] - a[1] * b[0];
  out = {x, y, z};
}

double vec3_dot(const Vec3 & a, const Vec3 & b) { return a[0] * b[0] + a[1] * b[1] + a[2] * b[2]; }

double vec3_length(const Vec3 & v) { return std::sqrt(vec3_length_sq(v)); }

double vec3_length_sq(const Vec3 & v) { return vec3_dot(v, v); }

double vec3_distance(const Vec3 & a, const Vec3 & b) { return std::sqrt(vec3_distance_sq(a, b)); }

double vec3_distance_sq(const Vec3 & a, const Vec3 & b)
{
  Vec3 d;
  vec3_sub(a, b, d);
  return vec3_length_sq(d);
}

void vec3_normalize(const Vec3 & v, Vec3 & out)
{
  const double len = vec3_length(v);
  if (len == 0.0) {
    out = {0.0, 0.0, 0.0};
    return;
  }
  vec3_div(v, len, out);
}

void vec3_lerp(const Vec3 & a, const Vec3 & b, double t, Vec3 & out)
{
  for (int i = 0; i < 3; ++i) {
    out[i] = a[i] + (b[i] - a[i]) * t;
  }
}

void vec3_reflect(const Vec3 & incident, const Vec3 & normal, Vec3 & out)
{
  const double k = 2.0 * vec3_dot(incident, normal);
  for (int i = 0; i < 3; ++i) {
    out[i] = incident[i] - k * normal[i];
  }
}

}  // namespace geom
