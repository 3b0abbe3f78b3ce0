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
#include "geom/types.hpp"

namespace geom
{

inline Vec3 vec3_zero() { return {0.0, 0.0, 0.0}; }
inline Vec3 vec3_unit_x() { return {1.0, 0.0, 0.0}; }
inline Vec3 vec3_unit_y() { return {0.0, 1.0, 0.0}; }
inline Vec3 vec3_unit_z() { return {0.0, 0.0, 1.0}; }

// Output parameters may alias any input.
void vec3_add(const Vec3 & a, const Vec3 & b, Vec3 & out);
void vec3_sub(const Vec3 & a, const Vec3 & b, Vec3 & out);
void vec3_scale(const Vec3 & v, double s, Vec3 & out);
void vec3_div(const Vec3 & v, double s, Vec3 & out);
void vec3_negate(const Vec3 & v, Vec3 & out);
void vec3_cross(const Vec3 & a, const Vec3 & b, Vec3 & out);

double vec3_dot(const Vec3 & a, const Vec3 & b);
double vec3_length(const Vec3 & v);
double vec3_length_sq(const Vec3 & v);
double vec3_distance(const Vec3 & a, const Vec3 & b);
double vec3_distance_sq(const Vec3 & a, const Vec3 & b);

// Zero-length input yields the zero vector.
void vec3_normalize(const Vec3 & v, Vec3 & out);

// Unclamped: t outside [0, 1] extrapolates.
void vec3_lerp(const Vec3 & a, const Vec3 & b, double t, Vec3 & out);

// incident - 2 * dot(incident, normal) * normal
void vec3_reflect(const Vec3 & incident, const Vec3 & normal, Vec3 & out);

}  // namespace geom
