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

inline Vec2 vec2_zero() { return {0.0, 0.0}; }
inline Vec2 vec2_unit_x() { return {1.0, 0.0}; }
inline Vec2 vec2_unit_y() { return {0.0, 1.0}; }

// Output parameters may alias any input.
void vec2_add(const Vec2 & a, const Vec2 & b, Vec2 & out);
void vec2_sub(const Vec2 & a, const Vec2 & b, Vec2 & out);
void vec2_scale(const Vec2 & v, double s, Vec2 & out);
void vec2_div(const Vec2 & v, double s, Vec2 & out);
void vec2_negate(const Vec2 & v, Vec2 & out);

double vec2_dot(const Vec2 & a, const Vec2 & b);

// z component of the 3D cross product of (a, 0) and (b, 0)
double vec2_cross(const Vec2 & a, const Vec2 & b);

double vec2_length(const Vec2 & v);
double vec2_length_sq(const Vec2 & v);
double vec2_distance(const Vec2 & a, const Vec2 & b);
double vec2_distance_sq(const Vec2 & a, const Vec2 & b);

// Zero-length input yields the zero vector.
void vec2_normalize(const Vec2 & v, Vec2 & out);

// Unclamped: t outside [0, 1] extrapolates.
void vec2_lerp(const Vec2 & a, const Vec2 & b, double t, Vec2 & out);

// incident - 2 * dot(incident, normal) * normal
void vec2_reflect(const Vec2 & incident, const Vec2 & normal, Vec2 & out);

// Counter-clockwise rotation by angle radians.
void vec2_rotate(const Vec2 & v, double angle, Vec2 & out);

// Unsigned angle in [0, pi]; 0 when either vector has zero length.
double vec2_angle(const Vec2 & a, const Vec2 & b);

}  // namespace geom
