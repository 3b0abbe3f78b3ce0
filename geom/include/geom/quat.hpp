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

// Above this |dot| slerp falls back to normalized lerp.
constexpr double kSlerpDotThreshold = 0.9995;

// Above this |w| a quaternion is treated as the identity by
// quat_to_angle_axis.
constexpr double kNearIdentityW = 0.9999;

struct AngleAxis
{
  double angle = 0.0;  // radians
  Vec3 axis = {1.0, 0.0, 0.0};
};

inline Quat quat_identity() { return {0.0, 0.0, 0.0, 1.0}; }

// axis need not be normalized. A near-zero axis yields the identity.
Quat quat_from_axis_angle(const Vec3 & axis, double angle);

// euler = (pitch about X, yaw about Y, roll about Z) in radians; same
// rotation as basis_from_euler.
Quat quat_from_euler(const Vec3 & euler);
Quat quat_from_euler_deg(const Vec3 & euler_deg);

Quat quat_from_basis(const Basis & b);

// Hamilton product a * b: rotates by b first, then by a.
// out may alias a or b.
void quat_multiply(const Quat & a, const Quat & b, Quat & out);

double quat_dot(const Quat & a, const Quat & b);
double quat_length(const Quat & q);
double quat_length_sq(const Quat & q);

// Zero-length input yields the identity.
void quat_normalize(const Quat & q, Quat & out);
void quat_conjugate(const Quat & q, Quat & out);

// conjugate / |q|^2. Zero-length input yields the identity.
void quat_inverse(const Quat & q, Quat & out);

// q * v * q^-1 for a unit quaternion. out may alias v.
void quat_rotate(const Quat & q, const Vec3 & v, Vec3 & out);

Vec3 quat_to_euler(const Quat & q);
Vec3 quat_to_euler_deg(const Quat & q);
AngleAxis quat_to_angle_axis(const Quat & q);
Basis quat_to_basis(const Quat & q);

// Rotation-only 4x4 (column-major, zero translation).
void quat_to_mat4(const Quat & q, Mat4 & out);

// Component-wise lerp followed by renormalization. Does not correct for
// the double cover; see quat_slerp.
void quat_lerp(const Quat & a, const Quat & b, double t, Quat & out);

// Shortest-arc spherical interpolation.
void quat_slerp(const Quat & a, const Quat & b, double t, Quat & out);

}  // namespace geom
