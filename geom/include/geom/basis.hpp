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

enum class Axis : int
{
  X = 0,
  Y = 1,
  Z = 2,
};

inline Basis basis_identity() { return {1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0}; }

// No orthonormality check; the caller owns that invariant.
Basis basis_from_axes(const Vec3 & x_axis, const Vec3 & y_axis, const Vec3 & z_axis);

// euler = (pitch about X, yaw about Y, roll about Z) in radians.
// Builds Rx(pitch) * Ry(yaw) * Rz(roll).
Basis basis_from_euler(const Vec3 & euler);
Basis basis_from_euler_deg(const Vec3 & euler_deg);

// Rodrigues' formula; axis need not be normalized.
Basis basis_from_axis_angle(const Vec3 & axis, double angle);

Basis basis_from_quat(const Quat & q);

// out = a * b, i.e. b is applied first. out may alias a or b.
void basis_multiply(const Basis & a, const Basis & b, Basis & out);

void basis_transpose(const Basis & b, Basis & out);
double basis_determinant(const Basis & b);

// Falls back to the identity when |det| < kEpsilon.
void basis_inverse(const Basis & b, Basis & out);

// M * v. out may alias v.
void basis_rotate_vec3(const Basis & b, const Vec3 & v, Vec3 & out);

Vec3 basis_get_axis(const Basis & b, Axis axis);
inline Vec3 basis_get_x_axis(const Basis & b) { return basis_get_axis(b, Axis::X); }
inline Vec3 basis_get_y_axis(const Basis & b) { return basis_get_axis(b, Axis::Y); }
inline Vec3 basis_get_z_axis(const Basis & b) { return basis_get_axis(b, Axis::Z); }

// Copy b into out with one row replaced.
void basis_set_axis(const Basis & b, Axis axis, const Vec3 & value, Basis & out);
void basis_set_x_axis(const Basis & b, const Vec3 & value, Basis & out);
void basis_set_y_axis(const Basis & b, const Vec3 & value, Basis & out);
void basis_set_z_axis(const Basis & b, const Vec3 & value, Basis & out);

// (pitch, yaw, roll); inverse of basis_from_euler away from yaw = +-90 deg.
Vec3 basis_to_euler(const Basis & b);
Vec3 basis_to_euler_deg(const Basis & b);

Quat basis_to_quat(const Basis & b);

// Gram-Schmidt on the X then Y rows; Z is rebuilt as cross(X, Y) so the
// result is always right-handed.
void basis_orthonormalize(const Basis & b, Basis & out);

// Row i multiplied by scale[i].
void basis_scale(const Basis & b, const Vec3 & scale, Basis & out);

// Both interpolate the equivalent quaternions and convert back.
void basis_lerp(const Basis & a, const Basis & b, double t, Basis & out);
void basis_slerp(const Basis & a, const Basis & b, double t, Basis & out);

// Global rotation: out = R * b, axis given in the parent frame.
void basis_rotate(const Basis & b, const Vec3 & axis, double angle, Basis & out);
void basis_rotate_euler(const Basis & b, const Vec3 & euler, Basis & out);
void basis_rotate_euler_deg(const Basis & b, const Vec3 & euler_deg, Basis & out);
void basis_rotate_quat(const Basis & b, const Quat & q, Basis & out);

// Local rotation: out = b * R, axis given in b's own frame.
void basis_rotate_local(const Basis & b, const Vec3 & axis, double angle, Basis & out);
void basis_rotate_local_euler(const Basis & b, const Vec3 & euler, Basis & out);
void basis_rotate_local_euler_deg(const Basis & b, const Vec3 & euler_deg, Basis & out);
void basis_rotate_local_quat(const Basis & b, const Quat & q, Basis & out);

}  // namespace geom
