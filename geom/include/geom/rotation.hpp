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

// Conversions shared by the quaternion and basis APIs. Every rotation
// representation funnels through these, so Euler, quaternion and matrix forms
// always agree.
namespace geom
{

// Matrix of the sandwich product q * v * q^-1 (rows of M, M * v).
// q is expected to be unit length.
Basis rotation_matrix_from_quat(const Quat & q);

// Shepperd's method: branch on the trace and the largest diagonal element so
// the divisor never approaches zero. m must be orthonormal for a meaningful
// result.
Quat quat_from_rotation_matrix(const Basis & m);

// M = Rx(pitch) * Ry(yaw) * Rz(roll), euler = (pitch, yaw, roll) in radians.
Basis rotation_matrix_from_euler(const Vec3 & euler);

// Inverse of rotation_matrix_from_euler. When |m02| >= 1 (yaw at +-90 deg)
// roll is pinned to 0 and pitch absorbs the remaining rotation.
Vec3 euler_from_rotation_matrix(const Basis & m);

// Rodrigues' formula. A near-zero axis yields the identity.
Basis rotation_matrix_from_axis_angle(const Vec3 & axis, double angle);

}  // namespace geom
