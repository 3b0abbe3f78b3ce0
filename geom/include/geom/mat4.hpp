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
#include <optional>

#include "geom/types.hpp"

// Column-major 4x4 matrices acting on column vectors: element (row, col)
// lives at m[col * 4 + row] and the translation at m[12..14].
namespace geom
{

inline Mat4 mat4_identity()
{
  return {1.0, 0.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 1.0};
}

// Composition in application order: the result applies a first, then b
// (out = B * A). out may alias a or b.
void mat4_multiply(const Mat4 & a, const Mat4 & b, Mat4 & out);

// View matrix looking from eye towards center. Returns the identity when eye
// and center coincide.
void mat4_look_at(const Vec3 & eye, const Vec3 & center, const Vec3 & up, Mat4 & out);

// OpenGL clip space: depth mapped to [-1, 1], out[11] = -1.
void mat4_perspective(double fovy, double aspect, double z_near, double z_far, Mat4 & out);
void mat4_ortho(
  double left, double right, double bottom, double top, double z_near, double z_far, Mat4 & out);

Mat4 mat4_from_translation(const Vec3 & v);
Mat4 mat4_from_x_rotation(double angle);
Mat4 mat4_from_y_rotation(double angle);
Mat4 mat4_from_z_rotation(double angle);

// A near-zero axis yields the identity.
Mat4 mat4_from_rotation(double angle, const Vec3 & axis);
Mat4 mat4_from_scale(const Vec3 & v);

// translation * rotation * scale
Mat4 mat4_compose(const Vec3 & translation, const Quat & rotation, const Vec3 & scale);

// In-place variants post-multiply: out = m * T / R / S, so the new transform
// acts in m's local frame. out may alias m.
void mat4_translate(const Mat4 & m, const Vec3 & v, Mat4 & out);
void mat4_rotate_x(const Mat4 & m, double angle, Mat4 & out);
void mat4_rotate_y(const Mat4 & m, double angle, Mat4 & out);
void mat4_rotate_z(const Mat4 & m, double angle, Mat4 & out);
void mat4_rotate(const Mat4 & m, double angle, const Vec3 & axis, Mat4 & out);
void mat4_scale(const Mat4 & m, const Vec3 & v, Mat4 & out);

void mat4_transpose(const Mat4 & m, Mat4 & out);

double mat4_determinant(const Mat4 & m);

// std::nullopt when |det| < kEpsilon.
std::optional<Mat4> mat4_invert(const Mat4 & m);

// Transform a point (w = 1) with perspective divide; the divide is skipped
// when the resulting w is exactly 0.
void mat4_transform_vec3(const Mat4 & m, const Vec3 & v, Vec3 & out);

// Replace the upper-left 3x3 block with b; translation and the bottom row
// are kept from m.
void mat4_set_basis(const Mat4 & m, const Basis & b, Mat4 & out);

}  // namespace geom
