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

#include "geom/basis.hpp"

#include <cmath>

#include "geom/quat.hpp"
#include "geom/rotation.hpp"
#include "geom/scalar.hpp"
#include "geom/vec3.hpp"

namespace geom
{

namespace
{

Vec3 to_radians(const Vec3 & deg)
{
  return {deg_to_rad(deg[0]), deg_to_rad(deg[1]), deg_to_rad(deg[2])};
}

}  // anonymous namespace

Basis basis_from_axes(const Vec3 & x_axis, const Vec3 & y_axis, const Vec3 & z_axis)
{
  return {
    x_axis[0], x_axis[1], x_axis[2],
    y_axis[0], y_axis[1], y_axis[2],
    z_axis[0], z_axis[1], z_axis[2]};
}

Basis basis_from_euler(const Vec3 & euler) { return rotation_matrix_from_euler(euler); }

Basis basis_from_euler_deg(const Vec3 & euler_deg)
{
  return rotation_matrix_from_euler(to_radians(euler_deg));
}

Basis basis_from_axis_angle(const Vec3 & axis, double angle)
{
  return rotation_matrix_from_axis_angle(axis, angle);
}

Basis basis_from_quat(const Quat & q) { return rotation_matrix_from_quat(q); }

void basis_multiply(const Basis & a, const Basis & b, Basis & out)
{
  Basis r;
  for (int row = 0; row < 3; ++row) {
    for (int col = 0; col < 3; ++col) {
      r[row * 3 + col] =
        a[row * 3] * b[col] + a[row * 3 + 1] * b[3 + col] + a[row * 3 + 2] * b[6 + col];
    }
  }
  out = r;
}

void basis_transpose(const Basis & b, Basis & out)
{
  if (&out == &b) {
    const double b01 = b[1], b02 = b[2], b12 = b[5];
    out[1] = b[3];
    out[2] = b[6];
    out[3] = b01;
    out[5] = b[7];
    out[6] = b02;
    out[7] = b12;
    return;
  }
  out = {b[0], b[3], b[6], b[1], b[4], b[7], b[2], b[5], b[8]};
}

double basis_determinant(const Basis & b)
{
  return b[0] * (b[4] * b[8] - b[5] * b[7]) - b[1] * (b[3] * b[8] - b[5] * b[6]) +
         b[2] * (b[3] * b[7] - b[4] * b[6]);
}

void basis_inverse(const Basis & b, Basis & out)
{
  const double det = basis_determinant(b);
  if (std::abs(det) < kEpsilon) {
    out = basis_identity();
    return;
  }
  const double inv = 1.0 / det;
  out = {
    (b[4] * b[8] - b[5] * b[7]) * inv,
    (b[2] * b[7] - b[1] * b[8]) * inv,
    (b[1] * b[5] - b[2] * b[4]) * inv,
    (b[5] * b[6] - b[3] * b[8]) * inv,
    (b[0] * b[8] - b[2] * b[6]) * inv,
    (b[2] * b[3] - b[0] * b[5]) * inv,
    (b[3] * b[7] - b[4] * b[6]) * inv,
    (b[1] * b[6] - b[0] * b[7]) * inv,
    (b[0] * b[4] - b[1] * b[3]) * inv};
}

void basis_rotate_vec3(const Basis & b, const Vec3 & v, Vec3 & out)
{
  const double x = b[0] * v[0] + b[1] * v[1] + b[2] * v[2];
  const double y = b[3] * v[0] + b[4] * v[1] + b[5] * v[2];
  const double z = b[6] * v[0] + b[7] * v[1] + b[8] * v[2];
  out = {x, y, z};
}

Vec3 basis_get_axis(const Basis & b, Axis axis)
{
  const int row = static_cast<int>(axis) * 3;
  return {b[row], b[row + 1], b[row + 2]};
}

void basis_set_axis(const Basis & b, Axis axis, const Vec3 & value, Basis & out)
{
  out = b;
  const int row = static_cast<int>(axis) * 3;
  out[row] = value[0];
  out[row + 1] = value[1];
  out[row + 2] = value[2];
}

void basis_set_x_axis(const Basis & b, const Vec3 & value, Basis & out)
{
  basis_set_axis(b, Axis::X, value, out);
}

void basis_set_y_axis(const Basis & b, const Vec3 & value, Basis & out)
{
  basis_set_axis(b, Axis::Y, value, out);
}

void basis_set_z_axis(const Basis & b, const Vec3 & value, Basis & out)
{
  basis_set_axis(b, Axis::Z, value, out);
}

Vec3 basis_to_euler(const Basis & b) { return euler_from_rotation_matrix(b); }

Vec3 basis_to_euler_deg(const Basis & b)
{
  const Vec3 e = euler_from_rotation_matrix(b);
  return {rad_to_deg(e[0]), rad_to_deg(e[1]), rad_to_deg(e[2])};
}

Quat basis_to_quat(const Basis & b) { return quat_from_rotation_matrix(b); }

void basis_orthonormalize(const Basis & b, Basis & out)
{
  Vec3 x = basis_get_x_axis(b);
  vec3_normalize(x, x);

  Vec3 y = basis_get_y_axis(b);
  Vec3 proj;
  vec3_scale(x, vec3_dot(y, x), proj);
  vec3_sub(y, proj, y);
  vec3_normalize(y, y);

  Vec3 z;
  vec3_cross(x, y, z);
  out = basis_from_axes(x, y, z);
}

void basis_scale(const Basis & b, const Vec3 & scale, Basis & out)
{
  for (int row = 0; row < 3; ++row) {
    for (int col = 0; col < 3; ++col) {
      out[row * 3 + col] = b[row * 3 + col] * scale[row];
    }
  }
}

void basis_lerp(const Basis & a, const Basis & b, double t, Basis & out)
{
  Quat q;
  quat_lerp(basis_to_quat(a), basis_to_quat(b), t, q);
  out = basis_from_quat(q);
}

void basis_slerp(const Basis & a, const Basis & b, double t, Basis & out)
{
  Quat q;
  quat_slerp(basis_to_quat(a), basis_to_quat(b), t, q);
  out = basis_from_quat(q);
}

void basis_rotate(const Basis & b, const Vec3 & axis, double angle, Basis & out)
{
  basis_multiply(basis_from_axis_angle(axis, angle), b, out);
}

void basis_rotate_euler(const Basis & b, const Vec3 & euler, Basis & out)
{
  basis_multiply(basis_from_euler(euler), b, out);
}

void basis_rotate_euler_deg(const Basis & b, const Vec3 & euler_deg, Basis & out)
{
  basis_multiply(basis_from_euler_deg(euler_deg), b, out);
}

void basis_rotate_quat(const Basis & b, const Quat & q, Basis & out)
{
  basis_multiply(basis_from_quat(q), b, out);
}

void basis_rotate_local(const Basis & b, const Vec3 & axis, double angle, Basis & out)
{
  basis_multiply(b, basis_from_axis_angle(axis, angle), out);
}

void basis_rotate_local_euler(const Basis & b, const Vec3 & euler, Basis & out)
{
  basis_multiply(b, basis_from_euler(euler), out);
}

void basis_rotate_local_euler_deg(const Basis & b, const Vec3 & euler_deg, Basis & out)
{
  basis_multiply(b, basis_from_euler_deg(euler_deg), out);
}

void basis_rotate_local_quat(const Basis & b, const Quat & q, Basis & out)
{
  basis_multiply(b, basis_from_quat(q), out);
}

}  // namespace geom
