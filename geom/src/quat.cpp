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

#include "geom/quat.hpp"

#include <cmath>

#include "geom/rotation.hpp"
#include "geom/scalar.hpp"
#include "geom/vec3.hpp"

namespace geom
{

namespace
{

// Normalize in place unless the length is too small to divide by.
void renormalize(Quat & q)
{
  const double len = quat_length(q);
  if (len > kEpsilon) {
    for (int i = 0; i < 4; ++i) {
      q[i] /= len;
    }
  }
}

}  // anonymous namespace

Quat quat_from_axis_angle(const Vec3 & axis, double angle)
{
  if (vec3_length(axis) < kEpsilon) {
    return quat_identity();
  }
  Vec3 n;
  vec3_normalize(axis, n);
  const double half = angle * 0.5;
  const double s = std::sin(half);
  return {n[0] * s, n[1] * s, n[2] * s, std::cos(half)};
}

Quat quat_from_euler(const Vec3 & euler)
{
  // qx(pitch) * qy(yaw) * qz(roll)
  const double cx = std::cos(euler[0] * 0.5), sx = std::sin(euler[0] * 0.5);
  const double cy = std::cos(euler[1] * 0.5), sy = std::sin(euler[1] * 0.5);
  const double cz = std::cos(euler[2] * 0.5), sz = std::sin(euler[2] * 0.5);

  return {
    sx * cy * cz + cx * sy * sz,
    cx * sy * cz - sx * cy * sz,
    cx * cy * sz + sx * sy * cz,
    cx * cy * cz - sx * sy * sz};
}

Quat quat_from_euler_deg(const Vec3 & euler_deg)
{
  return quat_from_euler({deg_to_rad(euler_deg[0]), deg_to_rad(euler_deg[1]),
                          deg_to_rad(euler_deg[2])});
}

Quat quat_from_basis(const Basis & b) { return quat_from_rotation_matrix(b); }

void quat_multiply(const Quat & a, const Quat & b, Quat & out)
{
  const double x = a[3] * b[0] + a[0] * b[3] + a[1] * b[2] - a[2] * b[1];
  const double y = a[3] * b[1] - a[0] * b[2] + a[1] * b[3] + a[2] * b[0];
  const double z = a[3] * b[2] + a[0] * b[1] - a[1] * b[0] + a[2] * b[3];
  const double w = a[3] * b[3] - a[0] * b[0] - a[1] * b[1] - a[2] * b[2];
  out = {x, y, z, w};
}

double quat_dot(const Quat & a, const Quat & b)
{
  return a[0] * b[0] + a[1] * b[1] + a[2] * b[2] + a[3] * b[3];
}

double quat_length(const Quat & q) { return std::sqrt(quat_length_sq(q)); }

double quat_length_sq(const Quat & q) { return quat_dot(q, q); }

void quat_normalize(const Quat & q, Quat & out)
{
  const double len = quat_length(q);
  if (len == 0.0) {
    out = quat_identity();
    return;
  }
  for (int i = 0; i < 4; ++i) {
    out[i] = q[i] / len;
  }
}

void quat_conjugate(const Quat & q, Quat & out)
{
  out[0] = -q[0];
  out[1] = -q[1];
  out[2] = -q[2];
  out[3] = q[3];
}

void quat_inverse(const Quat & q, Quat & out)
{
  const double len_sq = quat_length_sq(q);
  if (len_sq == 0.0) {
    out = quat_identity();
    return;
  }
  quat_conjugate(q, out);
  for (int i = 0; i < 4; ++i) {
    out[i] /= len_sq;
  }
}

void quat_rotate(const Quat & q, const Vec3 & v, Vec3 & out)
{
  // v + w * t + cross(q.xyz, t), t = 2 * cross(q.xyz, v)
  const double tx = 2.0 * (q[1] * v[2] - q[2] * v[1]);
  const double ty = 2.0 * (q[2] * v[0] - q[0] * v[2]);
  const double tz = 2.0 * (q[0] * v[1] - q[1] * v[0]);
  const double x = v[0] + q[3] * tx + (q[1] * tz - q[2] * ty);
  const double y = v[1] + q[3] * ty + (q[2] * tx - q[0] * tz);
  const double z = v[2] + q[3] * tz + (q[0] * ty - q[1] * tx);
  out = {x, y, z};
}

Vec3 quat_to_euler(const Quat & q) { return euler_from_rotation_matrix(rotation_matrix_from_quat(q)); }

Vec3 quat_to_euler_deg(const Quat & q)
{
  const Vec3 e = quat_to_euler(q);
  return {rad_to_deg(e[0]), rad_to_deg(e[1]), rad_to_deg(e[2])};
}

AngleAxis quat_to_angle_axis(const Quat & q)
{
  AngleAxis result;
  if (std::abs(q[3]) > kNearIdentityW) {
    return result;
  }
  // -q is the same rotation; keep w >= 0 so the axis matches the angle.
  const double sign = q[3] < 0.0 ? -1.0 : 1.0;
  result.angle = 2.0 * std::acos(sign * q[3]);
  const double s = std::sin(result.angle * 0.5);
  result.axis = {sign * q[0] / s, sign * q[1] / s, sign * q[2] / s};
  return result;
}

Basis quat_to_basis(const Quat & q) { return rotation_matrix_from_quat(q); }

void quat_to_mat4(const Quat & q, Mat4 & out)
{
  const Basis m = rotation_matrix_from_quat(q);
  out = {
    m[0], m[3], m[6], 0.0,
    m[1], m[4], m[7], 0.0,
    m[2], m[5], m[8], 0.0,
    0.0, 0.0, 0.0, 1.0};
}

void quat_lerp(const Quat & a, const Quat & b, double t, Quat & out)
{
  for (int i = 0; i < 4; ++i) {
    out[i] = a[i] + t * (b[i] - a[i]);
  }
  renormalize(out);
}

void quat_slerp(const Quat & a, const Quat & b, double t, Quat & out)
{
  double d = quat_dot(a, b);
  Quat b2 = b;
  if (d < 0.0) {
    d = -d;
    for (int i = 0; i < 4; ++i) {
      b2[i] = -b[i];
    }
  }
  if (d > kSlerpDotThreshold) {
    quat_lerp(a, b2, t, out);
    return;
  }
  const double theta = std::acos(d);
  const double sin_theta = std::sin(theta);
  const double ra = std::sin((1.0 - t) * theta) / sin_theta;
  const double rb = std::sin(t * theta) / sin_theta;
  const Quat a2 = a;
  for (int i = 0; i < 4; ++i) {
    out[i] = ra * a2[i] + rb * b2[i];
  }
}

}  // namespace geom
