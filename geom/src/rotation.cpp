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

#include "geom/rotation.hpp"

#include <cmath>

#include "geom/scalar.hpp"
#include "geom/vec3.hpp"

namespace geom
{

Basis rotation_matrix_from_quat(const Quat & q)
{
  const double x = q[0], y = q[1], z = q[2], w = q[3];
  const double x2 = x + x, y2 = y + y, z2 = z + z;
  const double xx = x * x2, xy = x * y2, xz = x * z2;
  const double yy = y * y2, yz = y * z2, zz = z * z2;
  const double wx = w * x2, wy = w * y2, wz = w * z2;

  return {
    1.0 - (yy + zz), xy - wz, xz + wy,
    xy + wz, 1.0 - (xx + zz), yz - wx,
    xz - wy, yz + wx, 1.0 - (xx + yy)};
}

Quat quat_from_rotation_matrix(const Basis & m)
{
  const double trace = m[0] + m[4] + m[8];

  if (trace > 0.0) {
    const double s = std::sqrt(trace + 1.0) * 2.0;
    return {(m[7] - m[5]) / s, (m[2] - m[6]) / s, (m[3] - m[1]) / s, 0.25 * s};
  }
  if (m[0] > m[4] && m[0] > m[8]) {
    const double s = std::sqrt(1.0 + m[0] - m[4] - m[8]) * 2.0;
    return {0.25 * s, (m[1] + m[3]) / s, (m[2] + m[6]) / s, (m[7] - m[5]) / s};
  }
  if (m[4] > m[8]) {
    const double s = std::sqrt(1.0 + m[4] - m[0] - m[8]) * 2.0;
    return {(m[1] + m[3]) / s, 0.25 * s, (m[5] + m[7]) / s, (m[2] - m[6]) / s};
  }
  const double s = std::sqrt(1.0 + m[8] - m[0] - m[4]) * 2.0;
  return {(m[2] + m[6]) / s, (m[5] + m[7]) / s, 0.25 * s, (m[3] - m[1]) / s};
}

Basis rotation_matrix_from_euler(const Vec3 & euler)
{
  const double cx = std::cos(euler[0]), sx = std::sin(euler[0]);  // pitch
  const double cy = std::cos(euler[1]), sy = std::sin(euler[1]);  // yaw
  const double cz = std::cos(euler[2]), sz = std::sin(euler[2]);  // roll

  return {
    cy * cz, -cy * sz, sy,
    sx * sy * cz + cx * sz, -sx * sy * sz + cx * cz, -sx * cy,
    -cx * sy * cz + sx * sz, cx * sy * sz + sx * cz, cx * cy};
}

Vec3 euler_from_rotation_matrix(const Basis & m)
{
  const double m00 = m[0], m01 = m[1], m02 = m[2];
  const double m10 = m[3], m11 = m[4], m12 = m[5];
  const double m22 = m[8];

  if (m02 >= 1.0) {
    // Row 1 degenerates to (sin(pitch + roll), cos(pitch + roll), 0).
    return {std::atan2(m10, m11), kPi / 2.0, 0.0};
  }
  if (m02 <= -1.0) {
    // Row 1 degenerates to (sin(roll - pitch), cos(roll - pitch), 0).
    return {std::atan2(-m10, m11), -kPi / 2.0, 0.0};
  }

  const double pitch = std::atan2(-m12, m22);
  const double yaw = std::asin(m02);
  const double roll = std::atan2(-m01, m00);
  return {pitch, yaw, roll};
}

Basis rotation_matrix_from_axis_angle(const Vec3 & axis, double angle)
{
  if (vec3_length(axis) < kEpsilon) {
    return {1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
  }
  Vec3 n;
  vec3_normalize(axis, n);
  const double x = n[0], y = n[1], z = n[2];
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  const double t = 1.0 - c;

  return {
    x * x * t + c, x * y * t - z * s, x * z * t + y * s,
    x * y * t + z * s, y * y * t + c, y * z * t - x * s,
    x * z * t - y * s, y * z * t + x * s, z * z * t + c};
}

}  // namespace geom
