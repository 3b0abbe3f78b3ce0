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

#include "geom/mat3.hpp"

#include <cmath>
#include <utility>

namespace geom
{

namespace
{

// Inverse of the 3x3 column-major block given element by element.
std::optional<Mat3> invert3(
  double a00, double a01, double a02, double a10, double a11, double a12, double a20, double a21,
  double a22)
{
  const double b01 = a22 * a11 - a12 * a21;
  const double b11 = -a22 * a10 + a12 * a20;
  const double b21 = a21 * a10 - a11 * a20;

  const double det = a00 * b01 + a01 * b11 + a02 * b21;
  if (std::abs(det) < kEpsilon) {
    return std::nullopt;
  }
  const double inv = 1.0 / det;

  return Mat3{
    b01 * inv,
    (-a22 * a01 + a02 * a21) * inv,
    (a12 * a01 - a02 * a11) * inv,
    b11 * inv,
    (a22 * a00 - a02 * a20) * inv,
    (-a12 * a00 + a02 * a10) * inv,
    b21 * inv,
    (-a21 * a00 + a01 * a20) * inv,
    (a11 * a00 - a01 * a10) * inv};
}

}  // anonymous namespace

void mat3_multiply(const Mat3 & a, const Mat3 & b, Mat3 & out)
{
  Mat3 r;
  for (int col = 0; col < 3; ++col) {
    const double b0 = b[col * 3 + 0];
    const double b1 = b[col * 3 + 1];
    const double b2 = b[col * 3 + 2];
    for (int row = 0; row < 3; ++row) {
      r[col * 3 + row] = b0 * a[row] + b1 * a[3 + row] + b2 * a[6 + row];
    }
  }
  out = r;
}

void mat3_transpose(const Mat3 & m, Mat3 & out)
{
  if (&out == &m) {
    std::swap(out[1], out[3]);
    std::swap(out[2], out[6]);
    std::swap(out[5], out[7]);
    return;
  }
  out = {m[0], m[3], m[6], m[1], m[4], m[7], m[2], m[5], m[8]};
}

double mat3_determinant(const Mat3 & m)
{
  return m[0] * (m[4] * m[8] - m[5] * m[7]) - m[1] * (m[3] * m[8] - m[5] * m[6]) +
         m[2] * (m[3] * m[7] - m[4] * m[6]);
}

std::optional<Mat3> mat3_invert(const Mat3 & m)
{
  return invert3(m[0], m[1], m[2], m[3], m[4], m[5], m[6], m[7], m[8]);
}

Mat3 mat3_from_mat4(const Mat4 & m)
{
  return {m[0], m[1], m[2], m[4], m[5], m[6], m[8], m[9], m[10]};
}

std::optional<Mat3> mat3_normal_from_mat4(const Mat4 & m)
{
  auto inv = invert3(m[0], m[1], m[2], m[4], m[5], m[6], m[8], m[9], m[10]);
  if (!inv) {
    return std::nullopt;
  }
  mat3_transpose(*inv, *inv);
  return inv;
}

Mat3 mat3_from_translation(const Vec2 & v) { return {1.0, 0.0, 0.0, 0.0, 1.0, 0.0, v[0], v[1], 1.0}; }

Mat3 mat3_from_rotation(double angle)
{
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  return {c, s, 0.0, -s, c, 0.0, 0.0, 0.0, 1.0};
}

Mat3 mat3_from_scaling(const Vec2 & v) { return {v[0], 0.0, 0.0, 0.0, v[1], 0.0, 0.0, 0.0, 1.0}; }

void mat3_translate(const Mat3 & m, const Vec2 & v, Mat3 & out)
{
  const double x = v[0], y = v[1];
  if (&out != &m) {
    out = m;
  }
  // Columns 0 and 1 are unchanged, so the last column can be read from out.
  out[6] = x * out[0] + y * out[3] + out[6];
  out[7] = x * out[1] + y * out[4] + out[7];
  out[8] = x * out[2] + y * out[5] + out[8];
}

void mat3_rotate(const Mat3 & m, double angle, Mat3 & out)
{
  const double s = std::sin(angle);
  const double c = std::cos(angle);
  const double a00 = m[0], a01 = m[1], a02 = m[2];
  const double a10 = m[3], a11 = m[4], a12 = m[5];

  out[0] = c * a00 + s * a10;
  out[1] = c * a01 + s * a11;
  out[2] = c * a02 + s * a12;
  out[3] = c * a10 - s * a00;
  out[4] = c * a11 - s * a01;
  out[5] = c * a12 - s * a02;
  out[6] = m[6];
  out[7] = m[7];
  out[8] = m[8];
}

void mat3_scale(const Mat3 & m, const Vec2 & v, Mat3 & out)
{
  for (int row = 0; row < 3; ++row) {
    out[row] = m[row] * v[0];
    out[3 + row] = m[3 + row] * v[1];
    out[6 + row] = m[6 + row];
  }
}

void mat3_transform_vec2(const Mat3 & m, const Vec2 & v, Vec2 & out)
{
  const double x = v[0], y = v[1];
  out = {m[0] * x + m[3] * y + m[6], m[1] * x + m[4] * y + m[7]};
}

}  // namespace geom
