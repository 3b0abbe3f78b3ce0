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

#include "geom/mat4.hpp"

#include <cmath>

#include "geom/rotation.hpp"

namespace geom
{

namespace
{

// Plain lhs * rhs in column-major storage.
Mat4 product(const Mat4 & lhs, const Mat4 & rhs)
{
  Mat4 r;
  for (int col = 0; col < 4; ++col) {
    for (int row = 0; row < 4; ++row) {
      double sum = 0.0;
      for (int k = 0; k < 4; ++k) {
        sum += lhs[k * 4 + row] * rhs[col * 4 + k];
      }
      r[col * 4 + row] = sum;
    }
  }
  return r;
}

Mat4 from_rotation_matrix(const Basis & b)
{
  return {
    b[0], b[3], b[6], 0.0,
    b[1], b[4], b[7], 0.0,
    b[2], b[5], b[8], 0.0,
    0.0, 0.0, 0.0, 1.0};
}

}  // anonymous namespace

void mat4_multiply(const Mat4 & a, const Mat4 & b, Mat4 & out) { out = product(b, a); }

void mat4_look_at(const Vec3 & eye, const Vec3 & center, const Vec3 & up, Mat4 & out)
{
  if (
    std::abs(eye[0] - center[0]) < kEpsilon && std::abs(eye[1] - center[1]) < kEpsilon &&
    std::abs(eye[2] - center[2]) < kEpsilon) {
    out = mat4_identity();
    return;
  }

  // z points from center back to the eye
  double z0 = eye[0] - center[0];
  double z1 = eye[1] - center[1];
  double z2 = eye[2] - center[2];
  double len = 1.0 / std::sqrt(z0 * z0 + z1 * z1 + z2 * z2);
  z0 *= len;
  z1 *= len;
  z2 *= len;

  double x0 = up[1] * z2 - up[2] * z1;
  double x1 = up[2] * z0 - up[0] * z2;
  double x2 = up[0] * z1 - up[1] * z0;
  len = std::sqrt(x0 * x0 + x1 * x1 + x2 * x2);
  if (len == 0.0) {
    // up is parallel to the view direction
    x0 = x1 = x2 = 0.0;
  } else {
    x0 /= len;
    x1 /= len;
    x2 /= len;
  }

  double y0 = z1 * x2 - z2 * x1;
  double y1 = z2 * x0 - z0 * x2;
  double y2 = z0 * x1 - z1 * x0;
  len = std::sqrt(y0 * y0 + y1 * y1 + y2 * y2);
  if (len == 0.0) {
    y0 = y1 = y2 = 0.0;
  } else {
    y0 /= len;
    y1 /= len;
    y2 /= len;
  }

  const double ex = eye[0], ey = eye[1], ez = eye[2];
  out = {
    x0, y0, z0, 0.0,
    x1, y1, z1, 0.0,
    x2, y2, z2, 0.0,
    -(x0 * ex + x1 * ey + x2 * ez), -(y0 * ex + y1 * ey + y2 * ez),
    -(z0 * ex + z1 * ey + z2 * ez), 1.0};
}

void mat4_perspective(double fovy, double aspect, double z_near, double z_far, Mat4 & out)
{
  const double f = 1.0 / std::tan(fovy / 2.0);
  const double nf = 1.0 / (z_near - z_far);
  out = {
    f / aspect, 0.0, 0.0, 0.0,
    0.0, f, 0.0, 0.0,
    0.0, 0.0, (z_far + z_near) * nf, -1.0,
    0.0, 0.0, 2.0 * z_far * z_near * nf, 0.0};
}

void mat4_ortho(
  double left, double right, double bottom, double top, double z_near, double z_far, Mat4 & out)
{
  const double lr = 1.0 / (left - right);
  const double bt = 1.0 / (bottom - top);
  const double nf = 1.0 / (z_near - z_far);
  out = {
    -2.0 * lr, 0.0, 0.0, 0.0,
    0.0, -2.0 * bt, 0.0, 0.0,
    0.0, 0.0, 2.0 * nf, 0.0,
    (left + right) * lr, (top + bottom) * bt, (z_far + z_near) * nf, 1.0};
}

Mat4 mat4_from_translation(const Vec3 & v)
{
  Mat4 m = mat4_identity();
  m[12] = v[0];
  m[13] = v[1];
  m[14] = v[2];
  return m;
}

Mat4 mat4_from_x_rotation(double angle)
{
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  return {1.0, 0.0, 0.0, 0.0, 0.0, c, s, 0.0, 0.0, -s, c, 0.0, 0.0, 0.0, 0.0, 1.0};
}

Mat4 mat4_from_y_rotation(double angle)
{
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  return {c, 0.0, -s, 0.0, 0.0, 1.0, 0.0, 0.0, s, 0.0, c, 0.0, 0.0, 0.0, 0.0, 1.0};
}

Mat4 mat4_from_z_rotation(double angle)
{
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  return {c, s, 0.0, 0.0, -s, c, 0.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 1.0};
}

Mat4 mat4_from_rotation(double angle, const Vec3 & axis)
{
  return from_rotation_matrix(rotation_matrix_from_axis_angle(axis, angle));
}

Mat4 mat4_from_scale(const Vec3 & v)
{
  Mat4 m = mat4_identity();
  m[0] = v[0];
  m[5] = v[1];
  m[10] = v[2];
  return m;
}

Mat4 mat4_compose(const Vec3 & translation, const Quat & rotation, const Vec3 & scale)
{
  Mat4 m = from_rotation_matrix(rotation_matrix_from_quat(rotation));
  for (int col = 0; col < 3; ++col) {
    for (int row = 0; row < 3; ++row) {
      m[col * 4 + row] *= scale[col];
    }
  }
  m[12] = translation[0];
  m[13] = translation[1];
  m[14] = translation[2];
  return m;
}

void mat4_translate(const Mat4 & m, const Vec3 & v, Mat4 & out)
{
  const double x = v[0], y = v[1], z = v[2];
  if (&out != &m) {
    for (int i = 0; i < 12; ++i) {
      out[i] = m[i];
    }
  }
  // Columns 0..2 are unchanged, so reading them through out is safe.
  for (int row = 0; row < 4; ++row) {
    out[12 + row] = out[row] * x + out[4 + row] * y + out[8 + row] * z + m[12 + row];
  }
}

void mat4_rotate_x(const Mat4 & m, double angle, Mat4 & out)
{
  const double s = std::sin(angle);
  const double c = std::cos(angle);
  const double a10 = m[4], a11 = m[5], a12 = m[6], a13 = m[7];
  const double a20 = m[8], a21 = m[9], a22 = m[10], a23 = m[11];
  if (&out != &m) {
    for (int i = 0; i < 4; ++i) {
      out[i] = m[i];
      out[12 + i] = m[12 + i];
    }
  }
  out[4] = a10 * c + a20 * s;
  out[5] = a11 * c + a21 * s;
  out[6] = a12 * c + a22 * s;
  out[7] = a13 * c + a23 * s;
  out[8] = a20 * c - a10 * s;
  out[9] = a21 * c - a11 * s;
  out[10] = a22 * c - a12 * s;
  out[11] = a23 * c - a13 * s;
}

void mat4_rotate_y(const Mat4 & m, double angle, Mat4 & out)
{
  const double s = std::sin(angle);
  const double c = std::cos(angle);
  const double a00 = m[0], a01 = m[1], a02 = m[2], a03 = m[3];
  const double a20 = m[8], a21 = m[9], a22 = m[10], a23 = m[11];
  if (&out != &m) {
    for (int i = 0; i < 4; ++i) {
      out[4 + i] = m[4 + i];
      out[12 + i] = m[12 + i];
    }
  }
  out[0] = a00 * c - a20 * s;
  out[1] = a01 * c - a21 * s;
  out[2] = a02 * c - a22 * s;
  out[3] = a03 * c - a23 * s;
  out[8] = a00 * s + a20 * c;
  out[9] = a01 * s + a21 * c;
  out[10] = a02 * s + a22 * c;
  out[11] = a03 * s + a23 * c;
}

void mat4_rotate_z(const Mat4 & m, double angle, Mat4 & out)
{
  const double s = std::sin(angle);
  const double c = std::cos(angle);
  const double a00 = m[0], a01 = m[1], a02 = m[2], a03 = m[3];
  const double a10 = m[4], a11 = m[5], a12 = m[6], a13 = m[7];
  if (&out != &m) {
    for (int i = 0; i < 4; ++i) {
      out[8 + i] = m[8 + i];
      out[12 + i] = m[12 + i];
    }
  }
  out[0] = a00 * c + a10 * s;
  out[1] = a01 * c + a11 * s;
  out[2] = a02 * c + a12 * s;
  out[3] = a03 * c + a13 * s;
  out[4] = a10 * c - a00 * s;
  out[5] = a11 * c - a01 * s;
  out[6] = a12 * c - a02 * s;
  out[7] = a13 * c - a03 * s;
}

void mat4_rotate(const Mat4 & m, double angle, const Vec3 & axis, Mat4 & out)
{
  out = product(m, mat4_from_rotation(angle, axis));
}

void mat4_scale(const Mat4 & m, const Vec3 & v, Mat4 & out)
{
  for (int col = 0; col < 3; ++col) {
    for (int row = 0; row < 4; ++row) {
      out[col * 4 + row] = m[col * 4 + row] * v[col];
    }
  }
  for (int row = 0; row < 4; ++row) {
    out[12 + row] = m[12 + row];
  }
}

void mat4_transpose(const Mat4 & m, Mat4 & out)
{
  if (&out == &m) {
    for (int col = 1; col < 4; ++col) {
      for (int row = 0; row < col; ++row) {
        const double tmp = out[col * 4 + row];
        out[col * 4 + row] = out[row * 4 + col];
        out[row * 4 + col] = tmp;
      }
    }
    return;
  }
  for (int col = 0; col < 4; ++col) {
    for (int row = 0; row < 4; ++row) {
      out[col * 4 + row] = m[row * 4 + col];
    }
  }
}

double mat4_determinant(const Mat4 & m)
{
  const double b00 = m[0] * m[5] - m[1] * m[4];
  const double b01 = m[0] * m[6] - m[2] * m[4];
  const double b02 = m[0] * m[7] - m[3] * m[4];
  const double b03 = m[1] * m[6] - m[2] * m[5];
  const double b04 = m[1] * m[7] - m[3] * m[5];
  const double b05 = m[2] * m[7] - m[3] * m[6];
  const double b06 = m[8] * m[13] - m[9] * m[12];
  const double b07 = m[8] * m[14] - m[10] * m[12];
  const double b08 = m[8] * m[15] - m[11] * m[12];
  const double b09 = m[9] * m[14] - m[10] * m[13];
  const double b10 = m[9] * m[15] - m[11] * m[13];
  const double b11 = m[10] * m[15] - m[11] * m[14];
  return b00 * b11 - b01 * b10 + b02 * b09 + b03 * b08 - b04 * b07 + b05 * b06;
}

std::optional<Mat4> mat4_invert(const Mat4 & m)
{
  const double a00 = m[0], a01 = m[1], a02 = m[2], a03 = m[3];
  const double a10 = m[4], a11 = m[5], a12 = m[6], a13 = m[7];
  const double a20 = m[8], a21 = m[9], a22 = m[10], a23 = m[11];
  const double a30 = m[12], a31 = m[13], a32 = m[14], a33 = m[15];

  const double b00 = a00 * a11 - a01 * a10;
  const double b01 = a00 * a12 - a02 * a10;
  const double b02 = a00 * a13 - a03 * a10;
  const double b03 = a01 * a12 - a02 * a11;
  const double b04 = a01 * a13 - a03 * a11;
  const double b05 = a02 * a13 - a03 * a12;
  const double b06 = a20 * a31 - a21 * a30;
  const double b07 = a20 * a32 - a22 * a30;
  const double b08 = a20 * a33 - a23 * a30;
  const double b09 = a21 * a32 - a22 * a31;
  const double b10 = a21 * a33 - a23 * a31;
  const double b11 = a22 * a33 - a23 * a32;

  const double det = b00 * b11 - b01 * b10 + b02 * b09 + b03 * b08 - b04 * b07 + b05 * b06;
  if (std::abs(det) < kEpsilon) {
    return std::nullopt;
  }
  const double inv = 1.0 / det;

  return Mat4{
    (a11 * b11 - a12 * b10 + a13 * b09) * inv,
    (a02 * b10 - a01 * b11 - a03 * b09) * inv,
    (a31 * b05 - a32 * b04 + a33 * b03) * inv,
    (a22 * b04 - a21 * b05 - a23 * b03) * inv,
    (a12 * b08 - a10 * b11 - a13 * b07) * inv,
    (a00 * b11 - a02 * b08 + a03 * b07) * inv,
    (a32 * b02 - a30 * b05 - a33 * b01) * inv,
    (a20 * b05 - a22 * b02 + a23 * b01) * inv,
    (a10 * b10 - a11 * b08 + a13 * b06) * inv,
    (a01 * b08 - a00 * b10 - a03 * b06) * inv,
    (a30 * b04 - a31 * b02 + a33 * b00) * inv,
    (a21 * b02 - a20 * b04 - a23 * b00) * inv,
    (a11 * b07 - a10 * b09 - a12 * b06) * inv,
    (a00 * b09 - a01 * b07 + a02 * b06) * inv,
    (a31 * b01 - a30 * b03 - a32 * b00) * inv,
    (a20 * b03 - a21 * b01 + a22 * b00) * inv};
}

void mat4_transform_vec3(const Mat4 & m, const Vec3 & v, Vec3 & out)
{
  const double x = v[0], y = v[1], z = v[2];
  const double w = m[3] * x + m[7] * y + m[11] * z + m[15];
  double rx = m[0] * x + m[4] * y + m[8] * z + m[12];
  double ry = m[1] * x + m[5] * y + m[9] * z + m[13];
  double rz = m[2] * x + m[6] * y + m[10] * z + m[14];
  if (w != 0.0) {
    rx /= w;
    ry /= w;
    rz /= w;
  }
  out = {rx, ry, rz};
}

void mat4_set_basis(const Mat4 & m, const Basis & b, Mat4 & out)
{
  if (&out != &m) {
    out = m;
  }
  for (int row = 0; row < 3; ++row) {
    for (int col = 0; col < 3; ++col) {
      out[col * 4 + row] = b[row * 3 + col];
    }
  }
}

}  // namespace geom
