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

// Column-major 3x3 matrices for 2D affine transforms; the translation lives
// in m[6..7].
namespace geom
{

inline Mat3 mat3_identity() { return {1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0}; }

// out = a * b. out may alias a or b.
void mat3_multiply(const Mat3 & a, const Mat3 & b, Mat3 & out);

void mat3_transpose(const Mat3 & m, Mat3 & out);

double mat3_determinant(const Mat3 & m);

// std::nullopt when |det| < kEpsilon.
std::optional<Mat3> mat3_invert(const Mat3 & m);

// Upper-left 3x3 block of m.
Mat3 mat3_from_mat4(const Mat4 & m);

// Inverse-transpose of the upper-left 3x3 block of m, for transforming
// normals under non-uniform scale. std::nullopt when that block is singular.
std::optional<Mat3> mat3_normal_from_mat4(const Mat4 & m);

Mat3 mat3_from_translation(const Vec2 & v);
Mat3 mat3_from_rotation(double angle);
Mat3 mat3_from_scaling(const Vec2 & v);

// Post-multiply: out = m * T / R / S. out may alias m.
void mat3_translate(const Mat3 & m, const Vec2 & v, Mat3 & out);
void mat3_rotate(const Mat3 & m, double angle, Mat3 & out);
void mat3_scale(const Mat3 & m, const Vec2 & v, Mat3 & out);

// Affine transform of a point (implicit w = 1).
void mat3_transform_vec2(const Mat3 & m, const Vec2 & v, Vec2 & out);

}  // namespace geom
