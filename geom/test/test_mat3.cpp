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

#include <gtest/gtest.h>

#include <cmath>

#include "geom/mat3.hpp"
#include "geom/mat4.hpp"
#include "geom/scalar.hpp"

using geom::kPi;
using geom::Mat3;
using geom::Vec2;

namespace
{

void expect_mat3_near(const Mat3 & a, const Mat3 & b, double tol = 1e-12)
{
  for (int i = 0; i < 9; ++i) {
    EXPECT_NEAR(a[i], b[i], tol) << "element " << i;
  }
}

// Some non-trivial affine transform.
Mat3 sample()
{
  Mat3 m = geom::mat3_from_translation({3.0, -1.0});
  geom::mat3_rotate(m, 0.6, m);
  geom::mat3_scale(m, {2.0, 0.5}, m);
  return m;
}

}  // namespace

TEST(Mat3, MultiplyIsAB)
{
  const Mat3 t = geom::mat3_from_translation({2.0, 3.0});
  const Mat3 r = geom::mat3_from_rotation(kPi / 2.0);
  Mat3 tr;
  geom::mat3_multiply(t, r, tr);

  // rotate first, then translate
  Vec2 p;
  geom::mat3_transform_vec2(tr, {1.0, 0.0}, p);
  EXPECT_NEAR(p[0], 2.0, 1e-12);
  EXPECT_NEAR(p[1], 4.0, 1e-12);
}

TEST(Mat3, MultiplyAliasing)
{
  Mat3 a = sample();
  const Mat3 b = geom::mat3_from_rotation(-1.1);
  Mat3 expected;
  geom::mat3_multiply(a, b, expected);
  geom::mat3_multiply(a, b, a);
  expect_mat3_near(a, expected, 0.0);
}

TEST(Mat3, Identity)
{
  Mat3 out;
  geom::mat3_multiply(sample(), geom::mat3_identity(), out);
  expect_mat3_near(out, sample());
  EXPECT_DOUBLE_EQ(geom::mat3_determinant(geom::mat3_identity()), 1.0);
}

TEST(Mat3, TransposeInPlace)
{
  Mat3 m = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0};
  geom::mat3_transpose(m, m);
  expect_mat3_near(m, {1.0, 4.0, 7.0, 2.0, 5.0, 8.0, 3.0, 6.0, 9.0}, 0.0);

  Mat3 out;
  geom::mat3_transpose(m, out);
  expect_mat3_near(out, {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0}, 0.0);
}

TEST(Mat3, Determinant)
{
  EXPECT_DOUBLE_EQ(geom::mat3_determinant(geom::mat3_from_scaling({2.0, 3.0})), 6.0);
  EXPECT_NEAR(geom::mat3_determinant(geom::mat3_from_rotation(0.7)), 1.0, 1e-12);
  EXPECT_NEAR(geom::mat3_determinant(sample()), 1.0, 1e-12);
}

TEST(Mat3, Invert)
{
  const Mat3 m = sample();
  auto inv = geom::mat3_invert(m);
  ASSERT_TRUE(inv.has_value());
  Mat3 prod;
  geom::mat3_multiply(m, *inv, prod);
  expect_mat3_near(prod, geom::mat3_identity());
}

TEST(Mat3, InvertSingular)
{
  EXPECT_FALSE(geom::mat3_invert(geom::mat3_from_scaling({1.0, 0.0})).has_value());
  EXPECT_FALSE(geom::mat3_invert({1.0, 2.0, 3.0, 2.0, 4.0, 6.0, 0.0, 1.0, 0.0}).has_value());
}

TEST(Mat3, FromMat4)
{
  geom::Mat4 m = geom::mat4_from_scale({2.0, 3.0, 4.0});
  m[12] = 9.0;
  expect_mat3_near(geom::mat3_from_mat4(m), {2.0, 0.0, 0.0, 0.0, 3.0, 0.0, 0.0, 0.0, 4.0}, 0.0);
}

TEST(Mat3, NormalFromMat4)
{
  auto n = geom::mat3_normal_from_mat4(geom::mat4_from_scale({2.0, 4.0, 8.0}));
  ASSERT_TRUE(n.has_value());
  expect_mat3_near(*n, {0.5, 0.0, 0.0, 0.0, 0.25, 0.0, 0.0, 0.0, 0.125});

  // For a pure rotation the normal matrix is the rotation itself.
  const geom::Mat4 r = geom::mat4_from_rotation(0.8, {1.0, 2.0, -0.5});
  auto nr = geom::mat3_normal_from_mat4(r);
  ASSERT_TRUE(nr.has_value());
  expect_mat3_near(*nr, geom::mat3_from_mat4(r));

  EXPECT_FALSE(geom::mat3_normal_from_mat4(geom::mat4_from_scale({1.0, 0.0, 1.0})).has_value());
}

TEST(Mat3, PostMultiplyHelpers)
{
  const Mat3 m = sample();
  Mat3 expected;
  Mat3 out;

  geom::mat3_multiply(m, geom::mat3_from_translation({1.5, -2.0}), expected);
  geom::mat3_translate(m, {1.5, -2.0}, out);
  expect_mat3_near(out, expected);

  geom::mat3_multiply(m, geom::mat3_from_rotation(0.4), expected);
  geom::mat3_rotate(m, 0.4, out);
  expect_mat3_near(out, expected);

  geom::mat3_multiply(m, geom::mat3_from_scaling({3.0, -1.0}), expected);
  geom::mat3_scale(m, {3.0, -1.0}, out);
  expect_mat3_near(out, expected);
}

TEST(Mat3, PostMultiplyAliasing)
{
  Mat3 m = sample();
  Mat3 expected;
  geom::mat3_translate(m, {1.5, -2.0}, expected);
  geom::mat3_translate(m, {1.5, -2.0}, m);
  expect_mat3_near(m, expected, 0.0);

  geom::mat3_rotate(m, 0.4, expected);
  geom::mat3_rotate(m, 0.4, m);
  expect_mat3_near(m, expected, 0.0);

  geom::mat3_scale(m, {3.0, -1.0}, expected);
  geom::mat3_scale(m, {3.0, -1.0}, m);
  expect_mat3_near(m, expected, 0.0);
}

TEST(Mat3, TransformVec2)
{
  Vec2 p = {1.0, 1.0};
  geom::mat3_transform_vec2(geom::mat3_from_translation({2.0, -3.0}), p, p);
  EXPECT_DOUBLE_EQ(p[0], 3.0);
  EXPECT_DOUBLE_EQ(p[1], -2.0);

  geom::mat3_transform_vec2(geom::mat3_from_scaling({2.0, 3.0}), p, p);
  EXPECT_DOUBLE_EQ(p[0], 6.0);
  EXPECT_DOUBLE_EQ(p[1], -6.0);
}
