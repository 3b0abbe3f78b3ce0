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

#include "geom/scalar.hpp"
#include "geom/vec2.hpp"
#include "geom/vec3.hpp"

using geom::Vec2;
using geom::Vec3;

namespace
{

void expect_vec3_near(const Vec3 & a, const Vec3 & b, double tol = 1e-12)
{
  for (int i = 0; i < 3; ++i) {
    EXPECT_NEAR(a[i], b[i], tol) << "component " << i;
  }
}

}  // namespace

TEST(Vec2, Arithmetic)
{
  Vec2 out;
  geom::vec2_add({1.0, 2.0}, {3.0, 4.0}, out);
  EXPECT_DOUBLE_EQ(out[0], 4.0);
  EXPECT_DOUBLE_EQ(out[1], 6.0);

  geom::vec2_sub({1.0, 2.0}, {3.0, 5.0}, out);
  EXPECT_DOUBLE_EQ(out[0], -2.0);
  EXPECT_DOUBLE_EQ(out[1], -3.0);

  geom::vec2_scale({1.0, -2.0}, 3.0, out);
  EXPECT_DOUBLE_EQ(out[0], 3.0);
  EXPECT_DOUBLE_EQ(out[1], -6.0);

  geom::vec2_div({3.0, -6.0}, 3.0, out);
  EXPECT_DOUBLE_EQ(out[0], 1.0);
  EXPECT_DOUBLE_EQ(out[1], -2.0);

  geom::vec2_negate({1.0, -2.0}, out);
  EXPECT_DOUBLE_EQ(out[0], -1.0);
  EXPECT_DOUBLE_EQ(out[1], 2.0);
}

TEST(Vec2, DotCrossLength)
{
  EXPECT_DOUBLE_EQ(geom::vec2_dot({1.0, 2.0}, {3.0, 4.0}), 11.0);
  EXPECT_DOUBLE_EQ(geom::vec2_cross(geom::vec2_unit_x(), geom::vec2_unit_y()), 1.0);
  EXPECT_DOUBLE_EQ(geom::vec2_cross(geom::vec2_unit_y(), geom::vec2_unit_x()), -1.0);
  EXPECT_DOUBLE_EQ(geom::vec2_length({3.0, 4.0}), 5.0);
  EXPECT_DOUBLE_EQ(geom::vec2_length_sq({3.0, 4.0}), 25.0);
  EXPECT_DOUBLE_EQ(geom::vec2_distance({1.0, 1.0}, {4.0, 5.0}), 5.0);
  EXPECT_DOUBLE_EQ(geom::vec2_distance_sq({1.0, 1.0}, {4.0, 5.0}), 25.0);
}

TEST(Vec2, NormalizeZeroIsZero)
{
  Vec2 out = {7.0, 7.0};
  geom::vec2_normalize(geom::vec2_zero(), out);
  EXPECT_DOUBLE_EQ(out[0], 0.0);
  EXPECT_DOUBLE_EQ(out[1], 0.0);

  Vec2 v = {3.0, 4.0};
  geom::vec2_normalize(v, v);
  EXPECT_NEAR(v[0], 0.6, 1e-15);
  EXPECT_NEAR(v[1], 0.8, 1e-15);
}

TEST(Vec2, LerpExtrapolates)
{
  Vec2 out;
  geom::vec2_lerp({0.0, 0.0}, {1.0, 2.0}, 0.5, out);
  EXPECT_DOUBLE_EQ(out[0], 0.5);
  EXPECT_DOUBLE_EQ(out[1], 1.0);

  geom::vec2_lerp({0.0, 0.0}, {1.0, 2.0}, 2.0, out);
  EXPECT_DOUBLE_EQ(out[0], 2.0);
  EXPECT_DOUBLE_EQ(out[1], 4.0);
}

TEST(Vec2, Reflect)
{
  Vec2 out;
  geom::vec2_reflect({1.0, -1.0}, {0.0, 1.0}, out);
  EXPECT_DOUBLE_EQ(out[0], 1.0);
  EXPECT_DOUBLE_EQ(out[1], 1.0);
}

TEST(Vec2, RotateInPlace)
{
  Vec2 v = {1.0, 0.0};
  geom::vec2_rotate(v, geom::kPi / 2.0, v);
  EXPECT_NEAR(v[0], 0.0, 1e-12);
  EXPECT_NEAR(v[1], 1.0, 1e-12);
}

TEST(Vec2, Angle)
{
  EXPECT_NEAR(geom::vec2_angle({1.0, 0.0}, {0.0, 3.0}), geom::kPi / 2.0, 1e-12);
  EXPECT_NEAR(geom::vec2_angle({1.0, 0.0}, {-2.0, 0.0}), geom::kPi, 1e-12);
  EXPECT_DOUBLE_EQ(geom::vec2_angle({1.0, 1.0}, {2.0, 2.0}), 0.0);
  EXPECT_DOUBLE_EQ(geom::vec2_angle({0.0, 0.0}, {1.0, 0.0}), 0.0);
}

TEST(Vec3, Arithmetic)
{
  Vec3 out;
  geom::vec3_add({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, out);
  expect_vec3_near(out, {5.0, 7.0, 9.0});
  geom::vec3_sub({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, out);
  expect_vec3_near(out, {-3.0, -3.0, -3.0});
  geom::vec3_scale({1.0, 2.0, 3.0}, 2.0, out);
  expect_vec3_near(out, {2.0, 4.0, 6.0});
  geom::vec3_div({2.0, 4.0, 6.0}, 2.0, out);
  expect_vec3_near(out, {1.0, 2.0, 3.0});
  geom::vec3_negate({1.0, -2.0, 3.0}, out);
  expect_vec3_near(out, {-1.0, 2.0, -3.0});
}

TEST(Vec3, CrossIsRightHanded)
{
  Vec3 out;
  geom::vec3_cross(geom::vec3_unit_x(), geom::vec3_unit_y(), out);
  expect_vec3_near(out, geom::vec3_unit_z());
  geom::vec3_cross(geom::vec3_unit_y(), geom::vec3_unit_z(), out);
  expect_vec3_near(out, geom::vec3_unit_x());
}

TEST(Vec3, CrossAliasing)
{
  Vec3 a = {1.0, 2.0, 3.0};
  const Vec3 b = {-2.0, 0.5, 4.0};
  Vec3 expected;
  geom::vec3_cross(a, b, expected);
  geom::vec3_cross(a, b, a);
  expect_vec3_near(a, expected);
}

TEST(Vec3, DotLengthDistance)
{
  EXPECT_DOUBLE_EQ(geom::vec3_dot({1.0, 2.0, 3.0}, {4.0, -5.0, 6.0}), 12.0);
  EXPECT_DOUBLE_EQ(geom::vec3_length({2.0, 3.0, 6.0}), 7.0);
  EXPECT_DOUBLE_EQ(geom::vec3_length_sq({2.0, 3.0, 6.0}), 49.0);
  EXPECT_DOUBLE_EQ(geom::vec3_distance({1.0, 1.0, 1.0}, {3.0, 4.0, 7.0}), 7.0);
  EXPECT_DOUBLE_EQ(geom::vec3_distance_sq({1.0, 1.0, 1.0}, {3.0, 4.0, 7.0}), 49.0);
}

TEST(Vec3, NormalizeZeroIsZero)
{
  Vec3 out = {1.0, 1.0, 1.0};
  geom::vec3_normalize(geom::vec3_zero(), out);
  expect_vec3_near(out, {0.0, 0.0, 0.0});
  EXPECT_FALSE(std::isnan(out[0]));

  geom::vec3_normalize({0.0, 0.0, -5.0}, out);
  expect_vec3_near(out, {0.0, 0.0, -1.0});
}

TEST(Vec3, LerpAndReflect)
{
  Vec3 out;
  geom::vec3_lerp({0.0, 0.0, 0.0}, {2.0, 4.0, 6.0}, -0.5, out);
  expect_vec3_near(out, {-1.0, -2.0, -3.0});

  geom::vec3_reflect({1.0, -1.0, 2.0}, {0.0, 1.0, 0.0}, out);
  expect_vec3_near(out, {1.0, 1.0, 2.0});
}
