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
#include <array>
#include <type_traits>

namespace geom
{

constexpr double kEpsilon = 1e-6;

using Vec2 = std::array<double, 2>;
using Vec3 = std::array<double, 3>;

// x, y, z, w
using Quat = std::array<double, 4>;

// Three row vectors (x axis, y axis, z axis) of a 3x3 matrix M.
// Rotating a vector computes M * v.
using Basis = std::array<double, 9>;

// Column-major 2D affine transform.
using Mat3 = std::array<double, 9>;

// Column-major 3D affine / projective transform.
using Mat4 = std::array<double, 16>;

using Rgb = std::array<double, 3>;
using Rgba = std::array<double, 4>;

// h in degrees [0, 360), s and v in [0, 1]
using Hsv = std::array<double, 3>;

static_assert(std::is_trivially_copyable_v<Quat>);
static_assert(std::is_trivially_copyable_v<Mat4>);

}  // namespace geom
