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

#include "geom/hit_test.hpp"

#include <cmath>

#include "geom/scalar.hpp"

namespace geom
{

namespace
{

constexpr double kRadiusTolerance = 1e-9;
constexpr double kFullTurnTolerance = 1e-6;

}  // anonymous namespace

bool point_in_rect(double x, double y, double rx, double ry, double rw, double rh)
{
  return x >= rx && x < rx + rw && y >= ry && y < ry + rh;
}

bool point_in_local_rect(double w, double h, double x, double y)
{
  return x >= 0.0 && x <= w && y >= 0.0 && y <= h;
}

bool point_in_oval(
  double w, double h, double start_angle, double end_angle, double inner_radius, double x,
  double y)
{
  const double rx = w / 2.0;
  const double ry = h / 2.0;
  const double dx = x - rx;
  const double dy = y - ry;

  const double r_norm = std::hypot(dx / rx, dy / ry);
  if (r_norm > 1.0 + kRadiusTolerance) {
    return false;
  }
  if (inner_radius > 0.0 && r_norm < inner_radius - kRadiusTolerance) {
    return false;
  }

  const double arc_len = normalize_arc_length(start_angle, end_angle);
  if (arc_len >= kTwoPi - kFullTurnTolerance) {
    return true;
  }
  return angle_is_between(
    normalize_angle(std::atan2(dy, dx)), normalize_angle(start_angle), arc_len);
}

bool point_in_polygon(const std::vector<Vec2> & points, double x, double y)
{
  bool inside = false;
  const size_t n = points.size();
  for (size_t i = 0, j = n - 1; i < n; j = i++) {
    const double xi = points[i][0], yi = points[i][1];
    const double xj = points[j][0], yj = points[j][1];
    if ((yi > y) != (yj > y) && x < (xj - xi) * (y - yi) / (yj - yi) + xi) {
      inside = !inside;
    }
  }
  return inside;
}

}  // namespace geom
