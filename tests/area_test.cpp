/*

This file is part of canvass.

Copyright (c) 2025-2026, canvass contributors.
All rights reserved (see LICENSE).

*/

#include <gtest/gtest.h>

#include "structures/canvass/area.h"
#include "utils/exception.h"

namespace canvass {
namespace {

TEST(AreaTest, RectangleBoundsAreInclusive) {
  const Area area = Rectangle{29.5, 29.4, -98.4, -98.6};

  EXPECT_TRUE(area_contains(area, {29.45, -98.5}));
  EXPECT_TRUE(area_contains(area, {29.5, -98.6}));
  EXPECT_TRUE(area_contains(area, {29.4, -98.4}));
  EXPECT_FALSE(area_contains(area, {29.51, -98.5}));
  EXPECT_FALSE(area_contains(area, {29.45, -98.39}));
}

TEST(AreaTest, CircleRadiusIsInMeters) {
  const Coordinates center{29.4241, -98.4936};
  const Area area = Circle{center, 500};

  // About 111m per 0.001 degree of latitude.
  EXPECT_TRUE(area_contains(area, center));
  EXPECT_TRUE(area_contains(area, {29.4281, -98.4936}));
  EXPECT_FALSE(area_contains(area, {29.4291, -98.4936}));
}

TEST(AreaTest, PolygonRayCasting) {
  // L shaped, concave at the north east.
  const Area area = Polygon{{{0, 0}, {0, 2}, {1, 2}, {1, 1}, {2, 1}, {2, 0}}};

  EXPECT_TRUE(area_contains(area, {0.5, 0.5}));
  EXPECT_TRUE(area_contains(area, {0.5, 1.5}));
  EXPECT_TRUE(area_contains(area, {1.5, 0.5}));
  EXPECT_FALSE(area_contains(area, {1.5, 1.5}));
  EXPECT_FALSE(area_contains(area, {3, 3}));
  EXPECT_FALSE(area_contains(area, {-0.5, 0.5}));
}

TEST(AreaTest, DegenerateShapesAreRejected) {
  EXPECT_THROW(check_area(Rectangle{29.4, 29.5, -98.4, -98.6}),
               InputException);
  EXPECT_THROW(check_area(Circle{{29.4, -98.5}, 0}), InputException);
  EXPECT_THROW(check_area(Circle{{95, -98.5}, 100}), InputException);
  EXPECT_THROW(check_area(Polygon{{{0, 0}, {1, 1}}}), InputException);

  EXPECT_NO_THROW(check_area(Rectangle{29.5, 29.4, -98.4, -98.6}));
  EXPECT_NO_THROW(check_area(Polygon{{{0, 0}, {0, 1}, {1, 0}}}));
}

TEST(AreaTest, HaversineDistance) {
  const Coordinates a{29.4241, -98.4936};
  const Coordinates b{30.2672, -97.7431};

  // San Antonio to Austin, about 118km as the crow flies.
  EXPECT_NEAR(a.distance_to(b), 118.0, 1.5);
  EXPECT_DOUBLE_EQ(a.distance_to(a), 0);
  EXPECT_NEAR(a.distance_to(b), b.distance_to(a), 1e-9);
}

} // namespace
} // namespace canvass
