// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <gtest/gtest.h>

#include "middrag/include/drag_delta.h"
#include "middrag/include/util.h"

namespace middrag {

class DragDeltaTest : public ::testing::Test {};

namespace {
GestureData MakeData(float last_x, float last_y, float x, float y,
                     float vx, float vy) {
  GestureData data = GestureData();
  data.last_position = MakePoint(last_x, last_y);
  data.centroid = MakePoint(x, y);
  data.velocity = MakePoint(vx, vy);
  data.finger_cnt = 3;
  return data;
}
}  // namespace {}

TEST(DragDeltaTest, EffectiveSensitivityTest) {
  GestureConfiguration config;
  EXPECT_DOUBLE_EQ(1.0, EffectiveSensitivity(MakePoint(0.0, 0.0), config));
  // |vx| + |vy| = 1.0 gives a 1.5x boost.
  EXPECT_DOUBLE_EQ(1.5, EffectiveSensitivity(MakePoint(0.5, -0.5), config));

  config.sensitivity = 2.0;
  EXPECT_DOUBLE_EQ(3.0, EffectiveSensitivity(MakePoint(-1.0, 0.0), config));

  config.velocity_boost_enabled = false;
  EXPECT_DOUBLE_EQ(2.0, EffectiveSensitivity(MakePoint(-1.0, 0.0), config));
}

TEST(DragDeltaTest, SaturationTest) {
  GestureConfiguration config;
  // Exactly 2.0 at and beyond a combined speed of max_velocity_boost.
  EXPECT_DOUBLE_EQ(2.0, EffectiveSensitivity(MakePoint(1.0, 1.0), config));
  EXPECT_DOUBLE_EQ(2.0, EffectiveSensitivity(MakePoint(5.0, -7.0), config));
  EXPECT_DOUBLE_EQ(2.0, EffectiveSensitivity(MakePoint(1000.0, 1000.0),
                                             config));

  // Never decreases as speed grows.
  double last = 0.0;
  for (int i = 0; i <= 40; i++) {
    double sens = EffectiveSensitivity(MakePoint(i * 0.1, 0.0), config);
    EXPECT_GE(sens, last) << "speed " << i * 0.1;
    EXPECT_LE(sens, 2.0);
    last = sens;
  }
}

TEST(DragDeltaTest, FrameDeltaTest) {
  GestureConfiguration config;
  config.velocity_boost_enabled = false;
  double dx = 1.0, dy = 1.0;

  FrameDelta(MakeData(0.5, 0.5, 0.51, 0.49, 0.0, 0.0), config, &dx, &dy);
  EXPECT_NEAR(0.01, dx, 1e-6);
  EXPECT_NEAR(-0.01, dy, 1e-6);

  config.sensitivity = 3.0;
  FrameDelta(MakeData(0.5, 0.5, 0.51, 0.49, 0.0, 0.0), config, &dx, &dy);
  EXPECT_NEAR(0.03, dx, 1e-6);
  EXPECT_NEAR(-0.03, dy, 1e-6);
}

TEST(DragDeltaTest, LargeJumpTest) {
  GestureConfiguration config;
  double dx = 1.0, dy = 1.0;

  // More than kLargeJumpThreshold on either axis yields no movement.
  FrameDelta(MakeData(0.5, 0.5, 0.54, 0.5, 0.0, 0.0), config, &dx, &dy);
  EXPECT_DOUBLE_EQ(0.0, dx);
  EXPECT_DOUBLE_EQ(0.0, dy);

  dx = dy = 1.0;
  FrameDelta(MakeData(0.5, 0.5, 0.5, 0.46, 0.0, 0.0), config, &dx, &dy);
  EXPECT_DOUBLE_EQ(0.0, dx);
  EXPECT_DOUBLE_EQ(0.0, dy);

  // Just inside the threshold still moves.
  FrameDelta(MakeData(0.5, 0.5, 0.525, 0.5, 0.0, 0.0), config, &dx, &dy);
  EXPECT_NEAR(0.025, dx, 1e-6);
  EXPECT_DOUBLE_EQ(0.0, dy);
}

}  // namespace middrag
