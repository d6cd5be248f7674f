// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/drag_delta.h"

#include <algorithm>
#include <math.h>

namespace middrag {

const float kLargeJumpThreshold = 0.03;

double EffectiveSensitivity(const GesturePoint& velocity,
                            const GestureConfiguration& config) {
  if (!config.velocity_boost_enabled)
    return config.sensitivity;
  double speed = fabs(velocity.x) + fabs(velocity.y);
  double boost = 1.0 + std::min(speed, config.max_velocity_boost) * 0.5;
  return config.sensitivity * boost;
}

void FrameDelta(const GestureData& data,
                const GestureConfiguration& config,
                double* dx,
                double* dy) {
  double raw_dx = data.centroid.x - data.last_position.x;
  double raw_dy = data.centroid.y - data.last_position.y;
  if (fabs(raw_dx) > kLargeJumpThreshold ||
      fabs(raw_dy) > kLargeJumpThreshold) {
    *dx = 0.0;
    *dy = 0.0;
    return;
  }
  double sensitivity = EffectiveSensitivity(data.velocity, config);
  *dx = raw_dx * sensitivity;
  *dy = raw_dy * sensitivity;
}

}  // namespace middrag
