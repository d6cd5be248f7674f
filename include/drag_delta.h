// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_DRAG_DELTA_H_
#define MIDDRAG_DRAG_DELTA_H_

#include "middrag/include/gesture_configuration.h"
#include "middrag/include/middrag.h"

namespace middrag {

// Centroid movement between two frames larger than this, in normalized
// units, comes from fingers being added or removed, not from real motion.
extern const float kLargeJumpThreshold;

// Returns config.sensitivity when velocity boost is off. Otherwise the
// sensitivity grows with the speed of |velocity| and saturates at
// sensitivity * (1 + max_velocity_boost * 0.5).
double EffectiveSensitivity(const GesturePoint& velocity,
                            const GestureConfiguration& config);

// Computes the pointer delta for one drag frame, in normalized units scaled
// by the effective sensitivity. Either axis moving more than
// kLargeJumpThreshold yields (0, 0).
void FrameDelta(const GestureData& data,
                const GestureConfiguration& config,
                double* dx,
                double* dy);

}  // namespace middrag

#endif  // MIDDRAG_DRAG_DELTA_H_
