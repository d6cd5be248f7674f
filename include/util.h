// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_UTIL_H_
#define MIDDRAG_UTIL_H_

#include <math.h>

#include "middrag/include/middrag.h"

namespace middrag {

inline bool FloatEq(float a, float b) {
  return fabsf(a - b) <= 1e-5;
}

inline bool DoubleEq(double a, double b) {
  return fabs(a - b) <= 1e-8;
}

inline GesturePoint MakePoint(float x, float y) {
  GesturePoint ret = { x, y };
  return ret;
}

// Returns the square of the distance between the two points.
inline float DistSq(const GesturePoint& a, const GesturePoint& b) {
  float dx = a.x - b.x;
  float dy = a.y - b.y;
  return dx * dx + dy * dy;
}

inline float Dist(const GesturePoint& a, const GesturePoint& b) {
  return sqrtf(DistSq(a, b));
}

}  // namespace middrag

#endif  // MIDDRAG_UTIL_H_
