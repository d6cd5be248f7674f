// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_GESTURE_RECOGNIZER_H_
#define MIDDRAG_GESTURE_RECOGNIZER_H_

#include <vector>

#include <base/macros.h>
#include <gtest/gtest.h>  // for FRIEND_TEST

#include "middrag/include/contact_filter.h"
#include "middrag/include/gesture_configuration.h"
#include "middrag/include/middrag.h"

namespace middrag {

enum GestureState {
  kGestureStateIdle = 0,
  kGestureStatePossibleTap,
  kGestureStateDragging,
  kGestureStateWaitingForRelease,
};

const char* GestureStateName(GestureState state);

// possibleTap and dragging are active; idle and waitingForRelease are not.
bool GestureStateIsActive(GestureState state);

// This class turns a stream of filtered three-finger frames into gesture
// events. It is fed exactly one frame at a time from a single context and
// keeps only derived scalars (centroids, timestamps, counters) between
// frames.
//
// Each frame is evaluated against these rules, first match wins:
//  1. Four or more fingers cancel an active session and set the cooldown.
//  2. A required modifier that is not held cancels an active session and
//     keeps new sessions from starting.
//  3. Three fingers in idle start a session (possibleTap).
//  4. While tracking, centroid jumps reset the reference point, movement
//     reaching the onset threshold begins a drag, and drag frames emit
//     deltas.
//  5. Too few fingers for two consecutive frames end the session with a
//     tap, an endDragging, or silently.

class GestureRecognizer {
  FRIEND_TEST(GestureRecognizerTest, CooldownClearedOnUnderCountTest);
  FRIEND_TEST(GestureRecognizerTest, CooldownSetByExcessFingersTest);
  FRIEND_TEST(GestureRecognizerTest, LargeJumpDuringPossibleTapTest);
  FRIEND_TEST(GestureRecognizerTest, StableFrameCounterTest);
 public:
  GestureRecognizer();
  ~GestureRecognizer() {}

  // Consumes one frame already filtered by ContactFilter and appends the
  // resulting events, if any, to |events|.
  void Process(const FilteredContacts& contacts,
               const GestureConfiguration& config,
               stime_t now,
               unsigned modifiers_held,
               std::vector<GestureEvent>* events);

  // Returns to idle and clears all counters and flags. Emits nothing.
  void Reset();

  GestureState state() const { return state_; }
  bool IsActive() const { return GestureStateIsActive(state_); }

  // A pass-through session is left to the host's own gesture handling. The
  // flag lives until the session ends.
  bool pass_through() const { return pass_through_; }
  void set_pass_through(bool pass_through) { pass_through_ = pass_through; }

 private:
  // Fewest valid fingers that keep the current session alive.
  int MinimumFingers(const GestureConfiguration& config) const;

  // Returns true if |count| fingers keep tracking the current session.
  bool IsTrackingCount(int count, const GestureConfiguration& config) const;

  // Emits cancel or cancelDragging for the active session and goes idle.
  void CancelSession(stime_t now, std::vector<GestureEvent>* events);

  void StartSession(const FilteredContacts& contacts,
                    stime_t now,
                    std::vector<GestureEvent>* events);

  void TrackSession(const FilteredContacts& contacts,
                    const GestureConfiguration& config,
                    stime_t now,
                    std::vector<GestureEvent>* events);

  // Second consecutive under-count frame: tap, endDragging, or nothing.
  void FinishSession(const GestureConfiguration& config,
                     stime_t now,
                     std::vector<GestureEvent>* events);

  void SetState(GestureState state);
  void ClearSession();

  GestureState state_;
  // Movement onset is measured from here.
  GesturePoint start_position_;
  // Centroid of the previous processed frame.
  GesturePoint last_centroid_;
  stime_t start_time_;
  // Consecutive frames with too few fingers for the active session.
  int stable_frame_count_;
  // Set when a session is cancelled by excess fingers.
  bool cooldown_;
  bool pass_through_;

  DISALLOW_COPY_AND_ASSIGN(GestureRecognizer);
};

}  // namespace middrag

#endif  // MIDDRAG_GESTURE_RECOGNIZER_H_
