// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/gesture_recognizer.h"

#include "middrag/include/drag_delta.h"
#include "middrag/include/logging.h"
#include "middrag/include/util.h"

using std::vector;

namespace middrag {

namespace {

const int kGestureFingerCount = 3;
const int kReliftFingerCount = 2;
const int kExcessFingerCount = 4;
const int kStableFramesToFinish = 2;

}  // namespace {}

const char* GestureStateName(GestureState state) {
  switch (state) {
    case kGestureStateIdle: return "Idle";
    case kGestureStatePossibleTap: return "PossibleTap";
    case kGestureStateDragging: return "Dragging";
    case kGestureStateWaitingForRelease: return "WaitingForRelease";
    default: return "<unknown>";
  }
}

bool GestureStateIsActive(GestureState state) {
  return state == kGestureStatePossibleTap || state == kGestureStateDragging;
}

GestureRecognizer::GestureRecognizer()
    : state_(kGestureStateIdle),
      start_position_(MakePoint(0.0, 0.0)),
      last_centroid_(MakePoint(0.0, 0.0)),
      start_time_(0.0),
      stable_frame_count_(0),
      cooldown_(false),
      pass_through_(false) {}

void GestureRecognizer::Process(const FilteredContacts& contacts,
                                const GestureConfiguration& config,
                                stime_t now,
                                unsigned modifiers_held,
                                vector<GestureEvent>* events) {
  AssertWithReturn(events);
  int count = contacts.count();

  if (count >= kExcessFingerCount) {
    if (IsActive()) {
      Log("%d fingers, cancelling session", count);
      CancelSession(now, events);
      cooldown_ = true;
    }
    return;
  }

  if (!config.ModifierSatisfied(modifiers_held)) {
    if (IsActive()) {
      Log("Modifier released, cancelling session");
      CancelSession(now, events);
    }
    return;
  }

  if (count < kGestureFingerCount ||
      (state_ == kGestureStateIdle && count == kGestureFingerCount))
    cooldown_ = false;

  if (state_ == kGestureStateIdle) {
    if (count == kGestureFingerCount && !cooldown_)
      StartSession(contacts, now, events);
    return;
  }

  if (state_ == kGestureStateWaitingForRelease) {
    if (count < kGestureFingerCount)
      SetState(kGestureStateIdle);
    return;
  }

  if (IsTrackingCount(count, config)) {
    stable_frame_count_ = 0;
    TrackSession(contacts, config, now, events);
    return;
  }

  stable_frame_count_++;
  if (stable_frame_count_ >= kStableFramesToFinish)
    FinishSession(config, now, events);
}

void GestureRecognizer::Reset() {
  SetState(kGestureStateIdle);
  ClearSession();
  cooldown_ = false;
}

int GestureRecognizer::MinimumFingers(
    const GestureConfiguration& config) const {
  if (state_ == kGestureStateDragging && config.allow_relift_during_drag)
    return kReliftFingerCount;
  return kGestureFingerCount;
}

bool GestureRecognizer::IsTrackingCount(
    int count, const GestureConfiguration& config) const {
  return count >= MinimumFingers(config) && count <= kGestureFingerCount;
}

void GestureRecognizer::CancelSession(stime_t now,
                                      vector<GestureEvent>* events) {
  if (state_ == kGestureStateDragging)
    events->push_back(GestureEvent(kGestureEventCancelDragging, now));
  else if (state_ == kGestureStatePossibleTap)
    events->push_back(GestureEvent(kGestureEventCancel, now));
  SetState(kGestureStateIdle);
  ClearSession();
}

void GestureRecognizer::StartSession(const FilteredContacts& contacts,
                                     stime_t now,
                                     vector<GestureEvent>* events) {
  AssertWithReturn(state_ == kGestureStateIdle);
  start_position_ = contacts.centroid;
  last_centroid_ = contacts.centroid;
  start_time_ = now;
  stable_frame_count_ = 0;
  SetState(kGestureStatePossibleTap);
  GestureStart start = { contacts.centroid };
  events->push_back(GestureEvent(start, now));
}

void GestureRecognizer::TrackSession(const FilteredContacts& contacts,
                                     const GestureConfiguration& config,
                                     stime_t now,
                                     vector<GestureEvent>* events) {
  const GesturePoint& centroid = contacts.centroid;
  if (Dist(centroid, last_centroid_) > kLargeJumpThreshold) {
    // Fingers were added or lifted. Re-anchor without moving anything.
    Log("Centroid jumped %f, resetting reference",
        Dist(centroid, last_centroid_));
    if (state_ == kGestureStatePossibleTap)
      start_position_ = centroid;
    last_centroid_ = centroid;
    return;
  }

  if (state_ == kGestureStatePossibleTap) {
    float moved = Dist(centroid, start_position_);
    // Reaching the threshold counts, within float precision.
    if (moved > config.move_threshold ||
        FloatEq(moved, config.move_threshold)) {
      SetState(kGestureStateDragging);
      events->push_back(GestureEvent(kGestureEventBeginDragging, now));
    }
  } else if (state_ == kGestureStateDragging) {
    GestureData data;
    data.centroid = centroid;
    data.velocity = contacts.velocity;
    data.pressure = contacts.pressure;
    data.finger_cnt = contacts.count();
    data.start_position = start_position_;
    data.last_position = last_centroid_;
    double dx = 0.0, dy = 0.0;
    FrameDelta(data, config, &dx, &dy);
    if (dx != 0.0 || dy != 0.0)
      events->push_back(GestureEvent(data, now));
  }
  last_centroid_ = centroid;
}

void GestureRecognizer::FinishSession(const GestureConfiguration& config,
                                      stime_t now,
                                      vector<GestureEvent>* events) {
  if (state_ == kGestureStatePossibleTap) {
    stime_t elapsed = now - start_time_;
    if (elapsed <= config.tap_threshold &&
        elapsed <= config.max_tap_hold_duration)
      events->push_back(GestureEvent(kGestureEventTap, now));
    else
      Log("Held %f s, not a tap", elapsed);
  } else if (state_ == kGestureStateDragging) {
    events->push_back(GestureEvent(kGestureEventEndDragging, now));
  }
  SetState(kGestureStateIdle);
  ClearSession();
}

void GestureRecognizer::SetState(GestureState state) {
  if (state_ == state)
    return;
  Log("Gesture State: %s -> %s", GestureStateName(state_),
      GestureStateName(state));
  state_ = state;
}

void GestureRecognizer::ClearSession() {
  start_position_ = MakePoint(0.0, 0.0);
  last_centroid_ = MakePoint(0.0, 0.0);
  start_time_ = 0.0;
  stable_frame_count_ = 0;
  pass_through_ = false;
}

}  // namespace middrag
