// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/macros.h>
#include <gtest/gtest.h>

#include "middrag/include/arbiter_snapshot.h"
#include "middrag/include/event_arbiter.h"

namespace middrag {

class EventArbiterTest : public ::testing::Test {};

namespace {
PointerEvent MakeEvent(stime_t now, PointerEventType type, int button,
                       int64_t user_data) {
  PointerEvent event = { now, type, button, user_data, 0 };
  return event;
}
}  // namespace {}

TEST(EventArbiterTest, InterceptionDisabledTest) {
  EventArbiter arbiter;
  ArbiterSnapshot snapshot;
  snapshot.set_in_gesture(true);
  bool reenable = false;

  PointerEventType types[] = {
    kPointerEventInterceptionDisabledByTimeout,
    kPointerEventInterceptionDisabledByUserInput
  };
  for (size_t i = 0; i < arraysize(types); i++) {
    reenable = false;
    EXPECT_EQ(kArbiterPassThrough,
              arbiter.Arbitrate(MakeEvent(1.0, types[i], 0, 0), &snapshot,
                                &reenable));
    EXPECT_TRUE(reenable);
  }

  // Regular events never ask for it.
  EXPECT_EQ(kArbiterSuppress,
            arbiter.Arbitrate(MakeEvent(1.0, kPointerEventMoved, 0, 0),
                              &snapshot, &reenable));
  EXPECT_FALSE(reenable);
}

TEST(EventArbiterTest, OwnEventsTest) {
  EventArbiter arbiter;
  ArbiterSnapshot snapshot;
  snapshot.set_in_gesture(true);
  snapshot.set_actively_dragging(true);
  snapshot.set_finger_count(3);

  struct {
    PointerEventType type;
    int button;
    int64_t user_data;
    ArbiterDecision expected;
  } records[] = {
    { kPointerEventButtonDown, MIDDRAG_BUTTON_MIDDLE, MIDDRAG_EVENT_TAG,
      kArbiterPassThrough },
    { kPointerEventDragged, MIDDRAG_BUTTON_MIDDLE, MIDDRAG_EVENT_TAG,
      kArbiterPassThrough },
    { kPointerEventButtonUp, MIDDRAG_BUTTON_MIDDLE, MIDDRAG_EVENT_TAG,
      kArbiterPassThrough },
    // The tag only exempts middle-button events.
    { kPointerEventButtonDown, MIDDRAG_BUTTON_LEFT, MIDDRAG_EVENT_TAG,
      kArbiterSuppress },
    { kPointerEventButtonDown, MIDDRAG_BUTTON_RIGHT, 0, kArbiterSuppress },
    { kPointerEventMoved, MIDDRAG_BUTTON_LEFT, 0, kArbiterSuppress },
    // Physical middle-button events are never suppressed.
    { kPointerEventButtonDown, MIDDRAG_BUTTON_MIDDLE, 0,
      kArbiterPassThrough },
  };
  for (size_t i = 0; i < arraysize(records); i++) {
    bool reenable = true;
    EXPECT_EQ(records[i].expected,
              arbiter.Arbitrate(MakeEvent(1.0, records[i].type,
                                          records[i].button,
                                          records[i].user_data),
                                &snapshot, &reenable)) << "record " << i;
    EXPECT_FALSE(reenable);
  }
}

TEST(EventArbiterTest, ForceClickTest) {
  EventArbiter arbiter;
  ArbiterSnapshot snapshot;
  snapshot.set_finger_count(3);

  EXPECT_EQ(kArbiterConvertToClick,
            arbiter.Arbitrate(MakeEvent(2.0, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              &snapshot, NULL));
  EXPECT_DOUBLE_EQ(2.0, snapshot.last_force_click_time());
  EXPECT_EQ(kArbiterSuppress,
            arbiter.Arbitrate(MakeEvent(2.1, kPointerEventButtonUp,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              &snapshot, NULL));
  EXPECT_DOUBLE_EQ(2.0, snapshot.last_force_click_time());

  // Right clicks and plain moves are ordinary traffic.
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(MakeEvent(2.2, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_RIGHT, 0),
                              &snapshot, NULL));
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(MakeEvent(2.2, kPointerEventMoved,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              &snapshot, NULL));

  // Two fingers: a normal click.
  snapshot.set_finger_count(2);
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(MakeEvent(3.0, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              &snapshot, NULL));

  // More than three fingers still convert.
  snapshot.set_finger_count(5);
  EXPECT_EQ(kArbiterConvertToClick,
            arbiter.Arbitrate(MakeEvent(4.0, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              &snapshot, NULL));
  EXPECT_DOUBLE_EQ(4.0, snapshot.last_force_click_time());
}

TEST(EventArbiterTest, ForceClickBlockedTest) {
  EventArbiter arbiter;
  ArbiterSnapshot snapshot;
  snapshot.set_finger_count(3);

  // During an active drag the click is swallowed, not converted.
  snapshot.set_in_gesture(true);
  snapshot.set_actively_dragging(true);
  EXPECT_EQ(kArbiterSuppress,
            arbiter.Arbitrate(MakeEvent(1.0, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              &snapshot, NULL));
  EXPECT_DOUBLE_EQ(0.0, snapshot.last_force_click_time());

  // A pass-through session leaves the click to the host.
  snapshot.Clear();
  snapshot.set_pass_through(true);
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(MakeEvent(1.0, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              &snapshot, NULL));
  EXPECT_DOUBLE_EQ(0.0, snapshot.last_force_click_time());
}

TEST(EventArbiterTest, PostGestureWindowTest) {
  EventArbiter arbiter;
  ArbiterSnapshot snapshot;
  PointerEvent late_click =
      MakeEvent(10.1, kPointerEventButtonDown, MIDDRAG_BUTTON_LEFT, 0);
  PointerEvent later_click =
      MakeEvent(10.2, kPointerEventButtonDown, MIDDRAG_BUTTON_LEFT, 0);

  // Ended in a tap or a completed drag.
  snapshot.set_in_gesture(true);
  snapshot.PublishGestureEnd(10.0, true);
  EXPECT_FALSE(snapshot.in_gesture());
  EXPECT_EQ(kArbiterSuppress, arbiter.Arbitrate(late_click, &snapshot, NULL));
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(later_click, &snapshot, NULL));
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(MakeEvent(10.05, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_MIDDLE, 0),
                              &snapshot, NULL));

  // Cancelled gestures open no window.
  snapshot.PublishGestureEnd(10.0, false);
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(late_click, &snapshot, NULL));
}

TEST(EventArbiterTest, ModifierTest) {
  EventArbiter arbiter;
  ArbiterSnapshot snapshot;
  snapshot.SetModifierRequirement(true, kModifierKeyControl);
  snapshot.set_in_gesture(true);

  PointerEvent event =
      MakeEvent(1.0, kPointerEventDragged, MIDDRAG_BUTTON_LEFT, 0);
  EXPECT_EQ(kArbiterPassThrough, arbiter.Arbitrate(event, &snapshot, NULL));
  event.modifiers = MIDDRAG_MODIFIER_CONTROL;
  EXPECT_EQ(kArbiterSuppress, arbiter.Arbitrate(event, &snapshot, NULL));

  snapshot.SetModifierRequirement(false, kModifierKeyControl);
  event.modifiers = 0;
  EXPECT_EQ(kArbiterSuppress, arbiter.Arbitrate(event, &snapshot, NULL));
}

TEST(EventArbiterTest, NullSnapshotTest) {
  EventArbiter arbiter;
  bool reenable = true;
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(MakeEvent(1.0, kPointerEventButtonDown,
                                        MIDDRAG_BUTTON_LEFT, 0),
                              NULL, &reenable));
  EXPECT_FALSE(reenable);
  EXPECT_EQ(kArbiterPassThrough,
            arbiter.Arbitrate(
                MakeEvent(1.0, kPointerEventInterceptionDisabledByTimeout,
                          0, 0),
                NULL, &reenable));
  EXPECT_TRUE(reenable);
}

TEST(EventArbiterTest, SnapshotClearTest) {
  ArbiterSnapshot snapshot;
  snapshot.SetModifierRequirement(true, kModifierKeyCommand);
  snapshot.set_in_gesture(true);
  snapshot.set_actively_dragging(true);
  snapshot.set_pass_through(true);
  snapshot.set_last_force_click_time(3.0);
  snapshot.PublishGestureEnd(4.0, true);
  snapshot.set_in_gesture(true);

  snapshot.Clear();
  EXPECT_FALSE(snapshot.in_gesture());
  EXPECT_FALSE(snapshot.actively_dragging());
  EXPECT_FALSE(snapshot.pass_through());
  EXPECT_FALSE(snapshot.last_gesture_was_active());
  EXPECT_DOUBLE_EQ(0.0, snapshot.last_force_click_time());
  // The modifier requirement is configuration and survives.
  EXPECT_FALSE(snapshot.ModifierSatisfied(0));
  EXPECT_TRUE(snapshot.ModifierSatisfied(MIDDRAG_MODIFIER_COMMAND));
}

TEST(EventArbiterTest, DecisionNameTest) {
  EXPECT_STREQ("PassThrough", ArbiterDecisionName(kArbiterPassThrough));
  EXPECT_STREQ("Suppress", ArbiterDecisionName(kArbiterSuppress));
  EXPECT_STREQ("ConvertToClick", ArbiterDecisionName(kArbiterConvertToClick));
}

}  // namespace middrag
