// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <vector>

#include <base/macros.h>
#include <gtest/gtest.h>

#include "middrag/include/gesture_recognizer.h"
#include "middrag/include/util.h"

using std::vector;

namespace middrag {

class GestureRecognizerTest : public ::testing::Test {};

namespace {

struct FrameRecord {
  stime_t now;
  int count;
  float x, y;
  unsigned modifiers;
};

FilteredContacts MakeContacts(int count, float x, float y) {
  FilteredContacts ret;
  for (int i = 0; i < count; i++) {
    Contact contact = {
      x, y, 0.0, 0.0, 0.5, 8.0, 8.0, MIDDRAG_PHASE_TOUCHING, i
    };
    ret.contacts.push_back(contact);
  }
  if (count > 0)
    ret.centroid = MakePoint(x, y);
  return ret;
}

// Feeds |frames| in order and returns every event produced.
vector<GestureEvent> Run(GestureRecognizer* recognizer,
                         const GestureConfiguration& config,
                         const FrameRecord* frames,
                         size_t frame_cnt) {
  vector<GestureEvent> events;
  for (size_t i = 0; i < frame_cnt; i++) {
    const FrameRecord& frame = frames[i];
    recognizer->Process(MakeContacts(frame.count, frame.x, frame.y), config,
                        frame.now, frame.modifiers, &events);
  }
  return events;
}

void ProcessOne(GestureRecognizer* recognizer,
                const GestureConfiguration& config,
                stime_t now, int count, float x, float y,
                vector<GestureEvent>* events) {
  recognizer->Process(MakeContacts(count, x, y), config, now, 0, events);
}

}  // namespace {}

TEST(GestureRecognizerTest, TapTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  FrameRecord frames[] = {
    { 0.00, 3, 0.5, 0.5, 0 },
    { 0.04, 3, 0.5, 0.5, 0 },
    { 0.08, 0, 0.0, 0.0, 0 },
    { 0.10, 0, 0.0, 0.0, 0 },
    { 0.12, 0, 0.0, 0.0, 0 },
  };
  vector<GestureEvent> events =
      Run(&recognizer, config, frames, arraysize(frames));
  ASSERT_EQ(2, events.size());
  EXPECT_EQ(kGestureEventStart, events[0].type);
  EXPECT_DOUBLE_EQ(0.0, events[0].timestamp);
  EXPECT_FLOAT_EQ(0.5, events[0].details.start.position.x);
  EXPECT_EQ(kGestureEventTap, events[1].type);
  EXPECT_DOUBLE_EQ(0.10, events[1].timestamp);
  EXPECT_TRUE(events[1].IsTerminal());
  EXPECT_EQ(kGestureStateIdle, recognizer.state());
}

// Elapsed time is measured at the second under-count frame.
TEST(GestureRecognizerTest, TapBoundaryTest) {
  GestureConfiguration config;
  {
    GestureRecognizer recognizer;
    FrameRecord frames[] = {
      { 1.00, 3, 0.5, 0.5, 0 },
      { 1.10, 1, 0.5, 0.5, 0 },
      { 1.15, 0, 0.0, 0.0, 0 },
    };
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    ASSERT_EQ(2, events.size());
    EXPECT_EQ(kGestureEventTap, events[1].type);
  }
  {
    GestureRecognizer recognizer;
    FrameRecord frames[] = {
      { 1.00, 3, 0.5, 0.5, 0 },
      { 1.10, 1, 0.5, 0.5, 0 },
      { 1.20, 0, 0.0, 0.0, 0 },
    };
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    // Too slow: the session ends silently.
    ASSERT_EQ(1, events.size());
    EXPECT_EQ(kGestureEventStart, events[0].type);
    EXPECT_EQ(kGestureStateIdle, recognizer.state());
  }
}

TEST(GestureRecognizerTest, MaxTapHoldTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  config.tap_threshold = 1.0;
  config.max_tap_hold_duration = 0.5;
  FrameRecord frames[] = {
    { 0.0, 3, 0.5, 0.5, 0 },
    { 0.3, 3, 0.5, 0.5, 0 },
    { 0.5, 0, 0.0, 0.0, 0 },
    { 0.6, 0, 0.0, 0.0, 0 },
    // A quick second tap is accepted again.
    { 1.0, 3, 0.5, 0.5, 0 },
    { 1.1, 0, 0.0, 0.0, 0 },
    { 1.2, 0, 0.0, 0.0, 0 },
  };
  vector<GestureEvent> events =
      Run(&recognizer, config, frames, arraysize(frames));
  ASSERT_EQ(3, events.size());
  EXPECT_EQ(kGestureEventStart, events[0].type);
  EXPECT_EQ(kGestureEventStart, events[1].type);
  EXPECT_EQ(kGestureEventTap, events[2].type);
  EXPECT_DOUBLE_EQ(1.2, events[2].timestamp);
}

TEST(GestureRecognizerTest, DragTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  FrameRecord frames[] = {
    { 0.00, 3, 0.50, 0.5, 0 },
    { 0.01, 3, 0.51, 0.5, 0 },  // below onset threshold
    { 0.02, 3, 0.52, 0.5, 0 },  // begins dragging
    { 0.03, 3, 0.53, 0.5, 0 },
    { 0.04, 3, 0.53, 0.5, 0 },  // no movement, no update
    { 0.05, 3, 0.54, 0.51, 0 },
    { 0.06, 2, 0.54, 0.51, 0 },
    { 0.07, 0, 0.00, 0.0, 0 },
  };
  vector<GestureEvent> events =
      Run(&recognizer, config, frames, arraysize(frames));
  ASSERT_EQ(5, events.size());
  EXPECT_EQ(kGestureEventStart, events[0].type);
  EXPECT_EQ(kGestureEventBeginDragging, events[1].type);
  EXPECT_DOUBLE_EQ(0.02, events[1].timestamp);

  EXPECT_EQ(kGestureEventUpdateDragging, events[2].type);
  EXPECT_FLOAT_EQ(0.53, events[2].details.drag.centroid.x);
  EXPECT_FLOAT_EQ(0.52, events[2].details.drag.last_position.x);
  EXPECT_FLOAT_EQ(0.50, events[2].details.drag.start_position.x);
  EXPECT_EQ(3, events[2].details.drag.finger_cnt);

  EXPECT_EQ(kGestureEventUpdateDragging, events[3].type);
  EXPECT_FLOAT_EQ(0.53, events[3].details.drag.last_position.x);
  EXPECT_FLOAT_EQ(0.51, events[3].details.drag.centroid.y);

  EXPECT_EQ(kGestureEventEndDragging, events[4].type);
  EXPECT_DOUBLE_EQ(0.07, events[4].timestamp);
  EXPECT_EQ(kGestureStateIdle, recognizer.state());
}

TEST(GestureRecognizerTest, DragOnsetInOneFrameTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  FrameRecord frames[] = {
    { 0.000, 3, 0.500, 0.5, 0 },
    { 0.011, 3, 0.525, 0.5, 0 },
  };
  vector<GestureEvent> events =
      Run(&recognizer, config, frames, arraysize(frames));
  ASSERT_EQ(2, events.size());
  EXPECT_EQ(kGestureEventBeginDragging, events[1].type);
  EXPECT_EQ(kGestureStateDragging, recognizer.state());
}

TEST(GestureRecognizerTest, DragOnsetBoundaryTest) {
  GestureConfiguration config;
  config.move_threshold = 0.02;
  struct {
    float x, y;
    bool drags;
  } records[] = {
    { 0.52, 0.50, true },
    { 0.48, 0.50, true },
    { 0.50, 0.52, true },
    { 0.50, 0.48, true },
    { 0.519, 0.50, false },
    { 0.50, 0.481, false },
  };
  for (size_t i = 0; i < arraysize(records); i++) {
    GestureRecognizer recognizer;
    vector<GestureEvent> events;
    ProcessOne(&recognizer, config, 0.00, 3, 0.5, 0.5, &events);
    ProcessOne(&recognizer, config, 0.01, 3, records[i].x, records[i].y,
               &events);
    if (records[i].drags) {
      ASSERT_EQ(2, events.size()) << "record " << i;
      EXPECT_EQ(kGestureEventBeginDragging, events[1].type) << "record " << i;
      EXPECT_EQ(kGestureStateDragging, recognizer.state()) << "record " << i;
    } else {
      EXPECT_EQ(1, events.size()) << "record " << i;
      EXPECT_EQ(kGestureStatePossibleTap, recognizer.state())
          << "record " << i;
    }
  }
}

TEST(GestureRecognizerTest, TimeAloneNeverDragsTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  vector<GestureEvent> events;
  for (int i = 0; i <= 500; i++)
    ProcessOne(&recognizer, config, i * 0.01, 3, 0.5, 0.5, &events);
  ASSERT_EQ(1, events.size());
  EXPECT_EQ(kGestureStatePossibleTap, recognizer.state());

  ProcessOne(&recognizer, config, 5.02, 0, 0.0, 0.0, &events);
  ProcessOne(&recognizer, config, 5.03, 0, 0.0, 0.0, &events);
  // Held far longer than a tap.
  EXPECT_EQ(1, events.size());
  EXPECT_EQ(kGestureStateIdle, recognizer.state());
}

TEST(GestureRecognizerTest, ExcessFingersCancelTest) {
  GestureConfiguration config;
  {
    GestureRecognizer recognizer;
    FrameRecord frames[] = {
      { 0.00, 3, 0.5, 0.5, 0 },
      { 0.02, 4, 0.5, 0.5, 0 },
    };
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    ASSERT_EQ(2, events.size());
    EXPECT_EQ(kGestureEventCancel, events[1].type);
    EXPECT_DOUBLE_EQ(0.02, events[1].timestamp);
  }
  {
    GestureRecognizer recognizer;
    FrameRecord frames[] = {
      { 0.00, 3, 0.50, 0.5, 0 },
      { 0.01, 3, 0.52, 0.5, 0 },
      { 0.02, 5, 0.52, 0.5, 0 },
      { 0.03, 5, 0.52, 0.5, 0 },
    };
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    ASSERT_EQ(3, events.size());
    EXPECT_EQ(kGestureEventBeginDragging, events[1].type);
    EXPECT_EQ(kGestureEventCancelDragging, events[2].type);
    EXPECT_EQ(kGestureStateIdle, recognizer.state());
  }
}

TEST(GestureRecognizerTest, CooldownSetByExcessFingersTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  vector<GestureEvent> events;

  // Four fingers while idle start nothing and set nothing.
  ProcessOne(&recognizer, config, 0.00, 4, 0.5, 0.5, &events);
  EXPECT_FALSE(recognizer.cooldown_);
  EXPECT_TRUE(events.empty());

  ProcessOne(&recognizer, config, 0.01, 0, 0.0, 0.0, &events);
  ProcessOne(&recognizer, config, 0.02, 3, 0.5, 0.5, &events);
  ProcessOne(&recognizer, config, 0.03, 4, 0.5, 0.5, &events);
  EXPECT_TRUE(recognizer.cooldown_);
  ASSERT_EQ(2, events.size());
  EXPECT_EQ(kGestureEventCancel, events[1].type);

  // Dropping back to exactly three fingers clears the cooldown and starts a
  // fresh session.
  ProcessOne(&recognizer, config, 0.04, 3, 0.5, 0.5, &events);
  EXPECT_FALSE(recognizer.cooldown_);
  ASSERT_EQ(3, events.size());
  EXPECT_EQ(kGestureEventStart, events[2].type);
  EXPECT_EQ(kGestureStatePossibleTap, recognizer.state());
}

TEST(GestureRecognizerTest, CooldownClearedOnUnderCountTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  vector<GestureEvent> events;

  ProcessOne(&recognizer, config, 0.00, 3, 0.5, 0.5, &events);
  ProcessOne(&recognizer, config, 0.01, 4, 0.5, 0.5, &events);
  EXPECT_TRUE(recognizer.cooldown_);
  // Still four: remains set.
  ProcessOne(&recognizer, config, 0.02, 4, 0.5, 0.5, &events);
  EXPECT_TRUE(recognizer.cooldown_);
  ProcessOne(&recognizer, config, 0.03, 2, 0.5, 0.5, &events);
  EXPECT_FALSE(recognizer.cooldown_);
  EXPECT_EQ(kGestureStateIdle, recognizer.state());
  EXPECT_EQ(2, events.size());
}

TEST(GestureRecognizerTest, LargeJumpDuringPossibleTapTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  vector<GestureEvent> events;

  ProcessOne(&recognizer, config, 0.00, 3, 0.50, 0.5, &events);
  // A finger landed late and dragged the centroid along.
  ProcessOne(&recognizer, config, 0.01, 3, 0.55, 0.5, &events);
  EXPECT_EQ(1, events.size());
  EXPECT_EQ(kGestureStatePossibleTap, recognizer.state());
  EXPECT_FLOAT_EQ(0.55, recognizer.start_position_.x);
  EXPECT_FLOAT_EQ(0.55, recognizer.last_centroid_.x);

  // Measured from the new reference, this is below the onset threshold.
  ProcessOne(&recognizer, config, 0.02, 3, 0.56, 0.5, &events);
  EXPECT_EQ(1, events.size());
  EXPECT_EQ(kGestureStatePossibleTap, recognizer.state());
}

TEST(GestureRecognizerTest, LargeJumpDuringDragTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  config.allow_relift_during_drag = true;
  FrameRecord frames[] = {
    { 0.00, 3, 0.50, 0.50, 0 },
    { 0.01, 3, 0.52, 0.50, 0 },  // begin
    { 0.02, 2, 0.52, 0.60, 0 },  // jump: swallowed
    { 0.03, 2, 0.53, 0.60, 0 },
  };
  vector<GestureEvent> events =
      Run(&recognizer, config, frames, arraysize(frames));
  ASSERT_EQ(3, events.size());
  EXPECT_EQ(kGestureEventBeginDragging, events[1].type);
  EXPECT_EQ(kGestureEventUpdateDragging, events[2].type);
  EXPECT_FLOAT_EQ(0.52, events[2].details.drag.last_position.x);
  EXPECT_FLOAT_EQ(0.60, events[2].details.drag.last_position.y);
  EXPECT_EQ(2, events[2].details.drag.finger_cnt);
  // The drag origin is not moved by jumps once dragging.
  EXPECT_FLOAT_EQ(0.50, events[2].details.drag.start_position.x);
}

TEST(GestureRecognizerTest, ReliftTest) {
  FrameRecord frames[] = {
    { 0.00, 3, 0.50, 0.5, 0 },
    { 0.01, 3, 0.52, 0.5, 0 },  // begin
    { 0.02, 2, 0.53, 0.5, 0 },
    { 0.03, 2, 0.54, 0.5, 0 },
    { 0.04, 3, 0.55, 0.5, 0 },
  };
  GestureConfiguration config;
  {
    GestureRecognizer recognizer;
    config.allow_relift_during_drag = false;
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    // Two frames of two fingers end the drag; the fresh three-finger frame
    // starts a new session.
    ASSERT_EQ(4, events.size());
    EXPECT_EQ(kGestureEventBeginDragging, events[1].type);
    EXPECT_EQ(kGestureEventEndDragging, events[2].type);
    EXPECT_DOUBLE_EQ(0.03, events[2].timestamp);
    EXPECT_EQ(kGestureEventStart, events[3].type);
  }
  {
    GestureRecognizer recognizer;
    config.allow_relift_during_drag = true;
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    ASSERT_EQ(5, events.size());
    EXPECT_EQ(kGestureEventBeginDragging, events[1].type);
    for (size_t i = 2; i < events.size(); i++)
      EXPECT_EQ(kGestureEventUpdateDragging, events[i].type) << i;
    EXPECT_EQ(kGestureStateDragging, recognizer.state());
  }
}

// With relift on, one finger or none still ends the drag after two frames.
TEST(GestureRecognizerTest, ReliftBelowTwoFingersTest) {
  GestureConfiguration config;
  config.allow_relift_during_drag = true;
  int counts[] = { 1, 0 };
  for (size_t i = 0; i < arraysize(counts); i++) {
    GestureRecognizer recognizer;
    vector<GestureEvent> events;
    ProcessOne(&recognizer, config, 0.00, 3, 0.50, 0.5, &events);
    ProcessOne(&recognizer, config, 0.01, 3, 0.52, 0.5, &events);
    ASSERT_EQ(kGestureStateDragging, recognizer.state());

    ProcessOne(&recognizer, config, 0.02, counts[i], 0.52, 0.5, &events);
    EXPECT_EQ(2, events.size()) << counts[i] << " fingers";
    EXPECT_EQ(kGestureStateDragging, recognizer.state());

    ProcessOne(&recognizer, config, 0.03, counts[i], 0.52, 0.5, &events);
    ASSERT_EQ(3, events.size()) << counts[i] << " fingers";
    EXPECT_EQ(kGestureEventEndDragging, events[2].type);
    EXPECT_DOUBLE_EQ(0.03, events[2].timestamp);
    EXPECT_EQ(kGestureStateIdle, recognizer.state());
  }
}

// Relift only applies once dragging.
TEST(GestureRecognizerTest, ReliftDuringPossibleTapTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  config.allow_relift_during_drag = true;
  FrameRecord frames[] = {
    { 0.00, 3, 0.5, 0.5, 0 },
    { 0.02, 2, 0.5, 0.5, 0 },
    { 0.04, 2, 0.5, 0.5, 0 },
  };
  vector<GestureEvent> events =
      Run(&recognizer, config, frames, arraysize(frames));
  ASSERT_EQ(2, events.size());
  EXPECT_EQ(kGestureEventTap, events[1].type);
}

TEST(GestureRecognizerTest, StableFrameCounterTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  vector<GestureEvent> events;

  ProcessOne(&recognizer, config, 0.00, 3, 0.50, 0.5, &events);
  ProcessOne(&recognizer, config, 0.01, 3, 0.52, 0.5, &events);
  ASSERT_EQ(kGestureStateDragging, recognizer.state());

  // A single dropped frame is noise.
  ProcessOne(&recognizer, config, 0.02, 1, 0.52, 0.5, &events);
  EXPECT_EQ(1, recognizer.stable_frame_count_);
  EXPECT_EQ(kGestureStateDragging, recognizer.state());
  ProcessOne(&recognizer, config, 0.03, 3, 0.53, 0.5, &events);
  EXPECT_EQ(0, recognizer.stable_frame_count_);
  EXPECT_EQ(kGestureStateDragging, recognizer.state());
  ASSERT_EQ(3, events.size());
  EXPECT_EQ(kGestureEventUpdateDragging, events[2].type);

  ProcessOne(&recognizer, config, 0.04, 1, 0.53, 0.5, &events);
  ProcessOne(&recognizer, config, 0.05, 1, 0.53, 0.5, &events);
  EXPECT_EQ(0, recognizer.stable_frame_count_);
  EXPECT_EQ(kGestureStateIdle, recognizer.state());
  ASSERT_EQ(4, events.size());
  EXPECT_EQ(kGestureEventEndDragging, events[3].type);
}

TEST(GestureRecognizerTest, ModifierTest) {
  GestureConfiguration config;
  config.require_modifier_key = true;
  config.modifier_key_type = kModifierKeyOption;
  {
    GestureRecognizer recognizer;
    FrameRecord frames[] = {
      { 0.00, 3, 0.5, 0.5, MIDDRAG_MODIFIER_SHIFT },
      { 0.01, 3, 0.5, 0.5, 0 },
      { 0.02, 3, 0.5, 0.5, MIDDRAG_MODIFIER_OPTION | MIDDRAG_MODIFIER_SHIFT },
      { 0.03, 3, 0.5, 0.5, 0 },  // released
    };
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    ASSERT_EQ(2, events.size());
    EXPECT_EQ(kGestureEventStart, events[0].type);
    EXPECT_DOUBLE_EQ(0.02, events[0].timestamp);
    EXPECT_EQ(kGestureEventCancel, events[1].type);
    EXPECT_DOUBLE_EQ(0.03, events[1].timestamp);
    EXPECT_EQ(kGestureStateIdle, recognizer.state());
  }
  {
    GestureRecognizer recognizer;
    FrameRecord frames[] = {
      { 0.00, 3, 0.50, 0.5, MIDDRAG_MODIFIER_OPTION },
      { 0.01, 3, 0.52, 0.5, MIDDRAG_MODIFIER_OPTION },
      { 0.02, 3, 0.53, 0.5, 0 },
    };
    vector<GestureEvent> events =
        Run(&recognizer, config, frames, arraysize(frames));
    ASSERT_EQ(3, events.size());
    EXPECT_EQ(kGestureEventBeginDragging, events[1].type);
    EXPECT_EQ(kGestureEventCancelDragging, events[2].type);
  }
}

TEST(GestureRecognizerTest, DeterminismTest) {
  GestureConfiguration config;
  config.allow_relift_during_drag = true;
  FrameRecord frames[] = {
    { 0.00, 2, 0.40, 0.40, 0 },
    { 0.01, 3, 0.50, 0.50, 0 },
    { 0.02, 3, 0.51, 0.49, 0 },
    { 0.03, 3, 0.53, 0.48, 0 },
    { 0.04, 2, 0.55, 0.47, 0 },
    { 0.05, 3, 0.56, 0.52, 0 },
    { 0.06, 4, 0.56, 0.52, 0 },
    { 0.07, 3, 0.56, 0.52, 0 },
    { 0.08, 0, 0.00, 0.00, 0 },
    { 0.09, 0, 0.00, 0.00, 0 },
  };
  GestureRecognizer first, second;
  vector<GestureEvent> a = Run(&first, config, frames, arraysize(frames));
  vector<GestureEvent> b = Run(&second, config, frames, arraysize(frames));
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); i++)
    EXPECT_TRUE(a[i] == b[i]) << a[i].String() << " vs " << b[i].String();
  EXPECT_EQ(first.state(), second.state());
}

TEST(GestureRecognizerTest, ResetTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  vector<GestureEvent> events;
  ProcessOne(&recognizer, config, 0.00, 3, 0.50, 0.5, &events);
  ProcessOne(&recognizer, config, 0.01, 3, 0.52, 0.5, &events);
  recognizer.set_pass_through(true);
  ASSERT_TRUE(recognizer.IsActive());

  recognizer.Reset();
  EXPECT_EQ(2, events.size());
  EXPECT_EQ(kGestureStateIdle, recognizer.state());
  EXPECT_FALSE(recognizer.IsActive());
  EXPECT_FALSE(recognizer.pass_through());
}

TEST(GestureRecognizerTest, PassThroughEndsWithSessionTest) {
  GestureRecognizer recognizer;
  GestureConfiguration config;
  vector<GestureEvent> events;
  ProcessOne(&recognizer, config, 0.00, 3, 0.5, 0.5, &events);
  recognizer.set_pass_through(true);
  ProcessOne(&recognizer, config, 0.01, 3, 0.5, 0.5, &events);
  EXPECT_TRUE(recognizer.pass_through());
  ProcessOne(&recognizer, config, 0.02, 0, 0.0, 0.0, &events);
  ProcessOne(&recognizer, config, 0.03, 0, 0.0, 0.0, &events);
  EXPECT_FALSE(recognizer.pass_through());
}

TEST(GestureRecognizerTest, StateNameTest) {
  EXPECT_STREQ("Idle", GestureStateName(kGestureStateIdle));
  EXPECT_STREQ("PossibleTap", GestureStateName(kGestureStatePossibleTap));
  EXPECT_STREQ("Dragging", GestureStateName(kGestureStateDragging));
  EXPECT_FALSE(GestureStateIsActive(kGestureStateWaitingForRelease));
  EXPECT_TRUE(GestureStateIsActive(kGestureStateDragging));
}

}  // namespace middrag
