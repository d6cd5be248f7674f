// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <base/synchronization/waitable_event.h>
#include <gtest/gtest.h>

#include "middrag/include/arbiter_snapshot.h"
#include "middrag/include/event_arbiter.h"
#include "middrag/include/gesture_configuration.h"
#include "middrag/include/middrag.h"
#include "middrag/include/util.h"

using std::map;
using std::pair;
using std::string;
using std::vector;

namespace middrag {

class MiddragEngineTest : public ::testing::Test {};

namespace {

// Records every sink call. Written on the processing context and read by
// the test after WaitForIdle().
struct RecordingSink {
  RecordingSink()
      : begin_cnt(0), update_cnt(0), end_cnt(0), cancel_cnt(0), click_cnt(0),
        force_release_cnt(0), begin_at(MakePoint(0.0, 0.0)) {}
  int begin_cnt;
  int update_cnt;
  int end_cnt;
  int cancel_cnt;
  int click_cnt;
  int force_release_cnt;
  GesturePoint begin_at;
  vector<pair<double, double> > deltas;
};

void SinkBeginDrag(void* data, GesturePoint at) {
  RecordingSink* sink = reinterpret_cast<RecordingSink*>(data);
  sink->begin_cnt++;
  sink->begin_at = at;
}

void SinkUpdateDrag(void* data, double dx, double dy) {
  RecordingSink* sink = reinterpret_cast<RecordingSink*>(data);
  sink->update_cnt++;
  sink->deltas.push_back(std::make_pair(dx, dy));
}

void SinkEndDrag(void* data) {
  reinterpret_cast<RecordingSink*>(data)->end_cnt++;
}

void SinkCancelDrag(void* data) {
  reinterpret_cast<RecordingSink*>(data)->cancel_cnt++;
}

void SinkClick(void* data) {
  reinterpret_cast<RecordingSink*>(data)->click_cnt++;
}

void SinkForceRelease(void* data) {
  reinterpret_cast<RecordingSink*>(data)->force_release_cnt++;
}

const MiddragDragSink kRecordingSink = {
  SinkBeginDrag,
  SinkUpdateDrag,
  SinkEndDrag,
  SinkCancelDrag,
  SinkClick,
  SinkForceRelease
};

struct FakeHost {
  FakeHost()
      : cursor(MakePoint(100.0, 200.0)), reserved(false), large_enough(true),
        desktop(false), reserved_height(0.0) {}
  GesturePoint cursor;
  bool reserved;
  bool large_enough;
  bool desktop;
  double reserved_height;
};

GesturePoint HostCursor(void* data) {
  return reinterpret_cast<FakeHost*>(data)->cursor;
}

int HostInReservedRegion(void* data, GesturePoint point,
                         double title_bar_height) {
  FakeHost* host = reinterpret_cast<FakeHost*>(data);
  host->reserved_height = title_bar_height;
  return host->reserved;
}

int HostMeetsMinimumWindowSize(void* data, GesturePoint point,
                               double min_width, double min_height) {
  return reinterpret_cast<FakeHost*>(data)->large_enough;
}

int HostOverDesktop(void* data, GesturePoint point) {
  return reinterpret_cast<FakeHost*>(data)->desktop;
}

const MiddragHostProvider kFakeHost = {
  HostCursor,
  HostInReservedRegion,
  HostMeetsMinimumWindowSize,
  HostOverDesktop
};

void RecordEvent(void* client_data, const GestureEvent* event) {
  reinterpret_cast<vector<GestureEvent>*>(client_data)->push_back(*event);
}

const int kMaxFingers = 5;

// Fingers in a row starting left of (|x|, |y|), so the first three are
// centered on it. |cnt| of them are reported.
struct FingerFrame {
  FingerFrame(stime_t now, int cnt, float x, float y) {
    for (int i = 0; i < kMaxFingers; i++) {
      Contact contact = {
        x + (i - 1) * 0.05f, y, 0.0, 0.0, 0.5, 8.0, 8.0,
        MIDDRAG_PHASE_TOUCHING, i + 1
      };
      contacts[i] = contact;
    }
    frame.timestamp = now;
    frame.contact_cnt = cnt;
    frame.modifiers = 0;
    frame.contacts = contacts;
  }
  Contact contacts[kMaxFingers];
  TouchFrame frame;
};

void Supply(MiddragEngine* engine, stime_t now, int cnt, float x, float y) {
  FingerFrame finger_frame(now, cnt, x, y);
  engine->SupplyFrame(finger_frame.frame);
}

PointerEvent MakePointerEvent(stime_t now, PointerEventType type,
                              int button) {
  PointerEvent event = { now, type, button, 0, 0 };
  return event;
}

// Sets up an engine wired to the recording tables.
class EngineHarness {
 public:
  EngineHarness() : engine_(MIDDRAG_VERSION) {
    engine_.set_callback(RecordEvent, &events_);
    engine_.SetDragSink(&kRecordingSink, &sink_);
    engine_.SetHostProvider(&kFakeHost, &host_);
  }

  MiddragEngine* engine() { return &engine_; }

  RecordingSink sink_;
  FakeHost host_;
  vector<GestureEvent> events_;

 private:
  MiddragEngine engine_;
};

}  // namespace {}

TEST(MiddragEngineTest, VersionTest) {
  EXPECT_TRUE(NewMiddragEngineImpl(0) == NULL);
  EXPECT_TRUE(NewMiddragEngineImpl(MIDDRAG_VERSION + 1) == NULL);
  MiddragEngine* engine = NewMiddragEngine();
  ASSERT_TRUE(engine != NULL);
  EXPECT_TRUE(engine->enabled());
  DeleteMiddragEngine(engine);
}

TEST(MiddragEngineTest, TapClickTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  Supply(engine, 0.00, 3, 0.5, 0.5);
  Supply(engine, 0.03, 3, 0.5, 0.5);
  Supply(engine, 0.06, 0, 0.5, 0.5);
  Supply(engine, 0.08, 0, 0.5, 0.5);
  engine->WaitForIdle();

  ASSERT_EQ(2, harness.events_.size());
  EXPECT_EQ(kGestureEventStart, harness.events_[0].type);
  EXPECT_EQ(kGestureEventTap, harness.events_[1].type);
  EXPECT_EQ(1, harness.sink_.click_cnt);
  EXPECT_EQ(0, harness.sink_.begin_cnt);

  const ArbiterSnapshot& snapshot = engine->snapshot();
  EXPECT_EQ(0, snapshot.finger_count());
  EXPECT_FALSE(snapshot.in_gesture());
  EXPECT_TRUE(snapshot.last_gesture_was_active());
  EXPECT_DOUBLE_EQ(0.08, snapshot.last_gesture_end_time());

  // Stray clicks right after the tap are swallowed, later ones are not.
  bool reenable = true;
  EXPECT_EQ(kArbiterSuppress,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.10, kPointerEventButtonDown,
                                 MIDDRAG_BUTTON_LEFT), &reenable));
  EXPECT_FALSE(reenable);
  EXPECT_EQ(kArbiterPassThrough,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.30, kPointerEventButtonDown,
                                 MIDDRAG_BUTTON_LEFT), &reenable));
}

TEST(MiddragEngineTest, DragTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  Supply(engine, 0.00, 3, 0.50, 0.5);
  Supply(engine, 0.01, 3, 0.52, 0.5);
  engine->WaitForIdle();

  EXPECT_EQ(1, harness.sink_.begin_cnt);
  EXPECT_FLOAT_EQ(100.0, harness.sink_.begin_at.x);
  EXPECT_FLOAT_EQ(200.0, harness.sink_.begin_at.y);
  EXPECT_TRUE(engine->snapshot().in_gesture());
  EXPECT_TRUE(engine->snapshot().actively_dragging());

  Supply(engine, 0.02, 3, 0.53, 0.505);
  Supply(engine, 0.03, 0, 0.53, 0.505);
  Supply(engine, 0.04, 0, 0.53, 0.505);
  engine->WaitForIdle();

  ASSERT_EQ(1, harness.sink_.update_cnt);
  // One percent of the surface is 16 px; surface y up is screen y down.
  EXPECT_NEAR(16.0, harness.sink_.deltas[0].first, 0.01);
  EXPECT_NEAR(-8.0, harness.sink_.deltas[0].second, 0.01);
  EXPECT_EQ(1, harness.sink_.end_cnt);
  EXPECT_EQ(0, harness.sink_.cancel_cnt);
  EXPECT_EQ(0, harness.sink_.click_cnt);
  EXPECT_FALSE(engine->snapshot().actively_dragging());
  EXPECT_TRUE(engine->snapshot().last_gesture_was_active());

  ASSERT_EQ(4, harness.events_.size());
  EXPECT_EQ(kGestureEventEndDragging, harness.events_[3].type);
}

TEST(MiddragEngineTest, SensitivityScalesDeltaTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  GestureConfiguration config;
  config.sensitivity = 2.0;
  config.velocity_boost_enabled = false;
  engine->SetConfiguration(config);

  Supply(engine, 0.00, 3, 0.50, 0.5);
  Supply(engine, 0.01, 3, 0.52, 0.5);
  Supply(engine, 0.02, 3, 0.53, 0.5);
  engine->WaitForIdle();

  ASSERT_EQ(1, harness.sink_.update_cnt);
  // Sensitivity applies in the frame delta and again in pixel scaling.
  EXPECT_NEAR(64.0, harness.sink_.deltas[0].first, 0.01);
  EXPECT_NEAR(0.0, harness.sink_.deltas[0].second, 0.01);
}

TEST(MiddragEngineTest, CancelDraggingTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  Supply(engine, 0.00, 3, 0.50, 0.5);
  Supply(engine, 0.01, 3, 0.52, 0.5);
  Supply(engine, 0.02, 4, 0.52, 0.5);
  engine->WaitForIdle();

  EXPECT_EQ(1, harness.sink_.begin_cnt);
  EXPECT_EQ(1, harness.sink_.cancel_cnt);
  EXPECT_EQ(0, harness.sink_.end_cnt);
  EXPECT_FALSE(engine->snapshot().last_gesture_was_active());
  EXPECT_FALSE(engine->snapshot().actively_dragging());
  // A cancelled gesture opens no suppression window.
  EXPECT_EQ(kArbiterPassThrough,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.03, kPointerEventButtonDown,
                                 MIDDRAG_BUTTON_RIGHT), NULL));
}

TEST(MiddragEngineTest, ForceClickTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  // The finger count is published before the frame is processed.
  Supply(engine, 1.0, 3, 0.5, 0.5);
  EXPECT_EQ(3, engine->snapshot().finger_count());

  EXPECT_EQ(kArbiterConvertToClick,
            engine->ArbitratePointerEvent(
                MakePointerEvent(1.01, kPointerEventButtonDown,
                                 MIDDRAG_BUTTON_LEFT), NULL));
  EXPECT_EQ(1, harness.sink_.click_cnt);
  EXPECT_DOUBLE_EQ(1.01, engine->snapshot().last_force_click_time());
  EXPECT_EQ(kArbiterSuppress,
            engine->ArbitratePointerEvent(
                MakePointerEvent(1.05, kPointerEventButtonUp,
                                 MIDDRAG_BUTTON_LEFT), NULL));
  EXPECT_EQ(1, harness.sink_.click_cnt);
  engine->WaitForIdle();
}

namespace {

// Holds the processing context inside the reserved-region query, which runs
// before a new session publishes its gesture flags.
struct GatedHost {
  GatedHost()
      : entered(base::WaitableEvent::ResetPolicy::MANUAL,
                base::WaitableEvent::InitialState::NOT_SIGNALED),
        release(base::WaitableEvent::ResetPolicy::MANUAL,
                base::WaitableEvent::InitialState::NOT_SIGNALED) {}
  base::WaitableEvent entered;
  base::WaitableEvent release;
};

int GatedInReservedRegion(void* data, GesturePoint point,
                          double title_bar_height) {
  GatedHost* host = reinterpret_cast<GatedHost*>(data);
  host->entered.Signal();
  host->release.Wait();
  return 0;
}

const MiddragHostProvider kGatedHost = {
  NULL,
  GatedInReservedRegion,
  NULL,
  NULL
};

}  // namespace {}

// The finger count is published on capture, the gesture flags only once the
// frame is processed. Events arriving in between are judged on the count
// alone: a right click there still passes.
TEST(MiddragEngineTest, GestureFlagsLagFingerCountTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  GatedHost gated;
  engine->SetHostProvider(&kGatedHost, &gated);
  GestureConfiguration config;
  config.pass_through_title_bar = true;
  engine->SetConfiguration(config);

  Supply(engine, 0.0, 3, 0.5, 0.5);
  gated.entered.Wait();
  int fingers = engine->snapshot().finger_count();
  bool in_gesture = engine->snapshot().in_gesture();
  ArbiterDecision early = engine->ArbitratePointerEvent(
      MakePointerEvent(0.001, kPointerEventButtonDown, MIDDRAG_BUTTON_RIGHT),
      NULL);
  gated.release.Signal();
  engine->WaitForIdle();

  EXPECT_EQ(3, fingers);
  EXPECT_FALSE(in_gesture);
  EXPECT_EQ(kArbiterPassThrough, early) << ArbiterDecisionName(early);

  EXPECT_TRUE(engine->snapshot().in_gesture());
  EXPECT_FALSE(engine->snapshot().pass_through());
  EXPECT_EQ(kArbiterSuppress,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.002, kPointerEventButtonDown,
                                 MIDDRAG_BUTTON_RIGHT), NULL));
}

TEST(MiddragEngineTest, NegativeCountTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  Supply(engine, 1.0, -3, 0.5, 0.5);
  EXPECT_EQ(0, engine->snapshot().finger_count());
  engine->WaitForIdle();
  EXPECT_TRUE(harness.events_.empty());
}

TEST(MiddragEngineTest, TitleBarPassThroughTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  harness.host_.reserved = true;
  GestureConfiguration config;
  config.pass_through_title_bar = true;
  config.title_bar_height = 22.0;
  engine->SetConfiguration(config);

  Supply(engine, 0.00, 3, 0.50, 0.5);
  engine->WaitForIdle();
  EXPECT_DOUBLE_EQ(22.0, harness.host_.reserved_height);
  EXPECT_TRUE(engine->snapshot().pass_through());
  EXPECT_FALSE(engine->snapshot().in_gesture());
  // Physical clicks belong to the host during a pass-through session.
  EXPECT_EQ(kArbiterPassThrough,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.005, kPointerEventButtonDown,
                                 MIDDRAG_BUTTON_LEFT), NULL));
  EXPECT_EQ(0, harness.sink_.click_cnt);

  // Moving the fingers does not hand the session back to us.
  Supply(engine, 0.01, 3, 0.52, 0.5);
  Supply(engine, 0.02, 3, 0.53, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(kGestureEventUpdateDragging, harness.events_.back().type);
  EXPECT_TRUE(engine->snapshot().pass_through());
  EXPECT_FALSE(engine->snapshot().in_gesture());
  EXPECT_FALSE(engine->snapshot().actively_dragging());
  EXPECT_EQ(kArbiterPassThrough,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.025, kPointerEventButtonDown,
                                 MIDDRAG_BUTTON_LEFT), NULL));
  EXPECT_EQ(kArbiterPassThrough,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.026, kPointerEventButtonUp,
                                 MIDDRAG_BUTTON_LEFT), NULL));
  EXPECT_EQ(0, harness.sink_.click_cnt);

  Supply(engine, 0.03, 0, 0.53, 0.5);
  Supply(engine, 0.04, 0, 0.53, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(kGestureEventEndDragging, harness.events_.back().type);
  EXPECT_EQ(0, harness.sink_.begin_cnt);
  EXPECT_EQ(0, harness.sink_.update_cnt);
  EXPECT_EQ(0, harness.sink_.end_cnt);
  EXPECT_FALSE(engine->snapshot().pass_through());
  EXPECT_FALSE(engine->snapshot().last_gesture_was_active());

  // A tap in the title bar is not clicked either.
  Supply(engine, 1.00, 3, 0.5, 0.5);
  Supply(engine, 1.02, 0, 0.5, 0.5);
  Supply(engine, 1.04, 0, 0.5, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(kGestureEventTap, harness.events_.back().type);
  EXPECT_EQ(0, harness.sink_.click_cnt);
}

TEST(MiddragEngineTest, HostFilterTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  harness.host_.desktop = true;
  harness.host_.large_enough = false;
  GestureConfiguration config;
  config.ignore_desktop = true;
  engine->SetConfiguration(config);

  Supply(engine, 0.00, 3, 0.5, 0.5);
  Supply(engine, 0.02, 0, 0.5, 0.5);
  Supply(engine, 0.04, 0, 0.5, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(0, harness.sink_.click_cnt);
  EXPECT_FALSE(engine->snapshot().last_gesture_was_active());

  // Off the desktop, but the window is too small once that filter is on.
  harness.host_.desktop = false;
  config.minimum_window_size_filter_enabled = true;
  engine->SetConfiguration(config);
  Supply(engine, 1.00, 3, 0.50, 0.5);
  Supply(engine, 1.01, 3, 0.52, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(0, harness.sink_.begin_cnt);
  EXPECT_FALSE(engine->snapshot().in_gesture());
  EXPECT_FALSE(engine->snapshot().actively_dragging());

  harness.host_.large_enough = true;
  Supply(engine, 1.02, 0, 0.52, 0.5);
  Supply(engine, 1.03, 0, 0.52, 0.5);
  Supply(engine, 2.00, 3, 0.5, 0.5);
  Supply(engine, 2.02, 0, 0.5, 0.5);
  Supply(engine, 2.04, 0, 0.5, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(0, harness.sink_.end_cnt);
  EXPECT_EQ(1, harness.sink_.click_cnt);
}

TEST(MiddragEngineTest, FeatureSwitchesTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  GestureConfiguration config;
  config.tap_to_click_enabled = false;
  config.middle_drag_enabled = false;
  engine->SetConfiguration(config);

  Supply(engine, 0.00, 3, 0.5, 0.5);
  Supply(engine, 0.02, 0, 0.5, 0.5);
  Supply(engine, 0.04, 0, 0.5, 0.5);
  Supply(engine, 1.00, 3, 0.50, 0.5);
  Supply(engine, 1.01, 3, 0.52, 0.5);
  Supply(engine, 1.02, 3, 0.53, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(0, harness.sink_.click_cnt);
  EXPECT_EQ(0, harness.sink_.begin_cnt);
  EXPECT_EQ(0, harness.sink_.update_cnt);
  // The recognizer still reports what it saw.
  EXPECT_EQ(kGestureEventUpdateDragging, harness.events_.back().type);
}

TEST(MiddragEngineTest, EnableTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  Supply(engine, 0.00, 3, 0.5, 0.5);
  engine->WaitForIdle();
  ASSERT_TRUE(engine->snapshot().in_gesture());

  engine->SetEnabled(false);
  EXPECT_FALSE(engine->enabled());
  EXPECT_FALSE(engine->snapshot().in_gesture());
  Supply(engine, 0.01, 3, 0.5, 0.5);
  Supply(engine, 0.02, 0, 0.5, 0.5);
  Supply(engine, 0.03, 0, 0.5, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(1, harness.events_.size());
  EXPECT_EQ(0, harness.sink_.click_cnt);

  bool reenable = true;
  EXPECT_EQ(kArbiterPassThrough,
            engine->ArbitratePointerEvent(
                MakePointerEvent(0.04, kPointerEventDragged,
                                 MIDDRAG_BUTTON_LEFT), &reenable));
  EXPECT_FALSE(reenable);

  engine->SetEnabled(true);
  Supply(engine, 1.00, 3, 0.5, 0.5);
  engine->WaitForIdle();
  ASSERT_EQ(2, harness.events_.size());
  EXPECT_EQ(kGestureEventStart, harness.events_[1].type);
}

TEST(MiddragEngineTest, ForceReleaseTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  Supply(engine, 0.00, 3, 0.50, 0.5);
  Supply(engine, 0.01, 3, 0.52, 0.5);
  engine->WaitForIdle();
  ASSERT_TRUE(engine->snapshot().actively_dragging());

  engine->ForceReleaseStuckDrag();
  EXPECT_FALSE(engine->snapshot().actively_dragging());
  EXPECT_FALSE(engine->snapshot().in_gesture());
  engine->WaitForIdle();
  EXPECT_EQ(1, harness.sink_.force_release_cnt);

  // The session is gone: lifting produces no endDragging.
  Supply(engine, 0.02, 0, 0.52, 0.5);
  Supply(engine, 0.03, 0, 0.52, 0.5);
  engine->WaitForIdle();
  EXPECT_EQ(0, harness.sink_.end_cnt);
  EXPECT_EQ(kGestureEventBeginDragging, harness.events_.back().type);
}

TEST(MiddragEngineTest, ResetTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  Supply(engine, 0.00, 3, 0.50, 0.5);
  Supply(engine, 0.01, 3, 0.52, 0.5);
  engine->Reset();
  engine->WaitForIdle();
  EXPECT_FALSE(engine->snapshot().actively_dragging());
  // A synthesized drag in flight is cancelled.
  EXPECT_EQ(1, harness.sink_.cancel_cnt);
  EXPECT_EQ(2, harness.events_.size());
}

TEST(MiddragEngineTest, MissingHostTest) {
  MiddragEngine engine(MIDDRAG_VERSION);
  RecordingSink sink;
  engine.SetDragSink(&kRecordingSink, &sink);
  GestureConfiguration config;
  config.pass_through_title_bar = true;
  config.ignore_desktop = true;
  config.minimum_window_size_filter_enabled = true;
  engine.SetConfiguration(config);

  Supply(&engine, 0.00, 3, 0.50, 0.5);
  Supply(&engine, 0.01, 3, 0.52, 0.5);
  engine.WaitForIdle();
  // Not reserved, not the desktop, large enough, cursor at the origin.
  EXPECT_EQ(1, sink.begin_cnt);
  EXPECT_FLOAT_EQ(0.0, sink.begin_at.x);
  EXPECT_FLOAT_EQ(0.0, sink.begin_at.y);
}

namespace {

// A settings store that hands out the engine's own property storage.
struct FakePropStore {
  FakePropStore() : free_cnt(0) {}
  map<string, MiddragProp*> by_name;
  map<MiddragProp*, pair<void*, MiddragPropSetHandler> > handlers;
  int free_cnt;

  void Write(const string& name) {
    MiddragProp* prop = by_name[name];
    handlers[prop].second(handlers[prop].first);
  }
};

MiddragProp* StoreCreateInt(void* data, const char* name, int* loc,
                            const int init) {
  MiddragProp* prop = reinterpret_cast<MiddragProp*>(loc);
  reinterpret_cast<FakePropStore*>(data)->by_name[name] = prop;
  return prop;
}

MiddragProp* StoreCreateBool(void* data, const char* name,
                             MiddragPropBool* loc,
                             const MiddragPropBool init) {
  MiddragProp* prop = reinterpret_cast<MiddragProp*>(loc);
  reinterpret_cast<FakePropStore*>(data)->by_name[name] = prop;
  return prop;
}

MiddragProp* StoreCreateReal(void* data, const char* name, double* loc,
                             const double init) {
  MiddragProp* prop = reinterpret_cast<MiddragProp*>(loc);
  reinterpret_cast<FakePropStore*>(data)->by_name[name] = prop;
  return prop;
}

void StoreRegisterHandlers(void* data, MiddragProp* prop, void* handler_data,
                           MiddragPropSetHandler setter) {
  reinterpret_cast<FakePropStore*>(data)->handlers[prop] =
      std::make_pair(handler_data, setter);
}

void StoreFree(void* data, MiddragProp* prop) {
  reinterpret_cast<FakePropStore*>(data)->free_cnt++;
}

}  // namespace {}

TEST(MiddragEngineTest, PropProviderTest) {
  MiddragPropProvider provider = {
    StoreCreateInt,
    StoreCreateBool,
    StoreCreateReal,
    StoreRegisterHandlers,
    StoreFree
  };
  FakePropStore store;
  {
    EngineHarness harness;
    MiddragEngine* engine = harness.engine();
    engine->SetPropProvider(&provider, &store);
    EXPECT_EQ(23, store.by_name.size());
    EXPECT_EQ(23, store.handlers.size());

    // The host flips a setting in its store.
    *reinterpret_cast<MiddragPropBool*>(
        store.by_name["Tap To Click Enable"]) = 0;
    store.Write("Tap To Click Enable");

    Supply(engine, 0.00, 3, 0.5, 0.5);
    Supply(engine, 0.02, 0, 0.5, 0.5);
    Supply(engine, 0.04, 0, 0.5, 0.5);
    engine->WaitForIdle();
    EXPECT_EQ(kGestureEventTap, harness.events_.back().type);
    EXPECT_EQ(0, harness.sink_.click_cnt);

    string log = engine->EncodeActivityLog();
    EXPECT_NE(string::npos, log.find("Tap To Click Enable"));
    EXPECT_NE(string::npos, log.find("propertyChange"));
  }
  EXPECT_EQ(23, store.free_cnt);
}

TEST(MiddragEngineTest, ActivityLogTest) {
  EngineHarness harness;
  MiddragEngine* engine = harness.engine();
  engine->SetConfiguration(GestureConfiguration());
  Supply(engine, 0.00, 3, 0.5, 0.5);
  Supply(engine, 0.02, 0, 0.5, 0.5);
  Supply(engine, 0.04, 0, 0.5, 0.5);
  engine->WaitForIdle();

  string log = engine->EncodeActivityLog();
  EXPECT_NE(string::npos, log.find("touchFrame"));
  EXPECT_NE(string::npos, log.find("\"tap\""));
  EXPECT_NE(string::npos, log.find("configuration"));
  EXPECT_NE(string::npos, log.find("Drag Sensitivity"));
}

TEST(MiddragEngineTest, CApiTest) {
  MiddragEngine* engine = NewMiddragEngine();
  ASSERT_TRUE(engine != NULL);
  vector<GestureEvent> events;
  RecordingSink sink;
  MiddragEngineSetCallback(engine, RecordEvent, &events);
  MiddragEngineSetDragSink(engine, &kRecordingSink, &sink);

  FingerFrame finger_frame(0.0, 3, 0.5, 0.5);
  MiddragEngineContactFrameCallback(engine, finger_frame.contacts, 3, 0.0, 0);
  // The caller's buffer is reused right away.
  finger_frame.contacts[0].phase = MIDDRAG_PHASE_OUT_OF_RANGE;
  MiddragEngineSupplyFrame(engine, &finger_frame.frame);
  engine->WaitForIdle();
  ASSERT_EQ(1, events.size());
  EXPECT_EQ(kGestureEventStart, events[0].type);

  int reenable = 0;
  PointerEvent disabled =
      MakePointerEvent(0.1, kPointerEventInterceptionDisabledByTimeout, 0);
  EXPECT_EQ(kArbiterPassThrough,
            MiddragEngineArbitratePointerEvent(engine, &disabled, &reenable));
  EXPECT_EQ(1, reenable);

  MiddragEngineForceReleaseStuckDrag(engine);
  MiddragEngineSetEnabled(engine, 0);
  EXPECT_FALSE(engine->enabled());
  MiddragEngineReset(engine);
  engine->WaitForIdle();
  EXPECT_EQ(1, sink.force_release_cnt);
  DeleteMiddragEngine(engine);
}

TEST(MiddragEngineTest, StringTest) {
  FingerFrame finger_frame(1.5, 2, 0.5, 0.5);
  string str = finger_frame.frame.String();
  EXPECT_NE(string::npos, str.find("2 contacts"));
  EXPECT_NE(string::npos, str.find("id 2"));
  EXPECT_EQ(string::npos, str.find("id 3"));

  GestureStart start = { { 0.25, 0.75 } };
  GestureEvent event(start, 2.0);
  EXPECT_NE(string::npos, event.String().find("start"));
  EXPECT_FALSE(event.IsTerminal());
  EXPECT_TRUE(GestureEvent(kGestureEventCancel, 2.0).IsTerminal());
  EXPECT_TRUE(event == GestureEvent(start, 2.0));
  EXPECT_TRUE(event != GestureEvent(kGestureEventTap, 2.0));
}

}  // namespace middrag
