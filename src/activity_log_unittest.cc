// Copyright (c) 2011 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <string>

#include <gtest/gtest.h>

#include "middrag/include/activity_log.h"
#include "middrag/include/prop_registry.h"

using std::string;

namespace middrag {

class ActivityLogTest : public ::testing::Test {};

namespace {
bool Contains(const string& haystack, const string& needle) {
  return haystack.find(needle) != string::npos;
}
}  // namespace {}

TEST(ActivityLogTest, SimpleTest) {
  PropRegistry prop_reg;
  BoolProperty true_prop(&prop_reg, "true prop", 1);
  DoubleProperty double_prop(&prop_reg, "double prop", 77.25);
  IntProperty int_prop(&prop_reg, "int prop", 814);

  ActivityLog log(&prop_reg);
  EXPECT_EQ(0, log.size());
  EXPECT_GT(log.MaxSize(), 10);

  Contact contacts[] = {
    { 0.25, 0.75, 0.5, -0.5, 0.625, 8, 8, MIDDRAG_PHASE_TOUCHING, 19 },
  };
  log.LogTouchFrame(1.5, 1, MIDDRAG_MODIFIER_SHIFT, contacts, 1);
  EXPECT_EQ(1, log.size());
  EXPECT_EQ(ActivityLog::kTouchFrame, log.GetEntry(0)->type);
  EXPECT_EQ(19, log.GetEntry(0)->details.frame.contacts[0].identifier);

  GestureStart start = { { 0.375, 0.5 } };
  log.LogGestureEvent(GestureEvent(start, 1.5));
  EXPECT_EQ(2, log.size());
  EXPECT_EQ(ActivityLog::kGestureEvent, log.GetEntry(1)->type);

  GestureConfiguration config;
  config.sensitivity = 1.75;
  log.LogConfiguration(config);
  EXPECT_EQ(3, log.size());

  ActivityLog::PropChangeEntry prop_change = {
    "some prop", ActivityLog::PropChangeEntry::kIntProp, { 0 }
  };
  prop_change.value.int_val = 1234;
  log.LogPropChange(prop_change);
  EXPECT_EQ(4, log.size());

  string encoded = log.Encode();
  EXPECT_TRUE(Contains(encoded, ActivityLog::kKeyRoot));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kKeyTouchFrame));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kKeyContactIdentifier));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kValueGestureEventStart));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kKeyConfiguration));
  EXPECT_TRUE(Contains(encoded, config.String()));
  EXPECT_TRUE(Contains(encoded, "some prop"));
  EXPECT_TRUE(Contains(encoded, "1234"));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kKeyProperties));
  EXPECT_TRUE(Contains(encoded, "true prop"));
  EXPECT_TRUE(Contains(encoded, "77.25"));
  EXPECT_TRUE(Contains(encoded, "814"));

  log.Clear();
  EXPECT_EQ(0, log.size());
}

TEST(ActivityLogTest, WrapAroundTest) {
  ActivityLog log(NULL);
  // Overfill the buffer
  const double kTimesToFill = 10.5;
  size_t total = static_cast<size_t>(kTimesToFill * ActivityLog::kBufferSize);
  for (size_t i = 0; i < total; i++)
    log.LogTouchFrame(static_cast<stime_t>(i), 0, 0, NULL, 0);
  EXPECT_EQ(ActivityLog::kBufferSize, log.size());

  // The oldest entries were overwritten.
  size_t first = total - ActivityLog::kBufferSize;
  EXPECT_DOUBLE_EQ(static_cast<stime_t>(first),
                   log.GetEntry(0)->details.frame.timestamp);
  EXPECT_DOUBLE_EQ(
      static_cast<stime_t>(first + ActivityLog::kBufferSize - 1),
      log.GetEntry(ActivityLog::kBufferSize - 1)->details.frame.timestamp);
}

TEST(ActivityLogTest, TooManyContactsTest) {
  ActivityLog log(NULL);
  Contact contacts[ActivityLog::kMaxContactsPerFrame + 4];
  for (size_t i = 0; i < ActivityLog::kMaxContactsPerFrame + 4; i++) {
    Contact contact = {
      0.5, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, static_cast<int>(i)
    };
    contacts[i] = contact;
  }
  log.LogTouchFrame(1.0, ActivityLog::kMaxContactsPerFrame + 4, 0, contacts,
                    ActivityLog::kMaxContactsPerFrame + 4);
  ASSERT_EQ(1, log.size());
  const ActivityLog::FrameEntry& frame = log.GetEntry(0)->details.frame;
  EXPECT_EQ(ActivityLog::kMaxContactsPerFrame, frame.contact_cnt);
  // The reported count is kept as given.
  EXPECT_EQ(static_cast<int>(ActivityLog::kMaxContactsPerFrame + 4),
            frame.reported_cnt);
  EXPECT_EQ(static_cast<int>(ActivityLog::kMaxContactsPerFrame - 1),
            frame.contacts[ActivityLog::kMaxContactsPerFrame - 1].identifier);
}

TEST(ActivityLogTest, GestureEventEncodingTest) {
  ActivityLog log(NULL);
  GestureData data = GestureData();
  data.centroid.x = 0.625;
  data.last_position.x = 0.5;
  data.finger_cnt = 3;
  log.LogGestureEvent(GestureEvent(data, 2.0));
  log.LogGestureEvent(GestureEvent(kGestureEventTap, 2.5));
  log.LogGestureEvent(GestureEvent(kGestureEventCancelDragging, 3.0));

  string encoded = log.Encode();
  EXPECT_TRUE(Contains(encoded, ActivityLog::kValueGestureEventUpdateDragging));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kKeyGestureEventCentroidX));
  EXPECT_TRUE(Contains(encoded, "0.625"));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kValueGestureEventTap));
  EXPECT_TRUE(Contains(encoded, ActivityLog::kValueGestureEventCancelDragging));
}

}  // namespace middrag
