// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <vector>

#include <base/synchronization/lock.h>
#include <gtest/gtest.h>

#include "middrag/include/processing_queue.h"

using std::vector;

namespace middrag {

class ProcessingQueueTest : public ::testing::Test {};

namespace {

class RecordingHandler : public ProcessingQueue::Handler {
 public:
  virtual void HandleTask(const ProcessingTask& task) {
    base::AutoLock auto_lock(lock_);
    tasks_.push_back(task);
  }

  vector<ProcessingTask> Tasks() {
    base::AutoLock auto_lock(lock_);
    return tasks_;
  }

 private:
  base::Lock lock_;
  vector<ProcessingTask> tasks_;
};

TouchFrame MakeFrame(stime_t timestamp, Contact* contacts, int cnt) {
  TouchFrame frame;
  frame.timestamp = timestamp;
  frame.contact_cnt = cnt;
  frame.modifiers = 0;
  frame.contacts = contacts;
  return frame;
}

}  // namespace {}

TEST(ProcessingQueueTest, FifoTest) {
  RecordingHandler handler;
  ProcessingQueue queue(&handler, "FifoTest");
  queue.Start();

  Contact contact = { 0.5, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 };
  for (int i = 0; i < 100; i++) {
    if (i == 50) {
      ProcessingTask config_task(ProcessingTask::kConfiguration);
      config_task.config.sensitivity = 2.0;
      queue.Post(config_task);
    }
    queue.Post(ProcessingTask::FromFrame(MakeFrame(i * 0.01, &contact, 1)));
  }
  queue.WaitForIdle();
  EXPECT_EQ(0, queue.PendingForTesting());

  vector<ProcessingTask> tasks = handler.Tasks();
  ASSERT_EQ(101, tasks.size());
  size_t frame_idx = 0;
  for (size_t i = 0; i < tasks.size(); i++) {
    if (i == 50) {
      EXPECT_EQ(ProcessingTask::kConfiguration, tasks[i].type);
      EXPECT_DOUBLE_EQ(2.0, tasks[i].config.sensitivity);
      continue;
    }
    EXPECT_EQ(ProcessingTask::kFrame, tasks[i].type);
    EXPECT_DOUBLE_EQ(frame_idx * 0.01, tasks[i].timestamp) << i;
    frame_idx++;
  }
}

// The capture buffer may be reused as soon as the frame is posted.
TEST(ProcessingQueueTest, CopyBeforeHandoffTest) {
  RecordingHandler handler;
  ProcessingQueue queue(&handler, "CopyTest");
  queue.Start();

  Contact contacts[] = {
    { 0.4, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 },
    { 0.5, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 2 },
    { 0.6, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 3 },
  };
  queue.Post(ProcessingTask::FromFrame(MakeFrame(1.0, contacts, 3)));
  for (int i = 0; i < 3; i++) {
    contacts[i].position_x = 0.0;
    contacts[i].phase = MIDDRAG_PHASE_OUT_OF_RANGE;
  }
  queue.WaitForIdle();

  vector<ProcessingTask> tasks = handler.Tasks();
  ASSERT_EQ(1, tasks.size());
  ASSERT_EQ(3, tasks[0].contacts.size());
  EXPECT_EQ(3, tasks[0].reported_cnt);
  EXPECT_FLOAT_EQ(0.4, tasks[0].contacts[0].position_x);
  EXPECT_FLOAT_EQ(0.6, tasks[0].contacts[2].position_x);
  EXPECT_EQ(MIDDRAG_PHASE_TOUCHING, tasks[0].contacts[1].phase);
}

TEST(ProcessingQueueTest, BadFrameTest) {
  Contact contact = { 0.5, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 };
  ProcessingTask negative =
      ProcessingTask::FromFrame(MakeFrame(1.0, &contact, -4));
  EXPECT_TRUE(negative.contacts.empty());
  EXPECT_EQ(-4, negative.reported_cnt);

  ProcessingTask missing = ProcessingTask::FromFrame(MakeFrame(1.0, NULL, 3));
  EXPECT_TRUE(missing.contacts.empty());
  EXPECT_EQ(3, missing.reported_cnt);
}

TEST(ProcessingQueueTest, StopTest) {
  RecordingHandler handler;
  ProcessingQueue queue(&handler, "StopTest");

  // Not started yet: dropped.
  queue.Post(ProcessingTask(ProcessingTask::kReset));
  EXPECT_EQ(0, queue.PendingForTesting());

  queue.Start();
  for (int i = 0; i < 10; i++)
    queue.Post(ProcessingTask(ProcessingTask::kReset));
  // Stop drains what was queued.
  queue.Stop();
  EXPECT_EQ(10, handler.Tasks().size());

  queue.Post(ProcessingTask(ProcessingTask::kForceRelease));
  EXPECT_EQ(0, queue.PendingForTesting());
  EXPECT_EQ(10, handler.Tasks().size());
}

}  // namespace middrag
