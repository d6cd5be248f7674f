// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_PROCESSING_QUEUE_H_
#define MIDDRAG_PROCESSING_QUEUE_H_

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <base/macros.h>
#include <base/synchronization/condition_variable.h>
#include <base/synchronization/lock.h>
#include <base/threading/simple_thread.h>

#include "middrag/include/gesture_configuration.h"
#include "middrag/include/middrag.h"

namespace middrag {

// Work for the processing context. Frames carry their own copy of the
// contacts, since the capture buffer may be reused as soon as the capture
// callback returns.
struct ProcessingTask {
  enum Type {
    kFrame = 0,
    kConfiguration,
    kReset,
    kForceRelease,
  };

  ProcessingTask() : type(kFrame), timestamp(0.0), modifiers(0),
                     reported_cnt(0) {}
  explicit ProcessingTask(Type type_in)
      : type(type_in), timestamp(0.0), modifiers(0), reported_cnt(0) {}

  // Builds a kFrame task, copying the contacts out of |frame|.
  static ProcessingTask FromFrame(const TouchFrame& frame);

  Type type;
  stime_t timestamp;
  unsigned modifiers;
  int reported_cnt;  // contact_cnt as reported, before any clamping
  std::vector<Contact> contacts;
  GestureConfiguration config;  // kConfiguration
};

// A single worker thread that runs tasks one at a time in the order they
// were posted. Posting only takes the queue lock long enough to append.

class ProcessingQueue : public base::DelegateSimpleThread::Delegate {
 public:
  class Handler {
   public:
    virtual ~Handler() {}
    virtual void HandleTask(const ProcessingTask& task) = 0;
  };

  // Does not take ownership of |handler|, which must outlive the queue.
  ProcessingQueue(Handler* handler, const std::string& name);
  virtual ~ProcessingQueue();

  void Start();
  // Runs what is already queued, then joins the worker. Tasks posted after
  // Stop() are dropped.
  void Stop();

  void Post(ProcessingTask task);

  // Blocks until the queue is empty and no task is running.
  void WaitForIdle();

  size_t PendingForTesting();

  // base::DelegateSimpleThread::Delegate:
  virtual void Run();

 private:
  Handler* handler_;
  std::string name_;

  base::Lock lock_;
  base::ConditionVariable work_available_;
  base::ConditionVariable idle_;
  std::deque<ProcessingTask> tasks_;
  bool running_task_;
  bool started_;
  bool stopping_;

  std::unique_ptr<base::DelegateSimpleThread> thread_;

  DISALLOW_COPY_AND_ASSIGN(ProcessingQueue);
};

}  // namespace middrag

#endif  // MIDDRAG_PROCESSING_QUEUE_H_
