// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/processing_queue.h"

#include <utility>

#include "middrag/include/logging.h"

using std::string;

namespace middrag {

ProcessingTask ProcessingTask::FromFrame(const TouchFrame& frame) {
  ProcessingTask task(kFrame);
  task.timestamp = frame.timestamp;
  task.modifiers = frame.modifiers;
  task.reported_cnt = frame.contact_cnt;
  if (frame.contact_cnt > 0) {
    if (frame.contacts)
      task.contacts.assign(frame.contacts,
                           frame.contacts + frame.contact_cnt);
    else
      Err("Have contact_cnt %d but contacts is NULL!", frame.contact_cnt);
  }
  return task;
}

ProcessingQueue::ProcessingQueue(Handler* handler, const string& name)
    : handler_(handler),
      name_(name),
      work_available_(&lock_),
      idle_(&lock_),
      running_task_(false),
      started_(false),
      stopping_(false) {}

ProcessingQueue::~ProcessingQueue() {
  Stop();
}

void ProcessingQueue::Start() {
  if (thread_) {
    Err("Processing queue %s already started", name_.c_str());
    return;
  }
  {
    base::AutoLock auto_lock(lock_);
    started_ = true;
    stopping_ = false;
  }
  thread_.reset(new base::DelegateSimpleThread(this, name_));
  thread_->Start();
}

void ProcessingQueue::Stop() {
  if (!thread_)
    return;
  {
    base::AutoLock auto_lock(lock_);
    stopping_ = true;
    work_available_.Signal();
  }
  thread_->Join();
  thread_.reset();
  base::AutoLock auto_lock(lock_);
  started_ = false;
}

void ProcessingQueue::Post(ProcessingTask task) {
  base::AutoLock auto_lock(lock_);
  if (stopping_ || !started_) {
    Err("Processing queue %s is not running, dropping task %d",
        name_.c_str(), static_cast<int>(task.type));
    return;
  }
  tasks_.push_back(std::move(task));
  work_available_.Signal();
}

void ProcessingQueue::WaitForIdle() {
  base::AutoLock auto_lock(lock_);
  if (!started_) {
    Err("Processing queue %s is not running", name_.c_str());
    return;
  }
  while (!tasks_.empty() || running_task_)
    idle_.Wait();
}

size_t ProcessingQueue::PendingForTesting() {
  base::AutoLock auto_lock(lock_);
  return tasks_.size();
}

void ProcessingQueue::Run() {
  for (;;) {
    ProcessingTask task;
    {
      base::AutoLock auto_lock(lock_);
      while (tasks_.empty() && !stopping_)
        work_available_.Wait();
      if (tasks_.empty())
        break;
      task = std::move(tasks_.front());
      tasks_.pop_front();
      running_task_ = true;
    }
    handler_->HandleTask(task);
    {
      base::AutoLock auto_lock(lock_);
      running_task_ = false;
      if (tasks_.empty())
        idle_.Broadcast();
    }
  }
  base::AutoLock auto_lock(lock_);
  idle_.Broadcast();
}

}  // namespace middrag
