// Copyright (c) 2011 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_ACTIVITY_LOG_H_
#define MIDDRAG_ACTIVITY_LOG_H_

#include "middrag/include/middrag.h"

#include <memory>
#include <string>

#include <base/macros.h>
#include <base/synchronization/lock.h>
#include <base/values.h>
#include <gtest/gtest.h>  // For FRIEND_TEST

#include "middrag/include/gesture_configuration.h"

// This is a class that circularly buffers recent touch frames, gesture events
// and configuration changes so that end users can report issues and
// engineers can reproduce them. Nothing is written to disk.

namespace middrag {

class PropRegistry;

class ActivityLog {
  FRIEND_TEST(ActivityLogTest, SimpleTest);
  FRIEND_TEST(ActivityLogTest, TooManyContactsTest);
  FRIEND_TEST(ActivityLogTest, WrapAroundTest);
  FRIEND_TEST(PropRegistryTest, PropChangeTest);
 public:
  enum EntryType {
    kTouchFrame = 0,
    kGestureEvent,
    kConfiguration,
    kPropChange
  };
  struct FrameEntry {
    stime_t timestamp;
    int reported_cnt;
    unsigned modifiers;
    size_t contact_cnt;
    Contact* contacts;  // points into contacts_
  };
  struct PropChangeEntry {
    const char* name;
    enum {
      kBoolProp = 0,
      kDoubleProp,
      kIntProp
    } type;
    union {
      MiddragPropBool bool_val;
      double double_val;
      int int_val;
    } value;
  };
  struct Entry {
    EntryType type;
    struct details {
      FrameEntry frame;  // kTouchFrame
      GestureEvent gesture;  // kGestureEvent
      GestureConfiguration config;  // kConfiguration
      PropChangeEntry prop_change;  // kPropChange
    } details;
  };

  explicit ActivityLog(PropRegistry* prop_reg);

  // Log*() functions record an argument into the buffer. They may be called
  // from the processing context and from the thread that owns the property
  // provider.
  void LogTouchFrame(stime_t timestamp,
                     int reported_cnt,
                     unsigned modifiers,
                     const Contact* contacts,
                     size_t contact_cnt);
  void LogGestureEvent(const GestureEvent& event);
  void LogConfiguration(const GestureConfiguration& config);
  void LogPropChange(const PropChangeEntry& prop_change);

  void Clear();

  size_t size();
  size_t MaxSize() const { return kBufferSize; }

  // Returns a JSON string representing all the state in the buffer
  std::string Encode();

  static const char kKeyRoot[];
  static const char kKeyType[];
  static const char kKeyTouchFrame[];
  static const char kKeyGestureEvent[];
  static const char kKeyConfiguration[];
  static const char kKeyPropChange[];
  // TouchFrame keys:
  static const char kKeyTouchFrameTimestamp[];
  static const char kKeyTouchFrameReportedCnt[];
  static const char kKeyTouchFrameModifiers[];
  static const char kKeyTouchFrameContacts[];
  // Contact keys (part of TouchFrame):
  static const char kKeyContactPositionX[];
  static const char kKeyContactPositionY[];
  static const char kKeyContactVelocityX[];
  static const char kKeyContactVelocityY[];
  static const char kKeyContactZTotal[];
  static const char kKeyContactMajorAxis[];
  static const char kKeyContactMinorAxis[];
  static const char kKeyContactPhase[];
  static const char kKeyContactIdentifier[];
  // GestureEvent keys:
  static const char kKeyGestureEventType[];
  static const char kKeyGestureEventTimestamp[];
  static const char kKeyGestureEventStartX[];
  static const char kKeyGestureEventStartY[];
  static const char kKeyGestureEventCentroidX[];
  static const char kKeyGestureEventCentroidY[];
  static const char kKeyGestureEventLastX[];
  static const char kKeyGestureEventLastY[];
  static const char kKeyGestureEventFingerCnt[];
  static const char kValueGestureEventStart[];
  static const char kValueGestureEventTap[];
  static const char kValueGestureEventBeginDragging[];
  static const char kValueGestureEventUpdateDragging[];
  static const char kValueGestureEventEndDragging[];
  static const char kValueGestureEventCancel[];
  static const char kValueGestureEventCancelDragging[];
  // Configuration keys:
  static const char kKeyConfigurationValue[];
  // PropChange keys:
  static const char kKeyPropChangeType[];
  static const char kKeyPropChangeName[];
  static const char kKeyPropChangeValue[];
  static const char kValuePropChangeTypeBool[];
  static const char kValuePropChangeTypeDouble[];
  static const char kValuePropChangeTypeInt[];

  static const char kKeyVersion[];
  static const char kKeyProperties[];

 private:
  // Extends the tail of the buffer by one element and returns that new element.
  // This may cause an older element to be overwritten if the buffer is full.
  // Caller must hold lock_.
  Entry* PushBack();

  size_t TailIdx() const { return (head_idx_ + size_ - 1) % kBufferSize; }

  Entry* GetEntry(size_t idx) {
    return &buffer_[(head_idx_ + idx) % kBufferSize];
  }

  // JSON-encoders for various types
  std::unique_ptr<base::Value> EncodeTouchFrame(const FrameEntry& frame) const;
  std::unique_ptr<base::Value> EncodeGestureEvent(
      const GestureEvent& event) const;
  std::unique_ptr<base::Value> EncodeConfiguration(
      const GestureConfiguration& config) const;
  std::unique_ptr<base::Value> EncodePropChange(
      const PropChangeEntry& prop_change) const;

  // Encode user-configurable properties
  std::unique_ptr<base::Value> EncodePropRegistry() const;

  static const size_t kBufferSize = 4096;
  static const size_t kMaxContactsPerFrame = 16;

  base::Lock lock_;
  std::unique_ptr<Entry[]> buffer_;
  size_t head_idx_;
  size_t size_;

  // If buffer_[i] is a kTouchFrame, its contacts are stored at
  // contacts_[i * kMaxContactsPerFrame].
  std::unique_ptr<Contact[]> contacts_;

  PropRegistry* prop_reg_;

  DISALLOW_COPY_AND_ASSIGN(ActivityLog);
};

}  // namespace middrag

#endif  // MIDDRAG_ACTIVITY_LOG_H_
