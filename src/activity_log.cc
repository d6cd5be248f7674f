// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/activity_log.h"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

#include <base/json/json_writer.h>
#include <base/strings/stringprintf.h>
#include <base/values.h>

#include "middrag/include/logging.h"
#include "middrag/include/prop_registry.h"

using base::DictionaryValue;
using base::ListValue;
using base::Value;
using std::set;
using std::string;
using std::unique_ptr;

namespace middrag {

const size_t ActivityLog::kBufferSize;
const size_t ActivityLog::kMaxContactsPerFrame;

ActivityLog::ActivityLog(PropRegistry* prop_reg)
    : buffer_(new Entry[kBufferSize]),
      head_idx_(0),
      size_(0),
      contacts_(new Contact[kBufferSize * kMaxContactsPerFrame]),
      prop_reg_(prop_reg) {}

void ActivityLog::LogTouchFrame(stime_t timestamp,
                                int reported_cnt,
                                unsigned modifiers,
                                const Contact* contacts,
                                size_t contact_cnt) {
  base::AutoLock auto_lock(lock_);
  Entry* entry = PushBack();
  entry->type = kTouchFrame;
  FrameEntry* frame = &entry->details.frame;
  frame->timestamp = timestamp;
  frame->reported_cnt = reported_cnt;
  frame->modifiers = modifiers;
  frame->contacts = &contacts_[TailIdx() * kMaxContactsPerFrame];
  if (contact_cnt > kMaxContactsPerFrame) {
    Err("Too many contacts! Max is %zu, but I got %zu",
        kMaxContactsPerFrame, contact_cnt);
    contact_cnt = kMaxContactsPerFrame;
  }
  if (contact_cnt && !contacts) {
    Err("Have contact_cnt %zu but contacts is NULL!", contact_cnt);
    contact_cnt = 0;
  }
  frame->contact_cnt = contact_cnt;
  std::copy(contacts, contacts + contact_cnt, frame->contacts);
}

void ActivityLog::LogGestureEvent(const GestureEvent& event) {
  base::AutoLock auto_lock(lock_);
  Entry* entry = PushBack();
  entry->type = kGestureEvent;
  entry->details.gesture = event;
}

void ActivityLog::LogConfiguration(const GestureConfiguration& config) {
  base::AutoLock auto_lock(lock_);
  Entry* entry = PushBack();
  entry->type = kConfiguration;
  entry->details.config = config;
}

void ActivityLog::LogPropChange(const PropChangeEntry& prop_change) {
  base::AutoLock auto_lock(lock_);
  Entry* entry = PushBack();
  entry->type = kPropChange;
  entry->details.prop_change = prop_change;
}

void ActivityLog::Clear() {
  base::AutoLock auto_lock(lock_);
  head_idx_ = size_ = 0;
}

size_t ActivityLog::size() {
  base::AutoLock auto_lock(lock_);
  return size_;
}

ActivityLog::Entry* ActivityLog::PushBack() {
  lock_.AssertAcquired();
  if (size_ == kBufferSize) {
    Entry* ret = &buffer_[head_idx_];
    head_idx_ = (head_idx_ + 1) % kBufferSize;
    return ret;
  }
  ++size_;
  return &buffer_[TailIdx()];
}

unique_ptr<Value> ActivityLog::EncodeTouchFrame(const FrameEntry& frame) const {
  unique_ptr<DictionaryValue> ret(new DictionaryValue);
  ret->SetString(kKeyType, kKeyTouchFrame);
  ret->SetDouble(kKeyTouchFrameTimestamp, frame.timestamp);
  ret->SetInteger(kKeyTouchFrameReportedCnt, frame.reported_cnt);
  ret->SetInteger(kKeyTouchFrameModifiers,
                  static_cast<int>(frame.modifiers));
  unique_ptr<ListValue> contacts(new ListValue);
  for (size_t i = 0; i < frame.contact_cnt; ++i) {
    const Contact& contact = frame.contacts[i];
    unique_ptr<DictionaryValue> dict(new DictionaryValue);
    dict->SetDouble(kKeyContactPositionX, contact.position_x);
    dict->SetDouble(kKeyContactPositionY, contact.position_y);
    dict->SetDouble(kKeyContactVelocityX, contact.velocity_x);
    dict->SetDouble(kKeyContactVelocityY, contact.velocity_y);
    dict->SetDouble(kKeyContactZTotal, contact.z_total);
    dict->SetDouble(kKeyContactMajorAxis, contact.major_axis);
    dict->SetDouble(kKeyContactMinorAxis, contact.minor_axis);
    dict->SetInteger(kKeyContactPhase, static_cast<int>(contact.phase));
    dict->SetInteger(kKeyContactIdentifier, contact.identifier);
    contacts->Append(std::move(dict));
  }
  ret->Set(kKeyTouchFrameContacts, std::move(contacts));
  return std::move(ret);
}

unique_ptr<Value> ActivityLog::EncodeGestureEvent(
    const GestureEvent& event) const {
  unique_ptr<DictionaryValue> ret(new DictionaryValue);
  ret->SetString(kKeyType, kKeyGestureEvent);
  ret->SetDouble(kKeyGestureEventTimestamp, event.timestamp);

  switch (event.type) {
    case kGestureEventStart:
      ret->SetString(kKeyGestureEventType, kValueGestureEventStart);
      ret->SetDouble(kKeyGestureEventStartX, event.details.start.position.x);
      ret->SetDouble(kKeyGestureEventStartY, event.details.start.position.y);
      return std::move(ret);
    case kGestureEventTap:
      ret->SetString(kKeyGestureEventType, kValueGestureEventTap);
      return std::move(ret);
    case kGestureEventBeginDragging:
      ret->SetString(kKeyGestureEventType, kValueGestureEventBeginDragging);
      return std::move(ret);
    case kGestureEventUpdateDragging:
      ret->SetString(kKeyGestureEventType, kValueGestureEventUpdateDragging);
      ret->SetDouble(kKeyGestureEventCentroidX,
                     event.details.drag.centroid.x);
      ret->SetDouble(kKeyGestureEventCentroidY,
                     event.details.drag.centroid.y);
      ret->SetDouble(kKeyGestureEventLastX,
                     event.details.drag.last_position.x);
      ret->SetDouble(kKeyGestureEventLastY,
                     event.details.drag.last_position.y);
      ret->SetInteger(kKeyGestureEventFingerCnt,
                      event.details.drag.finger_cnt);
      return std::move(ret);
    case kGestureEventEndDragging:
      ret->SetString(kKeyGestureEventType, kValueGestureEventEndDragging);
      return std::move(ret);
    case kGestureEventCancel:
      ret->SetString(kKeyGestureEventType, kValueGestureEventCancel);
      return std::move(ret);
    case kGestureEventCancelDragging:
      ret->SetString(kKeyGestureEventType, kValueGestureEventCancelDragging);
      return std::move(ret);
  }
  ret->SetString(kKeyGestureEventType,
                 base::StringPrintf("Unhandled %d", event.type));
  return std::move(ret);
}

unique_ptr<Value> ActivityLog::EncodeConfiguration(
    const GestureConfiguration& config) const {
  unique_ptr<DictionaryValue> ret(new DictionaryValue);
  ret->SetString(kKeyType, kKeyConfiguration);
  ret->SetString(kKeyConfigurationValue, config.String());
  return std::move(ret);
}

unique_ptr<Value> ActivityLog::EncodePropChange(
    const PropChangeEntry& prop_change) const {
  unique_ptr<DictionaryValue> ret(new DictionaryValue);
  ret->SetString(kKeyType, kKeyPropChange);
  ret->SetString(kKeyPropChangeName, prop_change.name);
  switch (prop_change.type) {
    case PropChangeEntry::kBoolProp:
      ret->SetBoolean(kKeyPropChangeValue, prop_change.value.bool_val != 0);
      ret->SetString(kKeyPropChangeType, kValuePropChangeTypeBool);
      break;
    case PropChangeEntry::kDoubleProp:
      ret->SetDouble(kKeyPropChangeValue, prop_change.value.double_val);
      ret->SetString(kKeyPropChangeType, kValuePropChangeTypeDouble);
      break;
    case PropChangeEntry::kIntProp:
      ret->SetInteger(kKeyPropChangeValue, prop_change.value.int_val);
      ret->SetString(kKeyPropChangeType, kValuePropChangeTypeInt);
      break;
  }
  return std::move(ret);
}

unique_ptr<Value> ActivityLog::EncodePropRegistry() const {
  unique_ptr<DictionaryValue> ret(new DictionaryValue);
  if (!prop_reg_)
    return std::move(ret);

  const set<Property*>& props = prop_reg_->props();
  for (set<Property*>::const_iterator it = props.begin(), e = props.end();
       it != e; ++it) {
    ret->Set((*it)->name(), (*it)->NewValue());
  }
  return std::move(ret);
}

string ActivityLog::Encode() {
  unique_ptr<DictionaryValue> root(new DictionaryValue);
  unique_ptr<ListValue> entries(new ListValue);
  {
    base::AutoLock auto_lock(lock_);
    for (size_t i = 0; i < size_; ++i) {
      const Entry& entry = *GetEntry(i);
      switch (entry.type) {
        case kTouchFrame:
          entries->Append(EncodeTouchFrame(entry.details.frame));
          continue;
        case kGestureEvent:
          entries->Append(EncodeGestureEvent(entry.details.gesture));
          continue;
        case kConfiguration:
          entries->Append(EncodeConfiguration(entry.details.config));
          continue;
        case kPropChange:
          entries->Append(EncodePropChange(entry.details.prop_change));
          continue;
      }
      Err("Unknown entry type %d", entry.type);
    }
  }
  root->Set(kKeyRoot, std::move(entries));
  root->SetInteger(kKeyVersion, 1);
  root->Set(kKeyProperties, EncodePropRegistry());

  string out;
  if (!base::JSONWriter::WriteWithOptions(
          *root, base::JSONWriter::OPTIONS_PRETTY_PRINT, &out)) {
    Err("Failed to encode activity log");
    return "";
  }
  return out;
}

const char ActivityLog::kKeyRoot[] = "entries";
const char ActivityLog::kKeyType[] = "type";
const char ActivityLog::kKeyTouchFrame[] = "touchFrame";
const char ActivityLog::kKeyGestureEvent[] = "gestureEvent";
const char ActivityLog::kKeyConfiguration[] = "configuration";
const char ActivityLog::kKeyPropChange[] = "propertyChange";
// TouchFrame keys:
const char ActivityLog::kKeyTouchFrameTimestamp[] = "timestamp";
const char ActivityLog::kKeyTouchFrameReportedCnt[] = "reportedCount";
const char ActivityLog::kKeyTouchFrameModifiers[] = "modifiers";
const char ActivityLog::kKeyTouchFrameContacts[] = "contacts";
// Contact keys:
const char ActivityLog::kKeyContactPositionX[] = "positionX";
const char ActivityLog::kKeyContactPositionY[] = "positionY";
const char ActivityLog::kKeyContactVelocityX[] = "velocityX";
const char ActivityLog::kKeyContactVelocityY[] = "velocityY";
const char ActivityLog::kKeyContactZTotal[] = "zTotal";
const char ActivityLog::kKeyContactMajorAxis[] = "majorAxis";
const char ActivityLog::kKeyContactMinorAxis[] = "minorAxis";
const char ActivityLog::kKeyContactPhase[] = "phase";
const char ActivityLog::kKeyContactIdentifier[] = "identifier";
// GestureEvent keys:
const char ActivityLog::kKeyGestureEventType[] = "gestureType";
const char ActivityLog::kKeyGestureEventTimestamp[] = "timestamp";
const char ActivityLog::kKeyGestureEventStartX[] = "startX";
const char ActivityLog::kKeyGestureEventStartY[] = "startY";
const char ActivityLog::kKeyGestureEventCentroidX[] = "centroidX";
const char ActivityLog::kKeyGestureEventCentroidY[] = "centroidY";
const char ActivityLog::kKeyGestureEventLastX[] = "lastX";
const char ActivityLog::kKeyGestureEventLastY[] = "lastY";
const char ActivityLog::kKeyGestureEventFingerCnt[] = "fingerCount";
const char ActivityLog::kValueGestureEventStart[] = "start";
const char ActivityLog::kValueGestureEventTap[] = "tap";
const char ActivityLog::kValueGestureEventBeginDragging[] = "beginDragging";
const char ActivityLog::kValueGestureEventUpdateDragging[] = "updateDragging";
const char ActivityLog::kValueGestureEventEndDragging[] = "endDragging";
const char ActivityLog::kValueGestureEventCancel[] = "cancel";
const char ActivityLog::kValueGestureEventCancelDragging[] = "cancelDragging";
// Configuration keys:
const char ActivityLog::kKeyConfigurationValue[] = "value";
// PropChange keys:
const char ActivityLog::kKeyPropChangeType[] = "propChangeType";
const char ActivityLog::kKeyPropChangeName[] = "name";
const char ActivityLog::kKeyPropChangeValue[] = "value";
const char ActivityLog::kValuePropChangeTypeBool[] = "bool";
const char ActivityLog::kValuePropChangeTypeDouble[] = "double";
const char ActivityLog::kValuePropChangeTypeInt[] = "int";

const char ActivityLog::kKeyVersion[] = "version";
const char ActivityLog::kKeyProperties[] = "properties";

}  // namespace middrag
