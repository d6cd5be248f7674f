// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_ARBITER_SNAPSHOT_H_
#define MIDDRAG_ARBITER_SNAPSHOT_H_

#include <atomic>
#include <string>

#include <base/macros.h>

#include "middrag/include/gesture_configuration.h"
#include "middrag/include/middrag.h"

namespace middrag {

// The state the event arbiter reads for every intercepted pointer event.
// Each field is an independent atomic scalar: the capture context writes the
// finger count, the processing context publishes gesture flags, and the
// arbitration context records force clicks. Nothing here blocks, and readers
// may see one field updated before another.

class ArbiterSnapshot {
 public:
  ArbiterSnapshot();

  int finger_count() const {
    return finger_count_.load(std::memory_order_acquire);
  }
  void set_finger_count(int count) {
    finger_count_.store(count, std::memory_order_release);
  }

  bool in_gesture() const {
    return in_gesture_.load(std::memory_order_acquire);
  }
  void set_in_gesture(bool val) {
    in_gesture_.store(val, std::memory_order_release);
  }

  bool actively_dragging() const {
    return actively_dragging_.load(std::memory_order_acquire);
  }
  void set_actively_dragging(bool val) {
    actively_dragging_.store(val, std::memory_order_release);
  }

  stime_t last_gesture_end_time() const {
    return last_gesture_end_time_.load(std::memory_order_acquire);
  }
  bool last_gesture_was_active() const {
    return last_gesture_was_active_.load(std::memory_order_acquire);
  }

  stime_t last_force_click_time() const {
    return last_force_click_time_.load(std::memory_order_acquire);
  }
  void set_last_force_click_time(stime_t when) {
    last_force_click_time_.store(when, std::memory_order_release);
  }

  bool pass_through() const {
    return pass_through_.load(std::memory_order_acquire);
  }
  void set_pass_through(bool val) {
    pass_through_.store(val, std::memory_order_release);
  }

  // Modifier requirement, mirrored from the configuration so the arbiter
  // never touches the processing context's copy.
  bool ModifierSatisfied(unsigned modifiers_held) const;
  void SetModifierRequirement(bool require_modifier_key, ModifierKeyType key);

  // Publishes the end of a session. |was_active| is true when it ended in a
  // tap or a completed drag rather than a cancel.
  void PublishGestureEnd(stime_t when, bool was_active);

  // Forgets all gesture state. The modifier requirement is kept.
  void Clear();

  std::string String() const;

 private:
  std::atomic<int> finger_count_;
  std::atomic<bool> in_gesture_;
  std::atomic<bool> actively_dragging_;
  std::atomic<stime_t> last_gesture_end_time_;
  std::atomic<bool> last_gesture_was_active_;
  std::atomic<stime_t> last_force_click_time_;
  std::atomic<bool> pass_through_;
  std::atomic<bool> require_modifier_key_;
  std::atomic<int> modifier_key_type_;

  DISALLOW_COPY_AND_ASSIGN(ArbiterSnapshot);
};

}  // namespace middrag

#endif  // MIDDRAG_ARBITER_SNAPSHOT_H_
