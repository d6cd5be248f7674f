// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/arbiter_snapshot.h"

#include <base/strings/stringprintf.h>

using std::string;

namespace middrag {

ArbiterSnapshot::ArbiterSnapshot()
    : finger_count_(0),
      in_gesture_(false),
      actively_dragging_(false),
      last_gesture_end_time_(0.0),
      last_gesture_was_active_(false),
      last_force_click_time_(0.0),
      pass_through_(false),
      require_modifier_key_(false),
      modifier_key_type_(kModifierKeyShift) {}

bool ArbiterSnapshot::ModifierSatisfied(unsigned modifiers_held) const {
  return ModifierRequirementMet(
      require_modifier_key_.load(std::memory_order_acquire),
      static_cast<ModifierKeyType>(
          modifier_key_type_.load(std::memory_order_acquire)),
      modifiers_held);
}

void ArbiterSnapshot::SetModifierRequirement(bool require_modifier_key,
                                             ModifierKeyType key) {
  modifier_key_type_.store(key, std::memory_order_release);
  require_modifier_key_.store(require_modifier_key, std::memory_order_release);
}

void ArbiterSnapshot::PublishGestureEnd(stime_t when, bool was_active) {
  last_gesture_end_time_.store(when, std::memory_order_release);
  last_gesture_was_active_.store(was_active, std::memory_order_release);
  actively_dragging_.store(false, std::memory_order_release);
  in_gesture_.store(false, std::memory_order_release);
  pass_through_.store(false, std::memory_order_release);
}

void ArbiterSnapshot::Clear() {
  in_gesture_.store(false, std::memory_order_release);
  actively_dragging_.store(false, std::memory_order_release);
  last_gesture_end_time_.store(0.0, std::memory_order_release);
  last_gesture_was_active_.store(false, std::memory_order_release);
  last_force_click_time_.store(0.0, std::memory_order_release);
  pass_through_.store(false, std::memory_order_release);
}

string ArbiterSnapshot::String() const {
  return base::StringPrintf(
      "(fingers %d, in-gesture %d, dragging %d, end %f, end-active %d, "
      "force-click %f, pass-through %d)",
      finger_count(), in_gesture(), actively_dragging(),
      last_gesture_end_time(), last_gesture_was_active(),
      last_force_click_time(), pass_through());
}

}  // namespace middrag
