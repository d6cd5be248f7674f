// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/event_arbiter.h"

#include "middrag/include/logging.h"

namespace middrag {

const stime_t EventArbiter::kPostGestureSuppressWindow = 0.15;

const char* ArbiterDecisionName(ArbiterDecision decision) {
  switch (decision) {
    case kArbiterPassThrough: return "PassThrough";
    case kArbiterSuppress: return "Suppress";
    case kArbiterConvertToClick: return "ConvertToClick";
    default: return "<unknown>";
  }
}

ArbiterDecision EventArbiter::Arbitrate(const PointerEvent& event,
                                        ArbiterSnapshot* snapshot,
                                        bool* reenable_interception) const {
  if (reenable_interception)
    *reenable_interception = false;

  if (event.type == kPointerEventInterceptionDisabledByTimeout ||
      event.type == kPointerEventInterceptionDisabledByUserInput) {
    if (reenable_interception)
      *reenable_interception = true;
    return kArbiterPassThrough;
  }

  bool is_middle = event.button == MIDDRAG_BUTTON_MIDDLE;
  bool is_left = event.button == MIDDRAG_BUTTON_LEFT;
  bool is_ours = event.user_data == MIDDRAG_EVENT_TAG;

  if (is_middle && is_ours)
    return kArbiterPassThrough;

  if (!snapshot) {
    Err("No arbiter snapshot, passing event through");
    return kArbiterPassThrough;
  }

  bool actively_dragging = snapshot->actively_dragging();
  bool gesture_active = snapshot->ModifierSatisfied(event.modifiers) &&
      (snapshot->in_gesture() || actively_dragging);

  if (snapshot->finger_count() >= 3 && is_left && !is_ours &&
      !actively_dragging && !snapshot->pass_through()) {
    if (event.type == kPointerEventButtonDown) {
      snapshot->set_last_force_click_time(event.timestamp);
      return kArbiterConvertToClick;
    }
    if (event.type == kPointerEventButtonUp)
      return kArbiterSuppress;
  }

  bool recently_ended =
      event.timestamp - snapshot->last_gesture_end_time() <
      kPostGestureSuppressWindow && snapshot->last_gesture_was_active();
  if ((gesture_active || recently_ended) && !is_middle)
    return kArbiterSuppress;

  return kArbiterPassThrough;
}

}  // namespace middrag
