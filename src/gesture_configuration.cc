// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/gesture_configuration.h"

#include <base/strings/stringprintf.h>

#include "middrag/include/logging.h"

using std::string;

namespace middrag {

unsigned ModifierMaskForKey(ModifierKeyType key) {
  switch (key) {
    case kModifierKeyShift: return MIDDRAG_MODIFIER_SHIFT;
    case kModifierKeyControl: return MIDDRAG_MODIFIER_CONTROL;
    case kModifierKeyOption: return MIDDRAG_MODIFIER_OPTION;
    case kModifierKeyCommand: return MIDDRAG_MODIFIER_COMMAND;
  }
  Err("Unknown modifier key type %d", static_cast<int>(key));
  return MIDDRAG_MODIFIER_NONE;
}

bool ModifierRequirementMet(bool require_modifier_key,
                            ModifierKeyType key,
                            unsigned modifiers_held) {
  if (!require_modifier_key)
    return true;
  unsigned mask = ModifierMaskForKey(key);
  return mask != MIDDRAG_MODIFIER_NONE && (modifiers_held & mask) != 0;
}

GestureConfiguration::GestureConfiguration()
    : sensitivity(1.0),
      smoothing_factor(0.3),
      tap_threshold(0.15),
      max_tap_hold_duration(10.0),
      move_threshold(0.015),
      exclusion_zone_enabled(false),
      exclusion_zone_size(0.15),
      require_modifier_key(false),
      modifier_key_type(kModifierKeyShift),
      contact_size_filter_enabled(false),
      max_contact_size(1.5),
      allow_relift_during_drag(false),
      velocity_boost_enabled(true),
      max_velocity_boost(2.0),
      tap_to_click_enabled(true),
      middle_drag_enabled(true),
      ignore_desktop(false),
      pass_through_title_bar(false),
      title_bar_height(28.0),
      minimum_window_size_filter_enabled(false),
      minimum_window_width(100.0),
      minimum_window_height(100.0),
      minimum_movement_threshold(0.5) {}

string GestureConfiguration::String() const {
  return base::StringPrintf(
      "(sens %f, tap %f, hold %f, move %f, exclusion %d/%f, modifier %d/%d, "
      "size %d/%f, relift %d, boost %d/%f, tap-click %d, drag %d)",
      sensitivity, tap_threshold, max_tap_hold_duration, move_threshold,
      exclusion_zone_enabled, exclusion_zone_size, require_modifier_key,
      static_cast<int>(modifier_key_type), contact_size_filter_enabled,
      max_contact_size, allow_relift_during_drag, velocity_boost_enabled,
      max_velocity_boost, tap_to_click_enabled, middle_drag_enabled);
}

}  // namespace middrag
