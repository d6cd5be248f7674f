// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_GESTURE_CONFIGURATION_H_
#define MIDDRAG_GESTURE_CONFIGURATION_H_

#include <string>

#include "middrag/include/middrag.h"

namespace middrag {

enum ModifierKeyType {
  kModifierKeyShift = 0,
  kModifierKeyControl,
  kModifierKeyOption,
  kModifierKeyCommand,
};

// Maps a configured key to its MIDDRAG_MODIFIER_* bit.
unsigned ModifierMaskForKey(ModifierKeyType key);

// True when no modifier is required, or when the configured key is held.
bool ModifierRequirementMet(bool require_modifier_key,
                            ModifierKeyType key,
                            unsigned modifiers_held);

// Tuning for recognition, arbitration and synthesis. Replaced wholesale on
// change, never patched field by field while in use.
struct GestureConfiguration {
  GestureConfiguration();

  std::string String() const;
  bool ModifierSatisfied(unsigned modifiers_held) const {
    return ModifierRequirementMet(require_modifier_key, modifier_key_type,
                                  modifiers_held);
  }

  double sensitivity;
  double smoothing_factor;
  stime_t tap_threshold;  // seconds
  stime_t max_tap_hold_duration;  // seconds
  double move_threshold;  // normalized units

  bool exclusion_zone_enabled;
  double exclusion_zone_size;  // bottom band, normalized units

  bool require_modifier_key;
  ModifierKeyType modifier_key_type;

  bool contact_size_filter_enabled;
  double max_contact_size;

  bool allow_relift_during_drag;

  bool velocity_boost_enabled;
  double max_velocity_boost;

  bool tap_to_click_enabled;
  bool middle_drag_enabled;
  bool ignore_desktop;
  bool pass_through_title_bar;
  double title_bar_height;  // pixels
  bool minimum_window_size_filter_enabled;
  double minimum_window_width;  // pixels
  double minimum_window_height;  // pixels
  double minimum_movement_threshold;  // pixels
};

}  // namespace middrag

#endif  // MIDDRAG_GESTURE_CONFIGURATION_H_
