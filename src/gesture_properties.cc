// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "middrag/include/gesture_properties.h"

#include "middrag/include/logging.h"

namespace middrag {

namespace {

// Defaults come from a default-constructed configuration.
const GestureConfiguration kDefaults;

bool ValidModifierKey(int val) {
  return val >= kModifierKeyShift && val <= kModifierKeyCommand;
}

}  // namespace {}

GestureProperties::GestureProperties(PropRegistry* prop_reg,
                                     Observer* observer)
    : observer_(observer),
      sensitivity_(prop_reg, "Drag Sensitivity", kDefaults.sensitivity, this),
      smoothing_factor_(prop_reg, "Smoothing Factor",
                        kDefaults.smoothing_factor, this),
      tap_threshold_(prop_reg, "Tap Threshold", kDefaults.tap_threshold, this),
      max_tap_hold_duration_(prop_reg, "Max Tap Hold Duration",
                             kDefaults.max_tap_hold_duration, this),
      move_threshold_(prop_reg, "Move Threshold", kDefaults.move_threshold,
                      this),
      exclusion_zone_enabled_(prop_reg, "Exclusion Zone Enable",
                              kDefaults.exclusion_zone_enabled, this),
      exclusion_zone_size_(prop_reg, "Exclusion Zone Size",
                           kDefaults.exclusion_zone_size, this),
      require_modifier_key_(prop_reg, "Require Modifier Key",
                            kDefaults.require_modifier_key, this),
      modifier_key_type_(prop_reg, "Modifier Key Type",
                         kDefaults.modifier_key_type, this),
      contact_size_filter_enabled_(prop_reg, "Contact Size Filter Enable",
                                   kDefaults.contact_size_filter_enabled,
                                   this),
      max_contact_size_(prop_reg, "Max Contact Size",
                        kDefaults.max_contact_size, this),
      allow_relift_during_drag_(prop_reg, "Allow Relift During Drag",
                                kDefaults.allow_relift_during_drag, this),
      velocity_boost_enabled_(prop_reg, "Velocity Boost Enable",
                              kDefaults.velocity_boost_enabled, this),
      max_velocity_boost_(prop_reg, "Max Velocity Boost",
                          kDefaults.max_velocity_boost, this),
      tap_to_click_enabled_(prop_reg, "Tap To Click Enable",
                            kDefaults.tap_to_click_enabled, this),
      middle_drag_enabled_(prop_reg, "Middle Drag Enable",
                           kDefaults.middle_drag_enabled, this),
      ignore_desktop_(prop_reg, "Ignore Desktop", kDefaults.ignore_desktop,
                      this),
      pass_through_title_bar_(prop_reg, "Pass Through Title Bar",
                              kDefaults.pass_through_title_bar, this),
      title_bar_height_(prop_reg, "Title Bar Height",
                        kDefaults.title_bar_height, this),
      minimum_window_size_filter_enabled_(
          prop_reg, "Minimum Window Size Filter Enable",
          kDefaults.minimum_window_size_filter_enabled, this),
      minimum_window_width_(prop_reg, "Minimum Window Width",
                            kDefaults.minimum_window_width, this),
      minimum_window_height_(prop_reg, "Minimum Window Height",
                             kDefaults.minimum_window_height, this),
      minimum_movement_threshold_(prop_reg, "Minimum Movement Threshold",
                                  kDefaults.minimum_movement_threshold,
                                  this) {}

GestureConfiguration GestureProperties::ToConfiguration() const {
  GestureConfiguration config;
  config.sensitivity = sensitivity_.val_;
  config.smoothing_factor = smoothing_factor_.val_;
  config.tap_threshold = tap_threshold_.val_;
  config.max_tap_hold_duration = max_tap_hold_duration_.val_;
  config.move_threshold = move_threshold_.val_;
  config.exclusion_zone_enabled = exclusion_zone_enabled_.val_ != 0;
  config.exclusion_zone_size = exclusion_zone_size_.val_;
  config.require_modifier_key = require_modifier_key_.val_ != 0;
  if (ValidModifierKey(modifier_key_type_.val_))
    config.modifier_key_type =
        static_cast<ModifierKeyType>(modifier_key_type_.val_);
  config.contact_size_filter_enabled = contact_size_filter_enabled_.val_ != 0;
  config.max_contact_size = max_contact_size_.val_;
  config.allow_relift_during_drag = allow_relift_during_drag_.val_ != 0;
  config.velocity_boost_enabled = velocity_boost_enabled_.val_ != 0;
  config.max_velocity_boost = max_velocity_boost_.val_;
  config.tap_to_click_enabled = tap_to_click_enabled_.val_ != 0;
  config.middle_drag_enabled = middle_drag_enabled_.val_ != 0;
  config.ignore_desktop = ignore_desktop_.val_ != 0;
  config.pass_through_title_bar = pass_through_title_bar_.val_ != 0;
  config.title_bar_height = title_bar_height_.val_;
  config.minimum_window_size_filter_enabled =
      minimum_window_size_filter_enabled_.val_ != 0;
  config.minimum_window_width = minimum_window_width_.val_;
  config.minimum_window_height = minimum_window_height_.val_;
  config.minimum_movement_threshold = minimum_movement_threshold_.val_;
  return config;
}

void GestureProperties::FromConfiguration(const GestureConfiguration& config) {
  sensitivity_.val_ = config.sensitivity;
  smoothing_factor_.val_ = config.smoothing_factor;
  tap_threshold_.val_ = config.tap_threshold;
  max_tap_hold_duration_.val_ = config.max_tap_hold_duration;
  move_threshold_.val_ = config.move_threshold;
  exclusion_zone_enabled_.val_ = config.exclusion_zone_enabled;
  exclusion_zone_size_.val_ = config.exclusion_zone_size;
  require_modifier_key_.val_ = config.require_modifier_key;
  modifier_key_type_.val_ = config.modifier_key_type;
  contact_size_filter_enabled_.val_ = config.contact_size_filter_enabled;
  max_contact_size_.val_ = config.max_contact_size;
  allow_relift_during_drag_.val_ = config.allow_relift_during_drag;
  velocity_boost_enabled_.val_ = config.velocity_boost_enabled;
  max_velocity_boost_.val_ = config.max_velocity_boost;
  tap_to_click_enabled_.val_ = config.tap_to_click_enabled;
  middle_drag_enabled_.val_ = config.middle_drag_enabled;
  ignore_desktop_.val_ = config.ignore_desktop;
  pass_through_title_bar_.val_ = config.pass_through_title_bar;
  title_bar_height_.val_ = config.title_bar_height;
  minimum_window_size_filter_enabled_.val_ =
      config.minimum_window_size_filter_enabled;
  minimum_window_width_.val_ = config.minimum_window_width;
  minimum_window_height_.val_ = config.minimum_window_height;
  minimum_movement_threshold_.val_ = config.minimum_movement_threshold;
}

void GestureProperties::BoolWasWritten(BoolProperty* prop) {
  NotifyObserver();
}

void GestureProperties::DoubleWasWritten(DoubleProperty* prop) {
  NotifyObserver();
}

void GestureProperties::IntWasWritten(IntProperty* prop) {
  if (prop == &modifier_key_type_ && !ValidModifierKey(prop->val_)) {
    Err("Invalid modifier key type %d, using shift", prop->val_);
    prop->val_ = kModifierKeyShift;
  }
  NotifyObserver();
}

void GestureProperties::NotifyObserver() {
  if (observer_)
    observer_->ConfigurationWritten(ToConfiguration());
}

}  // namespace middrag
