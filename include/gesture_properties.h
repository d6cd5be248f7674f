// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef MIDDRAG_GESTURE_PROPERTIES_H_
#define MIDDRAG_GESTURE_PROPERTIES_H_

#include <base/macros.h>
#include <gtest/gtest.h>  // for FRIEND_TEST

#include "middrag/include/gesture_configuration.h"
#include "middrag/include/prop_registry.h"

namespace middrag {

// Exposes every GestureConfiguration field as a named property, so a host
// can bind its settings store through a MiddragPropProvider. Any write
// rebuilds the whole configuration and hands it to the observer.

class GestureProperties : public PropertyDelegate {
  FRIEND_TEST(GesturePropertiesTest, InvalidModifierKeyTest);
  FRIEND_TEST(GesturePropertiesTest, WriteRebuildsConfigurationTest);
 public:
  class Observer {
   public:
    virtual ~Observer() {}
    virtual void ConfigurationWritten(const GestureConfiguration& config) = 0;
  };

  // |observer| may be NULL.
  GestureProperties(PropRegistry* prop_reg, Observer* observer);
  virtual ~GestureProperties() {}

  // Builds a configuration from the current property values.
  GestureConfiguration ToConfiguration() const;

  // Overwrites the property values without notifying the observer.
  void FromConfiguration(const GestureConfiguration& config);

  // PropertyDelegate:
  virtual void BoolWasWritten(BoolProperty* prop);
  virtual void DoubleWasWritten(DoubleProperty* prop);
  virtual void IntWasWritten(IntProperty* prop);

 private:
  void NotifyObserver();

  Observer* observer_;

  DoubleProperty sensitivity_;
  DoubleProperty smoothing_factor_;
  DoubleProperty tap_threshold_;
  DoubleProperty max_tap_hold_duration_;
  DoubleProperty move_threshold_;
  BoolProperty exclusion_zone_enabled_;
  DoubleProperty exclusion_zone_size_;
  BoolProperty require_modifier_key_;
  // One of ModifierKeyType.
  IntProperty modifier_key_type_;
  BoolProperty contact_size_filter_enabled_;
  DoubleProperty max_contact_size_;
  BoolProperty allow_relift_during_drag_;
  BoolProperty velocity_boost_enabled_;
  DoubleProperty max_velocity_boost_;
  BoolProperty tap_to_click_enabled_;
  BoolProperty middle_drag_enabled_;
  BoolProperty ignore_desktop_;
  BoolProperty pass_through_title_bar_;
  DoubleProperty title_bar_height_;
  BoolProperty minimum_window_size_filter_enabled_;
  DoubleProperty minimum_window_width_;
  DoubleProperty minimum_window_height_;
  DoubleProperty minimum_movement_threshold_;

  DISALLOW_COPY_AND_ASSIGN(GestureProperties);
};

}  // namespace middrag

#endif  // MIDDRAG_GESTURE_PROPERTIES_H_
