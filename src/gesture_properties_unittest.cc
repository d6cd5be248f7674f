// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <gtest/gtest.h>

#include "middrag/include/gesture_properties.h"
#include "middrag/include/prop_registry.h"

namespace middrag {

class GesturePropertiesTest : public ::testing::Test {};

class RecordingObserver : public GestureProperties::Observer {
 public:
  RecordingObserver() : call_cnt_(0) {}
  virtual void ConfigurationWritten(const GestureConfiguration& config) {
    call_cnt_++;
    last_ = config;
  }

  int call_cnt_;
  GestureConfiguration last_;
};

TEST(GesturePropertiesTest, DefaultsMatchConfigurationTest) {
  PropRegistry reg;
  GestureProperties props(&reg, NULL);
  EXPECT_EQ(23, reg.props().size());

  GestureConfiguration defaults;
  GestureConfiguration config = props.ToConfiguration();
  EXPECT_EQ(defaults.String(), config.String());
  EXPECT_DOUBLE_EQ(0.5, config.minimum_movement_threshold);
  EXPECT_DOUBLE_EQ(28.0, config.title_bar_height);
}

TEST(GesturePropertiesTest, WriteRebuildsConfigurationTest) {
  PropRegistry reg;
  RecordingObserver observer;
  GestureProperties props(&reg, &observer);

  props.sensitivity_.val_ = 2.5;
  props.sensitivity_.HandleMiddragPropWritten();
  EXPECT_EQ(1, observer.call_cnt_);
  EXPECT_DOUBLE_EQ(2.5, observer.last_.sensitivity);

  props.allow_relift_during_drag_.val_ = 1;
  props.allow_relift_during_drag_.HandleMiddragPropWritten();
  EXPECT_EQ(2, observer.call_cnt_);
  // The earlier write is still part of the rebuilt configuration.
  EXPECT_DOUBLE_EQ(2.5, observer.last_.sensitivity);
  EXPECT_TRUE(observer.last_.allow_relift_during_drag);

  props.modifier_key_type_.val_ = kModifierKeyCommand;
  props.modifier_key_type_.HandleMiddragPropWritten();
  EXPECT_EQ(3, observer.call_cnt_);
  EXPECT_EQ(kModifierKeyCommand, observer.last_.modifier_key_type);
}

TEST(GesturePropertiesTest, InvalidModifierKeyTest) {
  PropRegistry reg;
  RecordingObserver observer;
  GestureProperties props(&reg, &observer);

  props.modifier_key_type_.val_ = 17;
  props.modifier_key_type_.HandleMiddragPropWritten();
  EXPECT_EQ(kModifierKeyShift, props.modifier_key_type_.val_);
  EXPECT_EQ(1, observer.call_cnt_);
  EXPECT_EQ(kModifierKeyShift, observer.last_.modifier_key_type);
}

TEST(GesturePropertiesTest, FromConfigurationDoesNotNotifyTest) {
  PropRegistry reg;
  RecordingObserver observer;
  GestureProperties props(&reg, &observer);

  GestureConfiguration config;
  config.tap_threshold = 0.3;
  config.require_modifier_key = true;
  config.modifier_key_type = kModifierKeyOption;
  config.minimum_window_width = 640.0;
  props.FromConfiguration(config);
  EXPECT_EQ(0, observer.call_cnt_);
  EXPECT_EQ(config.String(), props.ToConfiguration().String());
  EXPECT_DOUBLE_EQ(640.0, props.ToConfiguration().minimum_window_width);
}

}  // namespace middrag
