// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/macros.h>
#include <gtest/gtest.h>

#include "middrag/include/contact_filter.h"

namespace middrag {

class ContactFilterTest : public ::testing::Test {};

TEST(ContactFilterTest, PhaseTest) {
  ContactFilter filter;
  GestureConfiguration config;
  Contact contacts[] = {
    // x, y, vx, vy, z, major, minor, phase, id
    { 0.2, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_NOT_TRACKING, 1 },
    { 0.3, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_STARTING, 2 },
    { 0.4, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_HOVERING, 3 },
    { 0.5, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 4 },
    { 0.6, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_ACTIVE, 5 },
    { 0.7, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_LIFTING, 6 },
    { 0.8, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_LINGERING, 7 },
    { 0.9, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_OUT_OF_RANGE, 8 },
  };
  FilteredContacts out;
  filter.Filter(contacts, arraysize(contacts), config, &out);
  ASSERT_EQ(2, out.count());
  EXPECT_EQ(4, out.contacts[0].identifier);
  EXPECT_EQ(5, out.contacts[1].identifier);
  EXPECT_NEAR(0.55, out.centroid.x, 1e-5);
  EXPECT_NEAR(0.5, out.centroid.y, 1e-5);
}

TEST(ContactFilterTest, AggregatesTest) {
  ContactFilter filter;
  GestureConfiguration config;
  Contact contacts[] = {
    { 0.3, 0.4, 0.1, -0.2, 0.3, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 },
    { 0.5, 0.5, 0.2, -0.4, 0.6, 8, 8, MIDDRAG_PHASE_TOUCHING, 2 },
    { 0.7, 0.6, 0.3, -0.6, 0.9, 8, 8, MIDDRAG_PHASE_ACTIVE, 3 },
  };
  FilteredContacts out;
  filter.Filter(contacts, arraysize(contacts), config, &out);
  ASSERT_EQ(3, out.count());
  EXPECT_NEAR(0.5, out.centroid.x, 1e-5);
  EXPECT_NEAR(0.5, out.centroid.y, 1e-5);
  EXPECT_NEAR(0.2, out.velocity.x, 1e-5);
  EXPECT_NEAR(-0.4, out.velocity.y, 1e-5);
  EXPECT_NEAR(0.6, out.pressure, 1e-5);
}

TEST(ContactFilterTest, ExclusionZoneTest) {
  ContactFilter filter;
  GestureConfiguration config;
  Contact contacts[] = {
    { 0.3, 0.10, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 },
    { 0.4, 0.14, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 2 },
    { 0.5, 0.15, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 3 },
    { 0.6, 0.50, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 4 },
  };
  FilteredContacts out;

  // Disabled by default.
  filter.Filter(contacts, arraysize(contacts), config, &out);
  EXPECT_EQ(4, out.count());

  config.exclusion_zone_enabled = true;
  config.exclusion_zone_size = 0.15;
  filter.Filter(contacts, arraysize(contacts), config, &out);
  ASSERT_EQ(2, out.count());
  EXPECT_EQ(3, out.contacts[0].identifier);
  EXPECT_EQ(4, out.contacts[1].identifier);
}

TEST(ContactFilterTest, ContactSizeTest) {
  ContactFilter filter;
  GestureConfiguration config;
  Contact contacts[] = {
    { 0.3, 0.5, 0, 0, 0.8, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 },
    { 0.4, 0.5, 0, 0, 1.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 2 },
    { 0.5, 0.5, 0, 0, 2.4, 20, 16, MIDDRAG_PHASE_TOUCHING, 3 },  // palm
  };
  FilteredContacts out;

  filter.Filter(contacts, arraysize(contacts), config, &out);
  EXPECT_EQ(3, out.count());

  config.contact_size_filter_enabled = true;
  config.max_contact_size = 1.5;
  filter.Filter(contacts, arraysize(contacts), config, &out);
  ASSERT_EQ(2, out.count());
  EXPECT_EQ(1, out.contacts[0].identifier);
  EXPECT_EQ(2, out.contacts[1].identifier);
}

// Five and six raw contacts filter down to the three real fingers.
TEST(ContactFilterTest, PartialFilterTest) {
  ContactFilter filter;
  GestureConfiguration config;
  config.exclusion_zone_enabled = true;
  config.contact_size_filter_enabled = true;
  Contact contacts[] = {
    { 0.4, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 },
    { 0.5, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 2 },
    { 0.6, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 3 },
    { 0.5, 0.05, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 4 },  // thumb
    { 0.9, 0.3, 0, 0, 3.0, 20, 16, MIDDRAG_PHASE_TOUCHING, 5 },  // palm
    { 0.1, 0.5, 0, 0, 0.5, 8, 8, MIDDRAG_PHASE_HOVERING, 6 },
  };
  FilteredContacts out;

  filter.Filter(contacts, 5, config, &out);
  EXPECT_EQ(3, out.count());
  EXPECT_NEAR(0.5, out.centroid.x, 1e-5);

  filter.Filter(contacts, 6, config, &out);
  EXPECT_EQ(3, out.count());
  EXPECT_NEAR(0.5, out.centroid.x, 1e-5);
  EXPECT_NEAR(0.5, out.centroid.y, 1e-5);
}

TEST(ContactFilterTest, EmptyFrameTest) {
  ContactFilter filter;
  GestureConfiguration config;
  Contact contacts[] = {
    { 0.4, 0.5, 0.3, 0.3, 0.5, 8, 8, MIDDRAG_PHASE_TOUCHING, 1 },
  };
  FilteredContacts out;

  filter.Filter(contacts, arraysize(contacts), config, &out);
  EXPECT_EQ(1, out.count());

  // Negative counts and missing arrays are empty frames, and clear the
  // previous result.
  filter.Filter(contacts, -2, config, &out);
  EXPECT_EQ(0, out.count());
  EXPECT_NEAR(0.0, out.centroid.x, 1e-5);
  EXPECT_NEAR(0.0, out.velocity.x, 1e-5);
  EXPECT_NEAR(0.0, out.pressure, 1e-5);

  filter.Filter(NULL, 3, config, &out);
  EXPECT_EQ(0, out.count());

  filter.Filter(NULL, 0, config, &out);
  EXPECT_EQ(0, out.count());
}

}  // namespace middrag
